#pragma once
/**
 * @file log.hpp
 * @brief Leveled stderr logger emitting one `key=value` line per event.
 *
 * Lines look like the CLI's own status output so both can be grepped the same way:
 * @code
 *   level=info tag=session msg="connected to Vantage:3040"
 * @endcode
 *
 * The sink defaults to std::cerr; tests swap in an std::ostringstream.
 * Not thread-safe: the tool is single-threaded by construction.
 */

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace qlink::log {

enum class Level : uint8_t {
    None = 0,
    Error,
    Warn,
    Info,
    Debug,
};

void  set_level(Level level);
Level current_level();

/// Accepts none|error|warn|info|debug (case-insensitive). Returns false otherwise.
bool        level_from_string(const std::string& value, Level& out);
const char* level_to_string(Level level);

/// Redirect output. Passing nullptr restores std::cerr.
void set_sink(std::ostream* os);

void append(Level level, const char* tag, const std::string& message);

inline void error(const char* tag, const std::string& m) { append(Level::Error, tag, m); }
inline void warn (const char* tag, const std::string& m) { append(Level::Warn,  tag, m); }
inline void info (const char* tag, const std::string& m) { append(Level::Info,  tag, m); }
inline void debug(const char* tag, const std::string& m) { append(Level::Debug, tag, m); }

/// Flatten newlines and clip to @p max chars for one-line previews of replies.
std::string preview(const std::string& text, std::size_t max = 200);

} // namespace qlink::log
