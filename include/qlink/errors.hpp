#pragma once
/**
 * @file errors.hpp
 * @brief Typed error values shared by the bridge, parser, builder and session layers.
 *
 * @details
 * Every fallible call in qlink-inventory returns `bool` and fills an `Error&`
 * out-parameter instead of throwing. The error carries:
 *   - a **kind** from the taxonomy below, which decides whether the run stops,
 *   - a short, stable **reason** token (`count_mismatch`, `timeout`, ...) that
 *     scripts can grep for,
 *   - a free-form **detail** (offending line, bridge message, command text),
 *   - for count mismatches, the **expected** and **actual** item counts.
 *
 * TAXONOMY
 * --------
 * | Kind          | Fatal | Typical source                                    |
 * |---------------|-------|---------------------------------------------------|
 * | Transport     | yes   | socket/DNS failure, timeout, bridge 5xx           |
 * | Protocol      | yes   | bridge 4xx, send without session, bad JSON body   |
 * | Handshake     | yes   | acknowledgement tokens differ from the expected   |
 * | Format        | no    | bad count token, station line with != 7 fields    |
 * | CountMismatch | no    | declared count differs from items present         |
 *
 * Fatal errors unwind to the session controller, which still disconnects.
 * Non-fatal errors are stored as warnings next to the master/module they hit.
 *
 * Rendering follows the CLI's status-line convention:
 * @code
 *   kind=count_mismatch reason=count_mismatch expected=3 actual=2 detail="VQM"
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace qlink {

enum class ErrorKind : uint8_t {
    None = 0,
    Transport,
    Protocol,
    Format,
    CountMismatch,
    Handshake
};

struct Error {
    ErrorKind   kind{ErrorKind::None};
    std::string reason;        ///< stable token, never localized
    std::string detail;        ///< context for humans (line, message, command)
    std::size_t expected{0};   ///< CountMismatch only
    std::size_t actual{0};     ///< CountMismatch only

    bool ok() const { return kind == ErrorKind::None; }

    /// Transport, Protocol and Handshake stop the run.
    bool fatal() const;

    void clear();

    /// One `key=value` line without trailing newline.
    std::string to_line() const;
};

/// Lowercase name used on status lines ("transport", "count_mismatch", ...).
const char* kind_name(ErrorKind kind);

Error make_error(ErrorKind kind, const std::string& reason, const std::string& detail = {});

Error make_count_mismatch(std::size_t expected, std::size_t actual, const std::string& detail);

} // namespace qlink
