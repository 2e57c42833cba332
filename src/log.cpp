// ============================================================================
// log.cpp - implementation for qlink/log.hpp
// ============================================================================

#include "qlink/log.hpp"

#include <cctype>
#include <iostream>

namespace qlink::log {

static Level         g_level = Level::Info;
static std::ostream* g_sink  = nullptr;   // nullptr => std::cerr

void set_level(Level level) { g_level = level; }

Level current_level() { return g_level; }

bool level_from_string(const std::string& value, Level& out) {
    std::string v;
    for (char c : value) v.push_back((char)std::tolower((unsigned char)c));

    if (v == "none")                    { out = Level::None;  return true; }
    if (v == "error")                   { out = Level::Error; return true; }
    if (v == "warn" || v == "warning")  { out = Level::Warn;  return true; }
    if (v == "info")                    { out = Level::Info;  return true; }
    if (v == "debug")                   { out = Level::Debug; return true; }
    return false;
}

const char* level_to_string(Level level) {
    switch (level) {
        case Level::None:  return "none";
        case Level::Error: return "error";
        case Level::Warn:  return "warn";
        case Level::Info:  return "info";
        case Level::Debug: return "debug";
    }
    return "info";
}

void set_sink(std::ostream* os) { g_sink = os; }

void append(Level level, const char* tag, const std::string& message) {
    if (level == Level::None || level > g_level) return;

    std::ostream& os = g_sink ? *g_sink : std::cerr;
    os << "level=" << level_to_string(level)
       << " tag=" << (tag ? tag : "-")
       << " msg=\"" << preview(message, 1024) << "\"\n";
}

std::string preview(const std::string& text, std::size_t max) {
    std::string out;
    out.reserve(text.size() < max ? text.size() : max);
    for (char c : text) {
        if (out.size() >= max) break;
        if (c == '\r') continue;
        out.push_back(c == '\n' ? ' ' : c);
    }
    if (text.size() > max) out += "...";
    return out;
}

} // namespace qlink::log
