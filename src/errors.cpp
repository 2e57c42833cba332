// ============================================================================
// errors.cpp - implementation for qlink/errors.hpp
// ============================================================================

#include "qlink/errors.hpp"

#include <sstream>

namespace qlink {

bool Error::fatal() const {
    return kind == ErrorKind::Transport ||
           kind == ErrorKind::Protocol  ||
           kind == ErrorKind::Handshake;
}

void Error::clear() {
    kind = ErrorKind::None;
    reason.clear();
    detail.clear();
    expected = 0;
    actual = 0;
}

// ---------------------------------------------------------------------------
// to_line()
// ---------
// Render as "kind=<k> reason=<r> [expected=N actual=M] [detail="..."]".
// Quotes inside detail are escaped so the line stays one shell token per key.
// ---------------------------------------------------------------------------
std::string Error::to_line() const {
    std::ostringstream os;
    os << "kind=" << kind_name(kind);
    if (!reason.empty()) os << " reason=" << reason;
    if (kind == ErrorKind::CountMismatch)
        os << " expected=" << expected << " actual=" << actual;
    if (!detail.empty()) {
        os << " detail=\"";
        for (char c : detail) {
            if (c == '"' || c == '\\') os << '\\';
            if (c == '\n' || c == '\r') { os << ' '; continue; }
            os << c;
        }
        os << '"';
    }
    return os.str();
}

const char* kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:          return "none";
        case ErrorKind::Transport:     return "transport";
        case ErrorKind::Protocol:      return "protocol";
        case ErrorKind::Format:        return "format";
        case ErrorKind::CountMismatch: return "count_mismatch";
        case ErrorKind::Handshake:     return "handshake";
    }
    return "unknown";
}

Error make_error(ErrorKind kind, const std::string& reason, const std::string& detail) {
    Error e;
    e.kind   = kind;
    e.reason = reason;
    e.detail = detail;
    return e;
}

Error make_count_mismatch(std::size_t expected, std::size_t actual, const std::string& detail) {
    Error e = make_error(ErrorKind::CountMismatch, "count_mismatch", detail);
    e.expected = expected;
    e.actual   = actual;
    return e;
}

} // namespace qlink
