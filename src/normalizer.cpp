// ============================================================================
// normalizer.cpp - implementation for qlink/normalizer.hpp
// For the shape rules see the header. Tests: tests/test_normalizer.cpp.
// ============================================================================

#include "qlink/normalizer.hpp"

#include <type_traits>
#include <utility>

namespace qlink {

static inline bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && is_blank(s[b]))     ++b;
    while (e > b && is_blank(s[e - 1])) --e;
    return s.substr(b, e - b);
}

Lines split_fields(const std::string& line) {
    Lines out;
    std::string cur;
    for (char c : line) {
        if (is_blank(c)) {
            if (!cur.empty()) { out.push_back(cur); cur.clear(); }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

// ---------------------------------------------------------------------------
// split_commas()
// --------------
// "2, M1 ,M2" -> {"2","M1","M2"}. Empty pieces ("a,,b") are dropped so a
// trailing comma from the bridge does not invent an item.
// ---------------------------------------------------------------------------
static Lines split_commas(const std::string& text) {
    Lines out;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t comma = text.find(',', start);
        if (comma == std::string::npos) comma = text.size();
        std::string piece = trim(text.substr(start, comma - start));
        if (!piece.empty()) out.push_back(piece);
        start = comma + 1;
    }
    return out;
}

static Lines split_newlines(const std::string& text) {
    Lines out;
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t nl = text.find('\n', start);
        if (nl == std::string::npos) nl = text.size();
        std::string line = trim(text.substr(start, nl - start));   // drops the '\r' of CRLF
        if (!line.empty()) out.push_back(line);
        start = nl + 1;
    }
    return out;
}

// Rules 2 and 3 for a single string.
static Lines normalize_text(const std::string& text) {
    if (text.find('\n') != std::string::npos) return split_newlines(text);
    if (text.find(',')  != std::string::npos) return split_commas(text);
    return split_fields(text);
}

Lines normalize(const RawReply& reply) {
    return std::visit([](const auto& v) -> Lines {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return normalize_text(v);
        } else {
            // Rule 1: elements are already logical lines.
            Lines out;
            out.reserve(v.size());
            for (const auto& el : v) {
                std::string line = trim(el);
                if (!line.empty()) out.push_back(line);
            }
            return out;
        }
    }, reply);
}

Lines tokenize(const Lines& lines) {
    Lines out;
    for (const auto& line : lines) {
        Lines parts = (line.find(',') != std::string::npos) ? split_commas(line)
                                                            : split_fields(line);
        for (auto& p : parts) out.push_back(std::move(p));
    }
    return out;
}

std::string describe(const RawReply& reply) {
    if (const auto* s = std::get_if<std::string>(&reply)) return "\"" + *s + "\"";

    const auto& v = std::get<Lines>(reply);
    std::string out = "[";
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (i) out += ",";
        out += "\"" + v[i] + "\"";
    }
    out += "]";
    return out;
}

} // namespace qlink
