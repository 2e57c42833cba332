// ============================================================================
// counted_block.cpp - implementation for qlink/counted_block.hpp
// For the contract see the header. Tests: tests/test_counted_block.cpp.
// ============================================================================

#include "qlink/counted_block.hpp"
#include "qlink/normalizer.hpp"   // split_fields()

#include <limits>

namespace qlink {

// ---------------------------------------------------------------------------
// parse_count()
// -------------
// Digits only. std::stoul would accept "+3", " 3" and "3abc"; the bus never
// sends those, so seeing one means the reply is not what we think it is.
// ---------------------------------------------------------------------------
bool parse_count(const std::string& token, std::size_t& out) {
    if (token.empty()) return false;

    std::size_t v = 0;
    for (char c : token) {
        if (c < '0' || c > '9') return false;
        std::size_t d = static_cast<std::size_t>(c - '0');
        if (v > (std::numeric_limits<std::size_t>::max() - d) / 10) return false;  // overflow
        v = v * 10 + d;
    }
    out = v;
    return true;
}

bool parse_counted_block(const Lines& lines, CountedBlock& out,
                         std::vector<Error>& issues, const std::string& context) {
    out.declared = 0;
    out.items.clear();

    if (lines.empty()) {
        issues.push_back(make_error(ErrorKind::Format, "empty_reply", context));
        return false;
    }

    std::size_t n = 0;
    if (!parse_count(lines.front(), n)) {
        std::string d = context.empty() ? lines.front() : context + ": " + lines.front();
        issues.push_back(make_error(ErrorKind::Format, "bad_count", d));
        return false;
    }
    out.declared = n;

    const std::size_t present = lines.size() - 1;
    const std::size_t take    = present < n ? present : n;
    out.items.assign(lines.begin() + 1, lines.begin() + 1 + static_cast<std::ptrdiff_t>(take));

    if (present != n) issues.push_back(make_count_mismatch(n, present, context));
    return true;
}

bool parse_station_line(const std::string& line, Station& out, Error& err) {
    Lines f = split_fields(line);
    if (f.size() != QL_STATION_FIELDS) {
        err = make_error(ErrorKind::Format, "bad_field_count", line);
        err.expected = QL_STATION_FIELDS;
        err.actual   = f.size();
        return false;
    }

    bool fits = assign_field(out.master,  f[0]) &&
                assign_field(out.station, f[1]) &&
                assign_field(out.type,    f[2]) &&
                assign_field(out.config,  f[3]) &&
                assign_field(out.version, f[4]) &&
                assign_field(out.flag,    f[5]) &&
                assign_field(out.serial,  f[6]);
    if (!fits) {
        err = make_error(ErrorKind::Format, "field_too_long", line);
        return false;
    }
    return true;
}

std::vector<Station> parse_stations(const Lines& items, std::vector<Error>& issues) {
    std::vector<Station> out;
    out.reserve(items.size());
    for (const auto& line : items) {
        Station st;
        Error   e;
        if (parse_station_line(line, st, e)) out.push_back(st);
        else                                 issues.push_back(e);
    }
    return out;
}

} // namespace qlink
