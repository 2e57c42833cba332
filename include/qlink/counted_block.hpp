#pragma once
/**
 * @page ql-counted-block Count-Validated Parser
 * @file counted_block.hpp
 * @brief Interpret normalized lines as `[count, item_1 .. item_N]` and parse station records.
 *
 * @details
 * PURPOSE
 * -------
 * Every enumeration reply (VQM, VQP, VQS) opens with the number of items that
 * follow. The bus does not guarantee that this number matches what actually
 * arrives: replies get clipped by the bridge's quiet-time window, or a master
 * reports a station it cannot describe. This layer checks the declared count
 * instead of trusting it, and keeps going with whatever is there.
 *
 * CONTRACT
 * --------
 * parse_counted_block():
 *   - First element must be a non-negative decimal integer. Otherwise a
 *     Format error (`bad_count`, or `empty_reply` when there is nothing at all)
 *     is appended and the function returns false: the branch is abandoned.
 *   - The items are the elements after the count, capped at N.
 *   - If fewer than N, or more than N, elements follow, a CountMismatch
 *     (`expected=N actual=present`) is appended and the function still
 *     returns true with the items it kept. Nothing is padded.
 *
 * parse_station_line():
 *   - Exactly QL_STATION_FIELDS (7) whitespace-separated fields, in order:
 *     master, station, type, config, version, flag, serial.
 *   - Any other count is a Format error `bad_field_count` carrying the line.
 *   - A field longer than its fixed-width slot is `field_too_long`.
 *
 * parse_stations():
 *   - Runs parse_station_line() over every item; rejected lines become Format
 *     warnings and are left out, the rest are returned in order.
 *
 * EXAMPLE
 * -------
 * @code
 *   std::vector<qlink::Error> issues;
 *   qlink::CountedBlock blk;
 *   qlink::parse_counted_block({"3", "M1", "M2"}, blk, issues, "VQM");
 *   // blk.items == {"M1","M2"}, issues[0].kind == ErrorKind::CountMismatch
 * @endcode
 */

#include <cstddef>
#include <string>
#include <vector>

#include "qlink/errors.hpp"
#include "qlink/reply.hpp"
#include "qlink/topology.hpp"

namespace qlink {

static constexpr std::size_t QL_STATION_FIELDS = 7;

struct CountedBlock {
    std::size_t declared{0};
    Lines       items;
};

/// Strict decimal parse; no sign, no whitespace, no trailing junk.
bool parse_count(const std::string& token, std::size_t& out);

/**
 * @param lines    Normalized (lines) or tokenized (tokens) reply.
 * @param out      Filled with the declared count and the items kept.
 * @param issues   Format / CountMismatch errors are appended here.
 * @param context  Command text, copied into error details.
 * @return false only when the count itself is unusable.
 */
bool parse_counted_block(const Lines& lines, CountedBlock& out,
                         std::vector<Error>& issues, const std::string& context = {});

bool parse_station_line(const std::string& line, Station& out, Error& err);

std::vector<Station> parse_stations(const Lines& items, std::vector<Error>& issues);

} // namespace qlink
