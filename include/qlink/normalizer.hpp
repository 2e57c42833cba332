#pragma once
/**
 * @page ql-normalizer Response Normalizer
 * @file normalizer.hpp
 * @brief Erase the three reply shapes into one ordered sequence of strings.
 *
 * @details
 * PURPOSE
 * -------
 * The bridge is inconsistent about how it hands back bus replies. Older builds
 * pre-split the TCP text into an array, newer ones return the raw text block,
 * and a few commands come back as one space- or comma-separated string. This
 * ambiguity lives upstream and is not going away, so the normalizer absorbs it
 * once, at the edge, and the parser never sees it.
 *
 * RULES (in priority order)
 * -------------------------
 *   1. Sequence of strings: kept as-is, one element per logical line
 *      (trailing `\r` stripped, blank elements dropped).
 *   2. String containing a newline: split on `\n` (`\r\n` tolerated), each
 *      line trimmed, blank lines dropped.
 *   3. String without newline: split on commas (each piece trimmed) if a comma
 *      is present, otherwise on runs of whitespace.
 *
 * Newline splitting wins over whitespace splitting because station records use
 * whitespace between their seven fields.
 *
 * TOKENS VS LINES
 * ---------------
 * Some replies are flat token lists (masters, modules, the handshake ack).
 * For those, tokenize() flattens the normalized lines into individual tokens, so
 * `"2\nM1 M2"`, `"2 M1 M2"` and `["2","M1","M2"]` all become `2,M1,M2`.
 * Record-valued replies (stations) stay as lines.
 *
 * EXAMPLE
 * -------
 * @code
 *   qlink::RawReply r = std::string("1\nM1 S1 0 A1 v1 0 SN1");
 *   auto lines = qlink::normalize(r);   // {"1", "M1 S1 0 A1 v1 0 SN1"}
 *   auto toks  = qlink::tokenize(lines); // {"1","M1","S1","0","A1","v1","0","SN1"}
 * @endcode
 */

#include <string>

#include "qlink/reply.hpp"

namespace qlink {

/// Apply rules 1-3 above. Never fails; an empty reply yields no lines.
Lines normalize(const RawReply& reply);

/// Split every line on whitespace (or commas) and concatenate the tokens.
Lines tokenize(const Lines& lines);

/// Whitespace split of one record line; empty pieces are dropped.
Lines split_fields(const std::string& line);

/// Strip spaces, tabs, CR and LF at both ends.
std::string trim(const std::string& s);

/// One-line rendering of any reply shape, for logs.
std::string describe(const RawReply& reply);

} // namespace qlink
