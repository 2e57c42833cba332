#pragma once
/**
 * @file reply.hpp
 * @brief The bridge's reply to one command, as a tagged variant over its wire shapes.
 *
 * Depending on bridge version and command, the same logical answer arrives as:
 *   - a single string: `"2 M1 M2"` or `"2, M1, M2"`
 *   - a newline-joined block: `"1\nM1 S1 0 A1 v1 0 SN1"`
 *   - a pre-split sequence: `["1", "0"]`
 *
 * The variant is decoded at the bridge boundary and erased immediately by
 * qlink::normalize() (normalizer.hpp). Nothing downstream branches on it again.
 */

#include <string>
#include <variant>
#include <vector>

namespace qlink {

/// Ordered strings with shape differences erased.
using Lines = std::vector<std::string>;

using RawReply = std::variant<std::string, Lines>;

} // namespace qlink
