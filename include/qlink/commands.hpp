#pragma once
/**
 * @page ql-commands Bus Command Vocabulary
 * @file commands.hpp
 * @brief Builders for the handful of text commands the inventory issues.
 *
 * @details
 * The bridge forwards command text to the lighting bus verbatim. The inventory
 * only ever needs four of them:
 *
 * | Builder                 | Text            | Reply                          |
 * |-------------------------|-----------------|--------------------------------|
 * | QL_DEFAULT_HANDSHAKE    | `VCL 1`         | ack tokens, normally `1 0`     |
 * | make_query_masters()    | `VQM`           | count + master addresses       |
 * | make_query_modules(m)   | `VQP <m>`       | count + module addresses       |
 * | make_query_stations(a)  | `VQS <a>`       | count + 7-field station lines  |
 *
 * The handshake text is configurable (some bridges send their own on TCP
 * connect) so only its default lives here.
 *
 * Builders are kept explicit and tiny so the wire vocabulary can be grepped.
 */

#include <string>

namespace qlink {

static constexpr const char* QL_DEFAULT_HANDSHAKE = "VCL 1";
static constexpr const char* QL_CMD_MASTERS       = "VQM";
static constexpr const char* QL_CMD_MODULES       = "VQP";
static constexpr const char* QL_CMD_STATIONS      = "VQS";

std::string make_query_masters();

std::string make_query_modules(const std::string& master);

/// @param address master address (flat) or module address (nested)
std::string make_query_stations(const std::string& address);

/// Non-empty after trimming and free of CR/LF (the bridge appends its own line ending).
bool is_valid_command(const std::string& command);

} // namespace qlink
