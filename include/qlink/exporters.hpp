#pragma once
/**
 * @page ql-export Topology Export
 * @file exporters.hpp
 * @brief CSV, accessory JSON and full topology JSON writers.
 *
 * @details
 * FORMATS
 * -------
 * - csv:         one row per station.
 *                flat:   Master,Station,Station Type,Config,Version,Flag,Serial Number
 *                nested: Master,Module,Station,Station Type,Config,Version,Flag,Serial Number
 *                Fields are quoted when they hold a comma, quote, CR or LF.
 * - accessories: array of accessory objects for a home-automation bridge, one
 *                per station, typed through station_types.hpp.
 * - json:        masters -> (modules ->) stations tree with every warning.
 *
 * All writers are pure functions of the Topology: the same input gives the
 * same bytes. Key order is fixed (nlohmann::ordered_json).
 */

#include <cstdint>
#include <ostream>
#include <string>

#include "qlink/topology.hpp"

namespace qlink {

enum class ExportFormat : uint8_t { Csv, Accessories, Json };

const char* format_name(ExportFormat f);
bool        format_from_string(const std::string& value, ExportFormat& out);

/// RFC 4180 quoting for one field.
std::string csv_escape(const std::string& field);

void write_csv(std::ostream& os, const Topology& topo);
void write_accessories(std::ostream& os, const Topology& topo);
void write_topology_json(std::ostream& os, const Topology& topo);

void export_topology(std::ostream& os, const Topology& topo, ExportFormat f);

/**
 * @brief Write @p content to @p path via "<path>.tmp" + rename.
 * "-" writes to stdout. Parent directories are created.
 */
bool write_output_file(const std::string& path, const std::string& content, std::string& err);

} // namespace qlink
