#pragma once
/**
 * @page ql-config Configuration
 * @file config.hpp
 * @brief Run settings: built-in defaults, then a JSON file, then CLI flags.
 *
 * @details
 * FILE LOCATION
 * -------------
 *   $XDG_CONFIG_HOME/qlink/inventory.json, else ~/.config/qlink/inventory.json,
 *   or whatever --config names. The default file may be absent; an explicit
 *   one may not.
 *
 * FILE FORMAT
 * -----------
 * @code
 * {
 *   "bridge": { "host": "10.0.0.2", "port": 3000, "basePath": "",
 *               "timeoutMs": 5000, "quietMs": 300, "maxMs": 2000 },
 *   "serverIndex": 0,
 *   "handshake": "VCL 1",
 *   "expectedAck": ["1", "0"],
 *   "settleMs": 3000,
 *   "minGapMs": 120,
 *   "strategy": "flat",
 *   "format": "csv",
 *   "output": "-",
 *   "logLevel": "info"
 * }
 * @endcode
 * Every key is optional. Unknown keys are ignored so one file can serve
 * several tool versions; a known key with the wrong type is an error.
 */

#include <cstdint>
#include <string>
#include <vector>

#include "qlink/controller.hpp"
#include "qlink/exporters.hpp"
#include "qlink/http_bridge.hpp"
#include "qlink/log.hpp"
#include "qlink/topology.hpp"

namespace qlink {

struct Config {
    BridgeEndpoint           bridge;
    int                      server_index{0};
    std::string              handshake{QL_DEFAULT_HANDSHAKE};
    std::vector<std::string> expected_ack{"1", "0"};
    uint32_t                 settle_ms{3000};
    uint32_t                 min_gap_ms{120};
    Strategy                 strategy{Strategy::Flat};
    ExportFormat             format{ExportFormat::Csv};
    std::string              output{"-"};
    log::Level               log_level{log::Level::Info};

    /// Builder/session options for run_inventory().
    RunOptions run_options() const;
};

/// XDG location described above; empty if neither XDG_CONFIG_HOME nor HOME is set.
std::string default_config_path();

/// Overlay keys found in JSON @p text onto @p cfg.
bool apply_config_text(const std::string& text, Config& cfg, std::string& err);

/**
 * @brief Load @p path and overlay it onto @p cfg.
 * A missing file is an error only when @p required is true.
 */
bool load_config_file(const std::string& path, Config& cfg, std::string& err, bool required);

} // namespace qlink
