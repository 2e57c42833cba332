#pragma once
/**
 * @file controller.hpp
 * @brief One complete inventory run: connect, build, disconnect.
 *
 * run_inventory() owns the Session for the duration of the call. The bridge's
 * server list is checked first: an empty list is Protocol `no_servers`, a
 * server_index it does not carry is Protocol `bad_server_index`. Disconnect
 * happens on every path, including those failures and a failed connect, and its outcome is
 * reported separately from the run's fatal error so it can never mask it.
 */

#include <cstdint>
#include <string>

#include "qlink/bridge.hpp"
#include "qlink/errors.hpp"
#include "qlink/topology.hpp"
#include "qlink/topology_builder.hpp"

namespace qlink {

struct RunOptions {
    int            server_index{0};
    uint32_t       min_gap_ms{120};
    BuilderOptions builder;
};

struct RunResult {
    Topology     topology;                      ///< possibly partial
    Error        fatal;                         ///< kind None on success
    BuilderState final_state{BuilderState::Idle};
    bool         connected{false};              ///< connect() succeeded
    bool         disconnect_ok{false};
    std::string  disconnect_message;

    bool ok() const { return fatal.ok(); }
};

RunResult run_inventory(IBridge& bridge, const RunOptions& opts);

} // namespace qlink
