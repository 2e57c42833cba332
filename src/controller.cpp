// ============================================================================
// controller.cpp - implementation for qlink/controller.hpp
// ============================================================================

#include "qlink/controller.hpp"

#include "qlink/log.hpp"
#include "qlink/session.hpp"

#include <vector>

namespace qlink {

// ---------------------------------------------------------------------------
// check_server()
// --------------
// The bridge must list at least one server and one of them must carry the
// requested index. Anything else stops the run before connect().
// ---------------------------------------------------------------------------
static bool check_server(IBridge& bridge, int server_index, Error& err) {
    std::vector<ServerDescriptor> servers;
    if (!bridge.list_servers(servers, err)) return false;
    if (servers.empty()) {
        err = make_error(ErrorKind::Protocol, "no_servers", "bridge " + bridge.name() + " lists no servers");
        return false;
    }
    for (const auto& sd : servers) {
        if (sd.index == server_index) {
            log::info("run", "server " + std::to_string(sd.index) + " label=" + sd.label);
            return true;
        }
    }
    err = make_error(ErrorKind::Protocol, "bad_server_index",
                     "server " + std::to_string(server_index) + " not among " +
                     std::to_string(servers.size()) + " listed");
    return false;
}

RunResult run_inventory(IBridge& bridge, const RunOptions& opts) {
    RunResult r;
    r.topology.strategy = opts.builder.strategy;

    {
        Session session(bridge, opts.server_index, opts.min_gap_ms, opts.builder.sleep_ms);

        Error err;
        if (!check_server(bridge, opts.server_index, err)) {
            session.require_disconnect();
            r.fatal       = err;
            r.final_state = BuilderState::Failed;
        } else if (!session.open(err)) {
            r.fatal       = err;
            r.final_state = BuilderState::Failed;
        } else {
            r.connected = true;
            TopologyBuilder builder(session, opts.builder);
            builder.run(r.topology, r.fatal);
            r.final_state = builder.state();
        }

        r.disconnect_ok      = session.close();
        r.disconnect_message = r.disconnect_ok ? session.disconnect_message()
                                               : session.disconnect_error().to_line();
    }

    if (!r.ok()) log::error("run", "state=" + std::string(state_name(r.final_state)) + " " + r.fatal.to_line());
    return r;
}

} // namespace qlink
