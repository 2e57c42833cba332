#pragma once
/**
 * @page ql-builder Topology Builder
 * @file topology_builder.hpp
 * @brief Drives handshake and enumeration over an open Session.
 *
 * @details
 * STATES
 * ------
 *   Idle -> Connected -> Handshaking -> EnumeratingMasters -> EnumeratingChildren -> Done
 *                 \___________\________________\____________________\-----> Failed
 *
 * WHAT THIS DOES
 * --------------
 * 1. Handshake (skipped when the command is empty). The reply is tokenized and
 *    must equal expected_ack exactly, else Handshake `handshake_rejected`.
 * 2. Settling delay, settle_ms (0 = none).
 * 3. `VQM` -> tokens -> counted block of master addresses. A bad count leaves
 *    the topology empty but the run still ends in Done.
 * 4. Per master:
 *      flat   : `VQS <master>` -> station lines
 *      nested : `VQP <master>` -> module tokens, then `VQS <module>` per module
 *    Format and CountMismatch problems become warnings on the master or module
 *    and the next sibling is tried.
 * 5. Any send failure (Transport/Protocol) -> Failed, enumeration stops, and
 *    whatever was built so far stays in the Topology.
 *
 * The builder never connects or disconnects; see controller.hpp.
 */

#include <cstdint>
#include <string>
#include <vector>

#include "qlink/commands.hpp"
#include "qlink/errors.hpp"
#include "qlink/session.hpp"
#include "qlink/topology.hpp"

namespace qlink {

enum class BuilderState : uint8_t {
    Idle,
    Connected,
    Handshaking,
    EnumeratingMasters,
    EnumeratingChildren,
    Done,
    Failed
};

const char* state_name(BuilderState s);

struct BuilderOptions {
    Strategy                 strategy{Strategy::Flat};
    std::string              handshake{QL_DEFAULT_HANDSHAKE};  ///< empty disables
    std::vector<std::string> expected_ack{"1", "0"};
    uint32_t                 settle_ms{3000};
    SleepFn                  sleep_ms{sleep_for_ms};
};

class TopologyBuilder {
public:
    TopologyBuilder(Session& session, BuilderOptions opts);

    /**
     * @brief Run to Done or Failed.
     * @param out    receives masters, stations and warnings (partial on failure)
     * @param fatal  set when the result is false
     * @return true when the final state is Done
     */
    bool run(Topology& out, Error& fatal);

    BuilderState state() const { return state_; }

private:
    bool handshake(Error& fatal);
    bool enumerate_masters(Topology& out, Error& fatal);
    bool enumerate_flat(Master& m, Error& fatal);
    bool enumerate_nested(Master& m, Error& fatal);
    bool query_stations(const std::string& address, std::vector<Station>& out,
                        std::vector<Error>& warnings, Error& fatal);

    bool fail(Error& fatal, const Error& why);
    void enter(BuilderState s);

    Session&       session_;
    BuilderOptions opts_;
    BuilderState   state_{BuilderState::Idle};
};

} // namespace qlink
