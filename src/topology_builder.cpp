// ============================================================================
// topology_builder.cpp - implementation for qlink/topology_builder.hpp
// For the state diagram see the header. Tests: tests/test_topology_builder.cpp.
// ============================================================================

#include "qlink/topology_builder.hpp"

#include "qlink/counted_block.hpp"
#include "qlink/log.hpp"
#include "qlink/normalizer.hpp"

#include <utility>

namespace qlink {

static const char* TAG = "builder";

static std::string join(const Lines& tokens) {
    std::string s;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (i) s += ' ';
        s += tokens[i];
    }
    return s;
}

const char* state_name(BuilderState s) {
    switch (s) {
        case BuilderState::Idle:                return "idle";
        case BuilderState::Connected:           return "connected";
        case BuilderState::Handshaking:         return "handshaking";
        case BuilderState::EnumeratingMasters:  return "enumerating_masters";
        case BuilderState::EnumeratingChildren: return "enumerating_children";
        case BuilderState::Done:                return "done";
        case BuilderState::Failed:              return "failed";
    }
    return "unknown";
}

TopologyBuilder::TopologyBuilder(Session& session, BuilderOptions opts)
    : session_(session), opts_(std::move(opts)) {}

void TopologyBuilder::enter(BuilderState s) {
    state_ = s;
    log::debug(TAG, std::string("state=") + state_name(s));
}

bool TopologyBuilder::fail(Error& fatal, const Error& why) {
    fatal = why;
    enter(BuilderState::Failed);
    return false;
}

bool TopologyBuilder::run(Topology& out, Error& fatal) {
    out = Topology{};
    out.strategy = opts_.strategy;
    fatal.clear();

    if (state_ == BuilderState::Done || state_ == BuilderState::Failed)
        return fail(fatal, make_error(ErrorKind::Protocol, "builder_reused"));
    if (!session_.is_open())
        return fail(fatal, make_error(ErrorKind::Protocol, "not_connected"));
    enter(BuilderState::Connected);

    if (!handshake(fatal)) return false;

    if (opts_.settle_ms > 0) {
        log::debug(TAG, "settling " + std::to_string(opts_.settle_ms) + " ms");
        if (opts_.sleep_ms) opts_.sleep_ms(opts_.settle_ms);
    }

    if (!enumerate_masters(out, fatal)) return false;

    enter(BuilderState::EnumeratingChildren);
    for (auto& m : out.masters) {
        bool ok = opts_.strategy == Strategy::Nested ? enumerate_nested(m, fatal)
                                                     : enumerate_flat(m, fatal);
        if (!ok) return false;
    }

    enter(BuilderState::Done);
    log::info(TAG, "masters=" + std::to_string(out.masters.size()) +
                   " stations=" + std::to_string(out.station_count()) +
                   " warnings=" + std::to_string(out.warning_count()));
    return true;
}

// ---------------------------------------------------------------------------
// handshake()
// -----------
// An empty expected_ack accepts any reply; the command still has to go
// through without a transport error.
// ---------------------------------------------------------------------------
bool TopologyBuilder::handshake(Error& fatal) {
    enter(BuilderState::Handshaking);
    if (opts_.handshake.empty()) {
        log::debug(TAG, "handshake disabled");
        return true;
    }

    RawReply reply;
    Error e;
    if (!session_.send(opts_.handshake, reply, e)) return fail(fatal, e);

    Lines ack = tokenize(normalize(reply));
    if (!opts_.expected_ack.empty() && ack != opts_.expected_ack) {
        return fail(fatal, make_error(ErrorKind::Handshake, "handshake_rejected",
                                      "expected '" + join(opts_.expected_ack) +
                                      "' got '" + join(ack) + "'"));
    }
    log::info(TAG, "handshake ok");
    return true;
}

bool TopologyBuilder::enumerate_masters(Topology& out, Error& fatal) {
    enter(BuilderState::EnumeratingMasters);

    RawReply reply;
    Error e;
    if (!session_.send(make_query_masters(), reply, e)) return fail(fatal, e);

    CountedBlock block;
    if (!parse_counted_block(tokenize(normalize(reply)), block, out.warnings, QL_CMD_MASTERS)) {
        log::warn(TAG, "master list unusable: " + out.warnings.back().to_line());
        return true;    // empty topology, still a completed run
    }

    for (const auto& addr : block.items) {
        Master m;
        if (!assign_field(m.address, addr)) {
            out.warnings.push_back(make_error(ErrorKind::Format, "field_too_long", addr));
            continue;
        }
        out.masters.push_back(std::move(m));
    }
    log::info(TAG, "masters declared=" + std::to_string(block.declared) +
                   " kept=" + std::to_string(out.masters.size()));
    return true;
}

bool TopologyBuilder::query_stations(const std::string& address, std::vector<Station>& out,
                                     std::vector<Error>& warnings, Error& fatal) {
    const std::string cmd = make_query_stations(address);
    RawReply reply;
    Error e;
    if (!session_.send(cmd, reply, e)) return fail(fatal, e);

    CountedBlock block;
    if (!parse_counted_block(normalize(reply), block, warnings, cmd)) return true;
    out = parse_stations(block.items, warnings);
    return true;
}

bool TopologyBuilder::enumerate_flat(Master& m, Error& fatal) {
    return query_stations(str(m.address), m.stations, m.warnings, fatal);
}

bool TopologyBuilder::enumerate_nested(Master& m, Error& fatal) {
    const std::string cmd = make_query_modules(str(m.address));
    RawReply reply;
    Error e;
    if (!session_.send(cmd, reply, e)) return fail(fatal, e);

    CountedBlock block;
    if (!parse_counted_block(tokenize(normalize(reply)), block, m.warnings, cmd)) return true;

    for (const auto& addr : block.items) {
        Module mod;
        if (!assign_field(mod.address, addr)) {
            m.warnings.push_back(make_error(ErrorKind::Format, "field_too_long", addr));
            continue;
        }
        m.modules.push_back(std::move(mod));
    }

    // Stations are queried after the module list is final so a failure midway
    // leaves every known module in place.
    for (auto& mod : m.modules) {
        if (!query_stations(str(mod.address), mod.stations, mod.warnings, fatal)) return false;
    }
    return true;
}

} // namespace qlink
