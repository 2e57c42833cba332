#include <doctest/doctest.h>
#include <sstream>
#include "qlink/controller.hpp"
#include "qlink/exporters.hpp"
#include "qlink/session.hpp"
#include "fake_bridge.hpp"

using namespace qlink;

static RunOptions quick_run(Strategy s = Strategy::Flat) {
    RunOptions o;
    o.min_gap_ms         = 0;
    o.builder.strategy   = s;
    o.builder.settle_ms  = 0;
    o.builder.sleep_ms   = [](uint32_t) {};
    return o;
}

static void script_scenario_a(FakeBridge& b) {
    b.servers = {ServerDescriptor{0, "Vantage", "10.0.0.5", 3040}};
    b.replies["VCL 1"]  = std::string("1 0");
    b.replies["VQM"]    = std::string("2 M1 M2");
    b.replies["VQS M1"] = std::string("1\nM1 S1 0 A1 v1 0 SN1");
    b.replies["VQS M2"] = std::string("0");
}

TEST_CASE("send before open is rejected without touching the bridge") {
    FakeBridge bridge;
    Session s(bridge, 0, 0, [](uint32_t) {});
    RawReply r;
    Error err;
    CHECK_FALSE(s.send("VQM", r, err));
    CHECK(err.kind == ErrorKind::Protocol);
    CHECK(err.reason == "not_connected");
    CHECK(bridge.sent.empty());
}

TEST_CASE("Empty or multi-line commands are protocol errors") {
    FakeBridge bridge;
    Session s(bridge, 0, 0, [](uint32_t) {});
    Error err;
    REQUIRE(s.open(err));

    RawReply r;
    CHECK_FALSE(s.send("", r, err));
    CHECK(err.reason == "bad_command");
    CHECK_FALSE(s.send("   ", r, err));
    CHECK_FALSE(s.send("VQM\nVQM", r, err));
    CHECK(bridge.sent.empty());
}

TEST_CASE("Session never opened does not disconnect") {
    FakeBridge bridge;
    {
        Session s(bridge, 0, 0, [](uint32_t) {});
    }
    CHECK(bridge.disconnect_calls == 0);
}

TEST_CASE("Destructor and explicit close together disconnect exactly once") {
    FakeBridge bridge;
    {
        Session s(bridge, 2, 0, [](uint32_t) {});
        Error err;
        REQUIRE(s.open(err));
        CHECK(bridge.last_index == 2);
        CHECK(s.close());
        CHECK(s.close());
        CHECK(s.disconnect_message() == "Disconnected.");
    }
    CHECK(bridge.disconnect_calls == 1);
}

TEST_CASE("Minimum gap paces back-to-back commands") {
    FakeBridge bridge;
    std::vector<uint32_t> waits;
    Session s(bridge, 0, 10000, [&](uint32_t ms) { waits.push_back(ms); });
    Error err;
    REQUIRE(s.open(err));

    RawReply r;
    REQUIRE(s.send("VQM", r, err));
    CHECK(waits.empty());                 // nothing to space from yet
    REQUIRE(s.send("VQM", r, err));
    REQUIRE(waits.size() == 1);
    CHECK(waits[0] > 0);
    CHECK(waits[0] <= 10000);
}

TEST_CASE("Scenario A: one station under M1, none under M2") {
    FakeBridge bridge;
    script_scenario_a(bridge);

    RunResult r = run_inventory(bridge, quick_run());

    REQUIRE(r.ok());
    CHECK(r.final_state == BuilderState::Done);
    CHECK(r.connected);
    CHECK(r.disconnect_ok);
    CHECK(bridge.connect_calls == 1);
    CHECK(bridge.disconnect_calls == 1);

    REQUIRE(r.topology.masters.size() == 2);
    const Master& m1 = r.topology.masters[0];
    CHECK(str(m1.address) == "M1");
    REQUIRE(m1.stations.size() == 1);
    const Station& st = m1.stations[0];
    CHECK(str(st.master)  == "M1");
    CHECK(str(st.station) == "S1");
    CHECK(str(st.type)    == "0");
    CHECK(str(st.config)  == "A1");
    CHECK(str(st.version) == "v1");
    CHECK(str(st.flag)    == "0");
    CHECK(str(st.serial)  == "SN1");

    CHECK(str(r.topology.masters[1].address) == "M2");
    CHECK(r.topology.masters[1].stations.empty());
    CHECK(r.topology.warning_count() == 0);
}

TEST_CASE("Scenario B: short master list still enumerates what is there") {
    FakeBridge bridge;
    script_scenario_a(bridge);
    bridge.replies["VQM"] = std::string("3 M1 M2");

    RunResult r = run_inventory(bridge, quick_run());

    REQUIRE(r.ok());
    CHECK(r.final_state == BuilderState::Done);
    REQUIRE(r.topology.warnings.size() == 1);
    const Error& w = r.topology.warnings[0];
    CHECK(w.kind == ErrorKind::CountMismatch);
    CHECK(w.expected == 3);
    CHECK(w.actual == 2);
    CHECK(r.topology.masters.size() == 2);
    CHECK(bridge.count("VQS M1") == 1);
    CHECK(bridge.count("VQS M2") == 1);
    CHECK(bridge.disconnect_calls == 1);
}

TEST_CASE("Handshake rejection still disconnects once") {
    FakeBridge bridge;
    script_scenario_a(bridge);
    bridge.replies["VCL 1"] = Lines{"1"};

    RunResult r = run_inventory(bridge, quick_run());

    CHECK_FALSE(r.ok());
    CHECK(r.fatal.kind == ErrorKind::Handshake);
    CHECK(r.final_state == BuilderState::Failed);
    CHECK(r.topology.masters.empty());
    CHECK(bridge.count("VQM") == 0);
    CHECK(bridge.disconnect_calls == 1);
}

TEST_CASE("Connect failure is surfaced and disconnect is still attempted once") {
    FakeBridge bridge;
    bridge.servers       = {ServerDescriptor{0, "Vantage", "10.0.0.5", 3040}};
    bridge.connect_error = make_error(ErrorKind::Protocol, "bridge_rejected", "http 400: Invalid server index.");

    RunResult r = run_inventory(bridge, quick_run());

    CHECK_FALSE(r.ok());
    CHECK(r.fatal.kind == ErrorKind::Protocol);
    CHECK(r.fatal.reason == "bridge_rejected");
    CHECK_FALSE(r.connected);
    CHECK(r.final_state == BuilderState::Failed);
    CHECK(bridge.sent.empty());
    CHECK(bridge.disconnect_calls == 1);
    CHECK(r.disconnect_message == "Already disconnected.");
}

TEST_CASE("Bridge listing no servers fails before connect") {
    FakeBridge bridge;
    script_scenario_a(bridge);
    bridge.servers.clear();

    RunResult r = run_inventory(bridge, quick_run());

    CHECK_FALSE(r.ok());
    CHECK(r.fatal.kind == ErrorKind::Protocol);
    CHECK(r.fatal.reason == "no_servers");
    CHECK(r.final_state == BuilderState::Failed);
    CHECK_FALSE(r.connected);
    CHECK(bridge.connect_calls == 0);
    CHECK(bridge.sent.empty());
    CHECK(bridge.disconnect_calls == 1);
}

TEST_CASE("Server index missing from the list fails before connect") {
    FakeBridge bridge;
    script_scenario_a(bridge);
    RunOptions opts = quick_run();
    opts.server_index = 5;

    RunResult r = run_inventory(bridge, opts);

    CHECK(r.fatal.kind == ErrorKind::Protocol);
    CHECK(r.fatal.reason == "bad_server_index");
    CHECK(r.fatal.detail == "server 5 not among 1 listed");
    CHECK(bridge.connect_calls == 0);
    CHECK(bridge.sent.empty());
    CHECK(bridge.disconnect_calls == 1);
}

TEST_CASE("Server list transport failure is the run's fatal error") {
    FakeBridge bridge;
    script_scenario_a(bridge);
    bridge.list_error = make_error(ErrorKind::Transport, "connect_failed", "GET fake/servers");

    RunResult r = run_inventory(bridge, quick_run());

    CHECK(r.fatal.kind == ErrorKind::Transport);
    CHECK(r.fatal.reason == "connect_failed");
    CHECK(bridge.connect_calls == 0);
    CHECK(bridge.disconnect_calls == 1);
    CHECK(r.disconnect_ok);
}

TEST_CASE("Failing disconnect never replaces the run's fatal error") {
    FakeBridge bridge;
    script_scenario_a(bridge);
    bridge.send_errors["VQM"] = make_error(ErrorKind::Transport, "timeout");
    bridge.disconnect_error   = make_error(ErrorKind::Transport, "connect_failed");

    RunResult r = run_inventory(bridge, quick_run());

    CHECK(r.fatal.kind == ErrorKind::Transport);
    CHECK(r.fatal.reason == "timeout");
    CHECK_FALSE(r.disconnect_ok);
    CHECK(bridge.disconnect_calls == 1);
}

TEST_CASE("Successful disconnect does not hide a failed run") {
    FakeBridge bridge;
    script_scenario_a(bridge);
    bridge.send_errors["VQS M2"] = make_error(ErrorKind::Protocol, "bridge_rejected", "http 400: Not connected.");

    RunResult r = run_inventory(bridge, quick_run());

    CHECK_FALSE(r.ok());
    CHECK(r.fatal.kind == ErrorKind::Protocol);
    CHECK(r.disconnect_ok);
    CHECK(r.topology.masters[0].stations.size() == 1);
}

TEST_CASE("Re-running against the same bus exports byte-identical output") {
    FakeBridge bridge;
    script_scenario_a(bridge);

    for (ExportFormat f : {ExportFormat::Csv, ExportFormat::Accessories, ExportFormat::Json}) {
        std::ostringstream first, second;
        export_topology(first,  run_inventory(bridge, quick_run()).topology, f);
        export_topology(second, run_inventory(bridge, quick_run()).topology, f);
        CHECK(first.str() == second.str());
        CHECK_FALSE(first.str().empty());
    }
}
