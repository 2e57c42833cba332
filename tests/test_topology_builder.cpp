#include <doctest/doctest.h>
#include "qlink/topology_builder.hpp"
#include "fake_bridge.hpp"

using namespace qlink;

static BuilderOptions quick_options(Strategy s = Strategy::Flat) {
    BuilderOptions o;
    o.strategy  = s;
    o.settle_ms = 0;
    o.sleep_ms  = [](uint32_t) {};
    return o;
}

static SleepFn no_sleep() { return [](uint32_t) {}; }

TEST_CASE("Builder refuses to run on a session that was never opened") {
    FakeBridge bridge;
    Session s(bridge, 0, 0, no_sleep());
    TopologyBuilder b(s, quick_options());

    Topology t;
    Error fatal;
    CHECK_FALSE(b.run(t, fatal));
    CHECK(fatal.kind == ErrorKind::Protocol);
    CHECK(fatal.reason == "not_connected");
    CHECK(b.state() == BuilderState::Failed);
    CHECK(bridge.sent.empty());
}

TEST_CASE("Flat strategy issues VCL, VQM, then VQS per master in order") {
    FakeBridge bridge;
    bridge.replies["VCL 1"] = Lines{"1", "0"};
    bridge.replies["VQM"]   = std::string("2 M1 M2");
    bridge.replies["VQS M1"] = std::string("2\nM1 S1 0 A1 v1 0 SN1\nM1 S2 1 A2 v2 1 SN2");
    bridge.replies["VQS M2"] = Lines{"1", "M2 S9 5 A9 v9 0 SN9"};

    Session s(bridge, 0, 0, no_sleep());
    Error err;
    REQUIRE(s.open(err));

    TopologyBuilder b(s, quick_options());
    Topology t;
    REQUIRE(b.run(t, err));
    CHECK(b.state() == BuilderState::Done);

    CHECK((bridge.sent == std::vector<std::string>{"VCL 1", "VQM", "VQS M1", "VQS M2"}));
    REQUIRE(t.masters.size() == 2);
    REQUIRE(t.masters[0].stations.size() == 2);
    CHECK(str(t.masters[0].stations[1].serial) == "SN2");
    REQUIRE(t.masters[1].stations.size() == 1);
    CHECK(str(t.masters[1].stations[0].type) == "5");
    CHECK(t.warning_count() == 0);
}

TEST_CASE("Nested strategy walks VQP then VQS per module") {
    FakeBridge bridge;
    bridge.replies["VCL 1"]  = std::string("1 0");
    bridge.replies["VQM"]    = std::string("1 M1");
    bridge.replies["VQP M1"] = std::string("2 P1 P2");
    bridge.replies["VQS P1"] = std::string("1\nM1 S1 0 A1 v1 0 SN1");
    bridge.replies["VQS P2"] = std::string("3\nM1 S2 1 A2 v2 0 SN2");   // short by two

    Session s(bridge, 0, 0, no_sleep());
    Error err;
    REQUIRE(s.open(err));

    TopologyBuilder b(s, quick_options(Strategy::Nested));
    Topology t;
    REQUIRE(b.run(t, err));

    CHECK((bridge.sent == std::vector<std::string>{"VCL 1", "VQM", "VQP M1", "VQS P1", "VQS P2"}));
    REQUIRE(t.masters.size() == 1);
    const Master& m = t.masters[0];
    CHECK(m.stations.empty());
    REQUIRE(m.modules.size() == 2);
    CHECK(str(m.modules[0].address) == "P1");
    CHECK(m.modules[0].stations.size() == 1);
    CHECK(m.modules[1].stations.size() == 1);
    REQUIRE(m.modules[1].warnings.size() == 1);
    CHECK(m.modules[1].warnings[0].kind == ErrorKind::CountMismatch);
    CHECK(t.station_count() == 2);

    auto all = t.all_warnings();
    REQUIRE(all.size() == 1);
    CHECK(all[0].scope == "module:M1/P2");
}

TEST_CASE("Handshake mismatch fails before any enumeration") {
    FakeBridge bridge;
    bridge.replies["VCL 1"] = std::string("0");

    Session s(bridge, 0, 0, no_sleep());
    Error err;
    REQUIRE(s.open(err));

    TopologyBuilder b(s, quick_options());
    Topology t;
    CHECK_FALSE(b.run(t, err));
    CHECK(err.kind == ErrorKind::Handshake);
    CHECK(err.reason == "handshake_rejected");
    CHECK(b.state() == BuilderState::Failed);
    CHECK(bridge.count("VQM") == 0);
}

TEST_CASE("Disabled handshake goes straight to VQM") {
    FakeBridge bridge;
    bridge.replies["VQM"] = std::string("0");

    Session s(bridge, 0, 0, no_sleep());
    Error err;
    REQUIRE(s.open(err));

    BuilderOptions o = quick_options();
    o.handshake.clear();
    TopologyBuilder b(s, o);
    Topology t;
    REQUIRE(b.run(t, err));
    CHECK((bridge.sent == std::vector<std::string>{"VQM"}));
    CHECK(t.masters.empty());
    CHECK(t.warning_count() == 0);
}

TEST_CASE("Settling delay is applied once, after the handshake") {
    FakeBridge bridge;
    bridge.replies["VCL 1"] = Lines{"1", "0"};
    bridge.replies["VQM"]   = std::string("0");

    std::vector<uint32_t> waits;
    std::size_t sent_before_wait = 0;
    BuilderOptions o = quick_options();
    o.settle_ms = 3000;
    o.sleep_ms  = [&](uint32_t ms) { waits.push_back(ms); sent_before_wait = bridge.sent.size(); };

    Session s(bridge, 0, 0, no_sleep());
    Error err;
    REQUIRE(s.open(err));
    TopologyBuilder b(s, o);
    Topology t;
    REQUIRE(b.run(t, err));

    CHECK((waits == std::vector<uint32_t>{3000}));
    CHECK(sent_before_wait == 1);   // only the handshake went out before the wait
}

TEST_CASE("Bad master count yields an empty topology and a completed run") {
    FakeBridge bridge;
    bridge.replies["VCL 1"] = Lines{"1", "0"};
    bridge.replies["VQM"]   = std::string("lots M1 M2");

    Session s(bridge, 0, 0, no_sleep());
    Error err;
    REQUIRE(s.open(err));
    TopologyBuilder b(s, quick_options());
    Topology t;
    REQUIRE(b.run(t, err));

    CHECK(b.state() == BuilderState::Done);
    CHECK(t.masters.empty());
    REQUIRE(t.warnings.size() == 1);
    CHECK(t.warnings[0].reason == "bad_count");
    CHECK(bridge.count("VQS M1") == 0);
}

TEST_CASE("Format problems on one master do not stop its siblings") {
    FakeBridge bridge;
    bridge.replies["VCL 1"]  = Lines{"1", "0"};
    bridge.replies["VQM"]    = std::string("3 M1 M2 M3");
    bridge.replies["VQS M1"] = std::string("");                               // empty reply
    bridge.replies["VQS M2"] = std::string("2\nM2 S1 0 A1 v1 0\nM2 S2 0 A2 v2 0 SN2");
    bridge.replies["VQS M3"] = std::string("1\nM3 S3 0 A3 v3 0 SN3");

    Session s(bridge, 0, 0, no_sleep());
    Error err;
    REQUIRE(s.open(err));
    TopologyBuilder b(s, quick_options());
    Topology t;
    REQUIRE(b.run(t, err));

    REQUIRE(t.masters.size() == 3);
    CHECK(t.masters[0].stations.empty());
    REQUIRE(t.masters[0].warnings.size() == 1);
    CHECK(t.masters[0].warnings[0].reason == "empty_reply");

    CHECK(t.masters[1].stations.size() == 1);
    REQUIRE(t.masters[1].warnings.size() == 1);
    CHECK(t.masters[1].warnings[0].reason == "bad_field_count");

    CHECK(t.masters[2].stations.size() == 1);
    CHECK(t.masters[2].warnings.empty());
}

TEST_CASE("Transport error mid-enumeration fails and keeps the partial tree") {
    FakeBridge bridge;
    bridge.replies["VCL 1"]  = Lines{"1", "0"};
    bridge.replies["VQM"]    = std::string("3 M1 M2 M3");
    bridge.replies["VQS M1"] = std::string("1\nM1 S1 0 A1 v1 0 SN1");
    bridge.send_errors["VQS M2"] = make_error(ErrorKind::Transport, "timeout");

    Session s(bridge, 0, 0, no_sleep());
    Error err;
    REQUIRE(s.open(err));
    TopologyBuilder b(s, quick_options());
    Topology t;
    CHECK_FALSE(b.run(t, err));

    CHECK(err.kind == ErrorKind::Transport);
    CHECK(b.state() == BuilderState::Failed);
    CHECK(bridge.count("VQS M3") == 0);
    REQUIRE(t.masters.size() == 3);
    CHECK(t.masters[0].stations.size() == 1);
}

TEST_CASE("state_name covers every state") {
    CHECK(std::string(state_name(BuilderState::Idle)) == "idle");
    CHECK(std::string(state_name(BuilderState::EnumeratingChildren)) == "enumerating_children");
    CHECK(std::string(state_name(BuilderState::Failed)) == "failed");
}
