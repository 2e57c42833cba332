#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <cstdint>
#include <CLI/CLI.hpp>

#include "qlink/config.hpp"       // Config, load_config_file(), default_config_path()
#include "qlink/controller.hpp"   // run_inventory()
#include "qlink/exporters.hpp"    // export_topology(), write_output_file()
#include "qlink/http_bridge.hpp"  // HttpBridge, parse_endpoint()
#include "qlink/log.hpp"

// Exit codes
//   0 ok (warnings allowed)   1 transport   2 usage/config
//   3 protocol                4 handshake   5 output write
static int exit_code_for(const qlink::Error& e) {
  switch (e.kind) {
    case qlink::ErrorKind::None:      return 0;
    case qlink::ErrorKind::Transport: return 1;
    case qlink::ErrorKind::Protocol:  return 3;
    case qlink::ErrorKind::Handshake: return 4;
    default:                          return 3;
  }
}

static bool given(const CLI::Option* o) { return o && o->count() > 0; }

static int do_list_servers(qlink::IBridge& bridge) {
  std::vector<qlink::ServerDescriptor> servers;
  qlink::Error err;
  if (!bridge.list_servers(servers, err)) {
    std::cerr << "status=error " << err.to_line() << "\n";
    return exit_code_for(err);
  }
  for (const auto& s : servers) {
    std::cout << "index=" << s.index << " name=\"" << s.label << "\"";
    if (!s.host.empty()) std::cout << " host=" << s.host;
    if (s.port > 0)      std::cout << " port=" << s.port;
    std::cout << "\n";
  }
  std::cerr << "status=ok servers=" << servers.size() << "\n";
  return 0;
}

static int do_status(qlink::IBridge& bridge) {
  qlink::BridgeStatus st;
  qlink::Error err;
  if (!bridge.status(st, err)) {
    std::cerr << "status=error " << err.to_line() << "\n";
    return exit_code_for(err);
  }
  std::cout << "connected=" << (st.connected ? 1 : 0);
  if (!st.server.empty()) std::cout << " server=\"" << st.server << "\"";
  std::cout << "\n";
  return 0;
}

static int do_enumerate(qlink::IBridge& bridge, const qlink::Config& cfg) {
  qlink::RunResult r = qlink::run_inventory(bridge, cfg.run_options());

  for (const auto& w : r.topology.all_warnings())
    std::cerr << "status=warn scope=" << w.scope << " " << w.error.to_line() << "\n";
  if (!r.disconnect_ok)
    std::cerr << "status=warn scope=session reason=disconnect_failed detail=\"" << r.disconnect_message << "\"\n";

  int code = 0;
  if (!r.ok()) {
    std::cerr << "status=error state=" << qlink::state_name(r.final_state) << " " << r.fatal.to_line() << "\n";
    code = exit_code_for(r.fatal);
  }

  // Whatever was built is written, even after a fatal error.
  std::ostringstream os;
  qlink::export_topology(os, r.topology, cfg.format);
  std::string werr;
  if (!qlink::write_output_file(cfg.output, os.str(), werr)) {
    std::cerr << "status=error reason=output_write_failed detail=\"" << werr << "\"\n";
    return code ? code : 5;
  }

  if (code == 0) {
    std::cerr << "status=ok masters=" << r.topology.masters.size()
              << " stations=" << r.topology.station_count()
              << " warnings=" << r.topology.warning_count()
              << " format=" << qlink::format_name(cfg.format)
              << " output=" << cfg.output << "\n";
  }
  return code;
}

int main(int argc, char** argv) {
  CLI::App app{"Qlink bus inventory (masters, modules, stations) via the bridge service"};

  // ---- modes ----
  bool list_servers = false, show_status = false;
  app.add_flag("--list-servers", list_servers, "List servers known to the bridge and exit");
  app.add_flag("--status", show_status, "Show the bridge's connection status and exit");

  // ---- config ----
  std::string config_path;
  auto* o_config = app.add_option("--config", config_path, "JSON config file (default: $XDG_CONFIG_HOME/qlink/inventory.json)");

  // ---- target ----
  std::string bridge_txt;
  int server_index = 0;
  auto* o_bridge = app.add_option("--bridge", bridge_txt, "Bridge address host[:port] or http://host:port/base");
  auto* o_server = app.add_option("--server", server_index, "Server index passed to /connect")->check(CLI::NonNegativeNumber);

  // ---- enumeration ----
  std::string strategy, format, output, handshake, log_level;
  uint32_t settle_ms = 0, min_gap_ms = 0;
  int timeout_ms = 0;
  bool no_handshake = false;
  auto* o_strategy  = app.add_option("--strategy", strategy, "flat (VQS per master) or nested (VQP then VQS per module)")
                         ->check(CLI::IsMember({"flat", "nested"}));
  auto* o_format    = app.add_option("--format", format, "Output format: csv|accessories|json")
                         ->check(CLI::IsMember({"csv", "accessories", "json"}));
  auto* o_output    = app.add_option("--output", output, "Output file, '-' for stdout");
  auto* o_settle    = app.add_option("--settle-ms", settle_ms, "Wait after handshake before VQM (0 = none)");
  auto* o_timeout   = app.add_option("--timeout", timeout_ms, "Per-request HTTP timeout (ms)")->check(CLI::PositiveNumber);
  auto* o_gap       = app.add_option("--min-gap-ms", min_gap_ms, "Minimum gap between bus commands (ms)");
  auto* o_handshake = app.add_option("--handshake", handshake, "Handshake command text");
  auto* o_no_hs     = app.add_flag("--no-handshake", no_handshake, "Skip the handshake");
  auto* o_log       = app.add_option("--log-level", log_level, "none|error|warn|info|debug")
                         ->check(CLI::IsMember({"none", "error", "warn", "info", "debug"}));
  o_no_hs->excludes(o_handshake);

  CLI11_PARSE(app, argc, argv);

  if (list_servers && show_status) {
    std::cerr << "status=error reason=need_at_most_one_mode\n";
    return 2;
  }

  // -------- defaults -> file -> flags --------
  qlink::Config cfg;
  std::string err;
  const bool explicit_config = given(o_config);
  const std::string path = explicit_config ? config_path : qlink::default_config_path();
  if (!qlink::load_config_file(path, cfg, err, explicit_config)) {
    std::cerr << "status=error reason=bad_config detail=\"" << err << "\"\n";
    return 2;
  }

  if (given(o_bridge) && !qlink::parse_endpoint(bridge_txt, cfg.bridge, err)) {
    std::cerr << "status=error reason=bad_bridge detail=\"" << err << "\"\n";
    return 2;
  }
  if (given(o_server))   cfg.server_index = server_index;
  if (given(o_strategy)) qlink::strategy_from_string(strategy, cfg.strategy);
  if (given(o_format))   qlink::format_from_string(format, cfg.format);
  if (given(o_output))   cfg.output = output;
  if (given(o_settle))   cfg.settle_ms = settle_ms;
  if (given(o_timeout))  cfg.bridge.timeout_ms = timeout_ms;
  if (given(o_gap))      cfg.min_gap_ms = min_gap_ms;
  if (given(o_handshake)) cfg.handshake = handshake;
  if (no_handshake)      cfg.handshake.clear();
  if (given(o_log))      qlink::log::level_from_string(log_level, cfg.log_level);

  qlink::log::set_level(cfg.log_level);

  qlink::HttpBridge bridge(cfg.bridge);
  qlink::log::debug("main", "bridge=" + bridge.name() + " strategy=" + qlink::strategy_name(cfg.strategy) +
                            " format=" + qlink::format_name(cfg.format));

  if (list_servers) return do_list_servers(bridge);
  if (show_status)  return do_status(bridge);
  return do_enumerate(bridge, cfg);
}
