// ============================================================================
// config.cpp - implementation for qlink/config.hpp
// Tests: tests/test_config.cpp.
// ============================================================================

#include "qlink/config.hpp"

#include <climits>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace qlink {

// ---------------------------------------------------------------------------
// Typed readers
// -------------
// Each returns true when the key is absent (nothing to do) or present with
// the right type (value stored). Wrong type sets err to "<key>: expected <t>".
// ---------------------------------------------------------------------------
static bool read_string(const json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    if (!it->is_string()) { err = std::string(key) + ": expected string"; return false; }
    out = it->get<std::string>();
    return true;
}

// Whole JSON number within [lo, hi]; unsigned values above LLONG_MAX never fit.
static bool integer_in_range(const json& v, long long lo, long long hi, long long& out) {
    if (v.is_number_unsigned()) {
        unsigned long long u = v.get<unsigned long long>();
        if (u > static_cast<unsigned long long>(hi)) return false;
        out = static_cast<long long>(u);
        return out >= lo;
    }
    if (!v.is_number_integer()) return false;
    out = v.get<long long>();
    return out >= lo && out <= hi;
}

static bool read_uint(const json& j, const char* key, uint32_t& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    long long v = 0;
    if (!integer_in_range(*it, 0, 0xFFFFFFFFll, v)) {
        err = std::string(key) + ": expected non-negative integer";
        return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

static bool read_int(const json& j, const char* key, int& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end()) return true;
    long long v = 0;
    if (!integer_in_range(*it, INT_MIN, INT_MAX, v)) {
        err = std::string(key) + ": expected integer in int range";
        return false;
    }
    out = static_cast<int>(v);
    return true;
}

static bool apply_bridge(const json& b, BridgeEndpoint& ep, std::string& err) {
    if (!b.is_object()) { err = "bridge: expected object"; return false; }

    uint32_t port = ep.port, timeout = static_cast<uint32_t>(ep.timeout_ms);
    bool ok = read_string(b, "host", ep.host, err) &&
              read_uint(b, "port", port, err) &&
              read_string(b, "basePath", ep.base_path, err) &&
              read_uint(b, "timeoutMs", timeout, err) &&
              read_uint(b, "quietMs", ep.quiet_ms, err) &&
              read_uint(b, "maxMs", ep.max_ms, err);
    if (!ok) { err = "bridge." + err; return false; }

    if (port == 0 || port > 65535) { err = "bridge.port: out of range"; return false; }
    if (ep.host.empty())           { err = "bridge.host: empty"; return false; }
    ep.port       = static_cast<uint16_t>(port);
    ep.timeout_ms = static_cast<int>(timeout);
    while (!ep.base_path.empty() && ep.base_path.back() == '/') ep.base_path.pop_back();
    return true;
}

RunOptions Config::run_options() const {
    RunOptions o;
    o.server_index          = server_index;
    o.min_gap_ms            = min_gap_ms;
    o.builder.strategy      = strategy;
    o.builder.handshake     = handshake;
    o.builder.expected_ack  = expected_ack;
    o.builder.settle_ms     = settle_ms;
    return o;
}

std::string default_config_path() {
    const char* xdg  = std::getenv("XDG_CONFIG_HOME");
    const char* home = std::getenv("HOME");
    fs::path base;
    if (xdg && *xdg)        base = fs::path(xdg);
    else if (home && *home) base = fs::path(home) / ".config";
    else                    return {};
    return (base / "qlink" / "inventory.json").string();
}

bool apply_config_text(const std::string& text, Config& cfg, std::string& err) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) { err = "malformed JSON"; return false; }
    if (!j.is_object())   { err = "top level must be an object"; return false; }

    Config c = cfg;     // all-or-nothing: only commit once every key checked out

    if (j.contains("bridge") && !apply_bridge(j["bridge"], c.bridge, err)) return false;

    if (!read_int(j, "serverIndex", c.server_index, err)) return false;
    if (c.server_index < 0) { err = "serverIndex: must be >= 0"; return false; }

    if (!read_string(j, "handshake", c.handshake, err)) return false;

    if (j.contains("expectedAck")) {
        const json& a = j["expectedAck"];
        if (!a.is_array()) { err = "expectedAck: expected array of strings"; return false; }
        c.expected_ack.clear();
        for (const auto& e : a) {
            if (!e.is_string()) { err = "expectedAck: expected array of strings"; return false; }
            c.expected_ack.push_back(e.get<std::string>());
        }
    }

    if (!read_uint(j, "settleMs", c.settle_ms, err)) return false;
    if (!read_uint(j, "minGapMs", c.min_gap_ms, err)) return false;

    std::string s;
    if (j.contains("strategy")) {
        if (!read_string(j, "strategy", s, err)) return false;
        if (!strategy_from_string(s, c.strategy)) { err = "strategy: unknown '" + s + "'"; return false; }
    }
    if (j.contains("format")) {
        if (!read_string(j, "format", s, err)) return false;
        if (!format_from_string(s, c.format)) { err = "format: unknown '" + s + "'"; return false; }
    }
    if (!read_string(j, "output", c.output, err)) return false;
    if (j.contains("logLevel")) {
        if (!read_string(j, "logLevel", s, err)) return false;
        if (!log::level_from_string(s, c.log_level)) { err = "logLevel: unknown '" + s + "'"; return false; }
    }

    cfg = c;
    return true;
}

bool load_config_file(const std::string& path, Config& cfg, std::string& err, bool required) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        if (!required) return true;
        err = "config not found: " + path;
        return false;
    }

    std::ifstream in(path);
    if (!in) { err = "cannot read config: " + path; return false; }
    std::ostringstream ss;
    ss << in.rdbuf();

    if (!apply_config_text(ss.str(), cfg, err)) {
        err = path + ": " + err;
        return false;
    }
    return true;
}

} // namespace qlink
