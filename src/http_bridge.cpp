// ============================================================================
// http_bridge.cpp - implementation for qlink/http_bridge.hpp
// Transport lives in http_io.cpp; this file only shapes requests and decodes
// bodies. Tests: tests/test_http_bridge.cpp.
// ============================================================================

#include "qlink/http_bridge.hpp"

#include "http_io.hpp"          // http_request()
#include "qlink/log.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace qlink {

static const char* TAG = "bridge";

// ---------------------------------------------------------------------------
// parse_json()
// ------------
// Non-throwing parse. A discarded value means the bridge sent something that
// is not JSON (an HTML error page, a truncated body...).
// ---------------------------------------------------------------------------
static bool parse_json(const std::string& body, json& out, Error& err) {
    out = json::parse(body, nullptr, false);
    if (out.is_discarded()) {
        err = make_error(ErrorKind::Protocol, "bad_json", log::preview(body, 120));
        return false;
    }
    return true;
}

// Strings pass through, numbers are printed, anything else is "".
static std::string as_text(const json& v) {
    if (v.is_string())          return v.get<std::string>();
    if (v.is_number_integer())  return std::to_string(v.get<long long>());
    if (v.is_number())          return v.dump();
    return {};
}

// Integers and numeric strings that fit an int; anything else is @p fallback.
static int as_int(const json& v, int fallback) {
    long long n = 0;
    if (v.is_number_unsigned()) {
        if (v.get<unsigned long long>() > static_cast<unsigned long long>(INT_MAX)) return fallback;
        n = static_cast<long long>(v.get<unsigned long long>());
    } else if (v.is_number_integer()) {
        n = v.get<long long>();
    } else if (v.is_string()) {
        const std::string s = v.get<std::string>();
        char* endp = nullptr;
        errno = 0;
        n = std::strtoll(s.c_str(), &endp, 10);
        if (s.empty() || !endp || *endp != '\0' || errno == ERANGE) return fallback;
    } else {
        return fallback;
    }
    if (n < INT_MIN || n > INT_MAX) return fallback;
    return static_cast<int>(n);
}


bool parse_endpoint(const std::string& text, BridgeEndpoint& ep, std::string& err) {
    std::string rest = text;
    const std::string scheme = "http://";
    if (rest.compare(0, scheme.size(), scheme) == 0) rest.erase(0, scheme.size());
    else if (rest.find("://") != std::string::npos) { err = "unsupported_scheme"; return false; }

    std::string base;
    std::size_t slash = rest.find('/');
    if (slash != std::string::npos) {
        base = rest.substr(slash);
        rest.resize(slash);
        while (!base.empty() && base.back() == '/') base.pop_back();
    }

    std::string host = rest;
    std::size_t colon = rest.rfind(':');
    if (colon != std::string::npos) {
        host = rest.substr(0, colon);
        const std::string port_txt = rest.substr(colon + 1);
        char* endp = nullptr;
        long p = std::strtol(port_txt.c_str(), &endp, 10);
        if (port_txt.empty() || !endp || *endp != '\0' || p <= 0 || p > 65535) {
            err = "bad_port";
            return false;
        }
        ep.port = static_cast<uint16_t>(p);
    }
    if (host.empty()) { err = "missing_host"; return false; }

    ep.host = host;
    if (slash != std::string::npos) ep.base_path = base;
    return true;
}


// ---------------------------------------------------------------------------
// decode_servers()
// ----------------
// Accepted shapes:
//   {"servers":[{"index":0,"name":"Vantage","host":"10.0.0.5","port":3040}]}
//   [{"index":0,"name":"Vantage"}]        (older bridge)
//   ["Vantage","Backup"]                  (labels only)
// A missing "index" falls back to the array position.
// ---------------------------------------------------------------------------
bool decode_servers(const std::string& body, std::vector<ServerDescriptor>& out, Error& err) {
    out.clear();
    json j;
    if (!parse_json(body, j, err)) return false;

    const json* arr = &j;
    if (j.is_object()) {
        auto it = j.find("servers");
        if (it == j.end()) {
            err = make_error(ErrorKind::Protocol, "bad_body", "missing \"servers\"");
            return false;
        }
        arr = &*it;
    }
    if (!arr->is_array()) {
        err = make_error(ErrorKind::Protocol, "bad_body", "servers is not an array");
        return false;
    }

    int pos = 0;
    for (const auto& e : *arr) {
        ServerDescriptor sd;
        sd.index = pos;
        if (e.is_object()) {
            sd.index = as_int(e.value("index", json(pos)), pos);
            if (e.contains("name"))  sd.label = as_text(e["name"]);
            if (e.contains("host"))  sd.host  = as_text(e["host"]);
            if (e.contains("port"))  sd.port  = as_int(e["port"], 0);
        } else if (e.is_string()) {
            sd.label = e.get<std::string>();
        } else {
            err = make_error(ErrorKind::Protocol, "bad_body", "unexpected server entry: " + e.dump());
            return false;
        }
        out.push_back(sd);
        ++pos;
    }
    return true;
}

bool decode_message(const std::string& body, std::string& out, Error& err) {
    out.clear();
    if (body.empty()) return true;                 // some bridges answer 204-style
    json j;
    if (!parse_json(body, j, err)) return false;
    if (j.is_object() && j.contains("message")) out = as_text(j["message"]);
    else if (j.is_string())                     out = j.get<std::string>();
    return true;
}

bool decode_send_reply(const std::string& body, RawReply& out, Error& err) {
    json j;
    if (!parse_json(body, j, err)) return false;
    if (!j.is_object()) {
        err = make_error(ErrorKind::Protocol, "bad_body", "send reply is not an object");
        return false;
    }

    auto it = j.find("response");
    if (it == j.end() || it->is_null()) {          // nothing came back within maxMs
        out = std::string{};
        return true;
    }

    const json& r = *it;
    if (r.is_string()) {
        out = r.get<std::string>();
    } else if (r.is_array()) {
        Lines lines;
        for (const auto& e : r) {
            if (!e.is_string()) {
                err = make_error(ErrorKind::Protocol, "bad_body", "non-string reply element");
                return false;
            }
            lines.push_back(e.get<std::string>());
        }
        out = std::move(lines);
    } else if (r.is_object() && r.contains("text") && r["text"].is_string()) {
        out = r["text"].get<std::string>();        // {bytes,text,hex,base64}
    } else {
        err = make_error(ErrorKind::Protocol, "bad_body", "unsupported reply shape");
        return false;
    }
    return true;
}

bool decode_status(const std::string& body, BridgeStatus& out, Error& err) {
    out = BridgeStatus{};
    json j;
    if (!parse_json(body, j, err)) return false;
    if (!j.is_object()) {
        err = make_error(ErrorKind::Protocol, "bad_body", "status is not an object");
        return false;
    }
    auto c = j.find("connected");
    if (c != j.end()) {
        if (!c->is_boolean()) {
            err = make_error(ErrorKind::Protocol, "bad_body", "connected is not a boolean");
            return false;
        }
        out.connected = c->get<bool>();
    }
    auto it = j.find("server");
    if (it != j.end()) {
        if (it->is_object())      out.server = as_text(it->value("name", json("")));
        else if (it->is_string()) out.server = it->get<std::string>();
    }
    return true;
}

std::string encode_send_body(const std::string& command, uint32_t quiet_ms, uint32_t max_ms) {
    json j;
    j["message"] = command;
    j["command"] = command;
    j["quietMs"] = quiet_ms;
    j["maxMs"]   = max_ms;
    return j.dump();
}

Error error_from_status(int status, const std::string& body) {
    std::string msg;
    json j = json::parse(body, nullptr, false);
    if (!j.is_discarded() && j.is_object() && j.contains("message")) msg = as_text(j["message"]);
    else msg = log::preview(body, 120);

    std::string detail = "http " + std::to_string(status);
    if (!msg.empty()) detail += ": " + msg;

    if (status >= 500) return make_error(ErrorKind::Transport, "bridge_unavailable", detail);
    return make_error(ErrorKind::Protocol, "bridge_rejected", detail);
}


// ----- HttpBridge ------------------------------------------------------------

HttpBridge::HttpBridge(BridgeEndpoint ep) : ep_(std::move(ep)) {}

std::string HttpBridge::name() const {
    return "http://" + ep_.host + ":" + std::to_string(ep_.port) + ep_.base_path;
}

bool HttpBridge::call(const char* method, const char* route, const std::string& body,
                      std::string& resp_body, Error& err) {
    const std::string path = ep_.base_path + route;
    HttpResponse resp;
    std::string io_err;

    if (!http_request(ep_.host, ep_.port, method, path, body, resp, ep_.timeout_ms, io_err)) {
        err = make_error(ErrorKind::Transport, io_err, std::string(method) + " " + name() + route);
        return false;
    }
    log::debug(TAG, std::string(method) + " " + path + " -> " + std::to_string(resp.status));

    if (resp.status < 200 || resp.status > 299) {
        err = error_from_status(resp.status, resp.body);
        return false;
    }
    resp_body = std::move(resp.body);
    return true;
}

bool HttpBridge::list_servers(std::vector<ServerDescriptor>& out, Error& err) {
    std::string body;
    return call("GET", "/servers", "", body, err) && decode_servers(body, out, err);
}

bool HttpBridge::connect(int server_index, std::string& message, Error& err) {
    json j;
    j["serverIndex"] = server_index;
    std::string body;
    return call("POST", "/connect", j.dump(), body, err) && decode_message(body, message, err);
}

bool HttpBridge::send(const std::string& command, RawReply& reply, Error& err) {
    std::string body;
    return call("POST", "/send", encode_send_body(command, ep_.quiet_ms, ep_.max_ms), body, err) &&
           decode_send_reply(body, reply, err);
}

bool HttpBridge::disconnect(std::string& message, Error& err) {
    std::string body;
    return call("POST", "/disconnect", "{}", body, err) && decode_message(body, message, err);
}

bool HttpBridge::status(BridgeStatus& out, Error& err) {
    std::string body;
    return call("GET", "/status", "", body, err) && decode_status(body, out, err);
}

} // namespace qlink
