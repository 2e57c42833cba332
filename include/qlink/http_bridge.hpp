#pragma once
/**
 * @page ql-http-bridge HTTP Bridge Client
 * @file http_bridge.hpp
 * @brief IBridge over the bridge service's JSON/HTTP routes.
 *
 * @details
 * ROUTES
 * ------
 * | Call          | Request                                         | 2xx body                       |
 * |---------------|-------------------------------------------------|--------------------------------|
 * | list_servers  | GET  /servers                                   | {"servers":[...]} or [...]     |
 * | connect       | POST /connect    {"serverIndex":n}              | {"message":"..."}              |
 * | send          | POST /send       {"message","command",quietMs,maxMs} | {"response": ...}         |
 * | disconnect    | POST /disconnect                                | {"message":"..."}              |
 * | status        | GET  /status                                    | {"connected":b,"server":...}   |
 *
 * Older bridges read "message" from /send, newer ones read "command" plus the
 * quiet/max timing hints, so both are sent.
 *
 * ERROR MAPPING
 * -------------
 *  - socket, DNS, timeout, malformed HTTP   -> Transport
 *  - 5xx (bridge could not reach the bus)   -> Transport, reason "bridge_unavailable"
 *  - other non-2xx                          -> Protocol,  reason "bridge_rejected"
 *  - 2xx with a body we cannot decode       -> Protocol,  reason "bad_json" / "bad_body"
 * The bridge's own "message" text, when present, goes into Error::detail.
 *
 * The decode_* helpers are free functions so they can be tested on canned
 * bodies without a socket.
 */

#include <cstdint>
#include <string>
#include <vector>

#include "qlink/bridge.hpp"

namespace qlink {

struct BridgeEndpoint {
    std::string host{"localhost"};
    uint16_t    port{3000};
    std::string base_path;          ///< prefix for every route, no trailing '/'
    int         timeout_ms{5000};   ///< per request
    uint32_t    quiet_ms{300};      ///< /send hint: stop after this much bus silence
    uint32_t    max_ms{2000};       ///< /send hint: hard cap on reply collection
};

/**
 * @brief Parse "host", "host:port" or "http://host:port/base" into @p ep.
 * Fields not present in @p text are left as they are.
 */
bool parse_endpoint(const std::string& text, BridgeEndpoint& ep, std::string& err);

// ----- body decoders (no I/O) ----------------------------------------------

bool decode_servers(const std::string& body, std::vector<ServerDescriptor>& out, Error& err);

/// {"message": "..."} -> message. A body without "message" yields "".
bool decode_message(const std::string& body, std::string& out, Error& err);

/// {"response": string | [string...] | {"text": string} | null} -> RawReply.
bool decode_send_reply(const std::string& body, RawReply& out, Error& err);

bool decode_status(const std::string& body, BridgeStatus& out, Error& err);

/// JSON body for POST /send.
std::string encode_send_body(const std::string& command, uint32_t quiet_ms, uint32_t max_ms);

/// Map a non-2xx response to an Error (see ERROR MAPPING).
Error error_from_status(int status, const std::string& body);

class HttpBridge : public IBridge {
public:
    explicit HttpBridge(BridgeEndpoint ep);

    bool list_servers(std::vector<ServerDescriptor>& out, Error& err) override;
    bool connect(int server_index, std::string& message, Error& err) override;
    bool send(const std::string& command, RawReply& reply, Error& err) override;
    bool disconnect(std::string& message, Error& err) override;
    bool status(BridgeStatus& out, Error& err) override;

    std::string name() const override;

    const BridgeEndpoint& endpoint() const { return ep_; }

private:
    // One round-trip; false with err set on transport failure or non-2xx.
    bool call(const char* method, const char* route, const std::string& body,
              std::string& resp_body, Error& err);

    BridgeEndpoint ep_;
};

} // namespace qlink
