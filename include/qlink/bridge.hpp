#pragma once
/**
 * @file bridge.hpp
 * @brief Abstract bridge contract consumed by the session and topology layers.
 *
 * The real implementation speaks HTTP (http_bridge.hpp); tests script a fake.
 * Nothing above this interface knows which one it is talking to.
 *
 * Contract:
 *  - list_servers() has no side effects beyond the request.
 *  - connect(i) opens the upstream session for server i.
 *  - send(cmd) returns the raw reply; no retries, failures surface at once.
 *  - disconnect() closes the upstream session; "already disconnected" is success.
 *  - status() reports the bridge's own view of the connection.
 * Every call returns false and fills @p err (Transport or Protocol) on failure.
 */

#include <string>
#include <vector>

#include "qlink/errors.hpp"
#include "qlink/reply.hpp"

namespace qlink {

struct ServerDescriptor {
    int         index{0};   ///< position used to address connect()
    std::string label;      ///< bridge's display name
    std::string host;       ///< optional, empty when not reported
    int         port{0};    ///< optional, 0 when not reported
};

struct BridgeStatus {
    bool        connected{false};
    std::string server;     ///< label of the connected server, empty if none
};

class IBridge {
public:
    virtual ~IBridge() = default;

    virtual bool list_servers(std::vector<ServerDescriptor>& out, Error& err) = 0;
    virtual bool connect(int server_index, std::string& message, Error& err) = 0;
    virtual bool send(const std::string& command, RawReply& reply, Error& err) = 0;
    virtual bool disconnect(std::string& message, Error& err) = 0;
    virtual bool status(BridgeStatus& out, Error& err) = 0;

    /// Short identifier for logs ("http://localhost:3000", "fake").
    virtual std::string name() const = 0;
};

} // namespace qlink
