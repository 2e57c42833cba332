#pragma once
// Scripted IBridge for builder/session tests. Replies are keyed by exact
// command text; an unscripted command gets an empty string reply.

#include <map>
#include <string>
#include <vector>

#include "qlink/bridge.hpp"

struct FakeBridge : qlink::IBridge {
    std::map<std::string, qlink::RawReply> replies;
    std::map<std::string, qlink::Error>    send_errors;   // command -> error to return
    std::vector<qlink::ServerDescriptor>   servers;

    qlink::Error list_error;         // kind None = list_servers succeeds
    qlink::Error connect_error;      // kind None = connect succeeds
    qlink::Error disconnect_error;   // kind None = disconnect succeeds

    std::vector<std::string> sent;
    int connect_calls    = 0;
    int disconnect_calls = 0;
    int last_index       = -1;
    bool connected       = false;

    bool list_servers(std::vector<qlink::ServerDescriptor>& out, qlink::Error& err) override {
        if (!list_error.ok()) { err = list_error; return false; }
        out = servers;
        return true;
    }

    bool connect(int server_index, std::string& message, qlink::Error& err) override {
        ++connect_calls;
        last_index = server_index;
        if (!connect_error.ok()) { err = connect_error; return false; }
        connected = true;
        message = "Connected to server " + std::to_string(server_index) + ".";
        return true;
    }

    bool send(const std::string& command, qlink::RawReply& reply, qlink::Error& err) override {
        sent.push_back(command);
        auto e = send_errors.find(command);
        if (e != send_errors.end()) { err = e->second; return false; }
        auto it = replies.find(command);
        reply = it != replies.end() ? it->second : qlink::RawReply{std::string{}};
        return true;
    }

    bool disconnect(std::string& message, qlink::Error& err) override {
        ++disconnect_calls;
        if (!disconnect_error.ok()) { err = disconnect_error; return false; }
        message = connected ? "Disconnected." : "Already disconnected.";
        connected = false;
        return true;
    }

    bool status(qlink::BridgeStatus& out, qlink::Error&) override {
        out.connected = connected;
        out.server    = connected ? "fake" : "";
        return true;
    }

    std::string name() const override { return "fake"; }

    // Count how many times @p command was sent.
    int count(const std::string& command) const {
        int n = 0;
        for (const auto& s : sent) if (s == command) ++n;
        return n;
    }
};
