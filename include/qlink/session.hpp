#pragma once
/**
 * @file session.hpp
 * @brief One connected conversation with a bus server, released exactly once.
 *
 * A Session wraps an IBridge for the lifetime of one run:
 *
 *   Session s(bridge, 0, 120);
 *   if (s.open(err)) { s.send("VQM", reply, err); ... }
 *   // ~Session() disconnects if close() was not called.
 *
 * Rules:
 *  - send() before a successful open() is a Protocol error (`not_connected`)
 *    and never reaches the bridge.
 *  - Commands must pass is_valid_command(), else Protocol `bad_command`.
 *  - Consecutive sends are spaced by at least min_gap_ms.
 *  - Once open() has been attempted (even if it failed), or
 *    require_disconnect() was called, close() calls disconnect() exactly
 *    once. A failing disconnect is logged, not thrown.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "qlink/bridge.hpp"
#include "qlink/errors.hpp"
#include "qlink/reply.hpp"

namespace qlink {

/// Blocking wait in milliseconds. Tests swap in a recorder.
using SleepFn = std::function<void(uint32_t)>;

/// std::this_thread::sleep_for() behind a SleepFn.
void sleep_for_ms(uint32_t ms);

class Session {
public:
    Session(IBridge& bridge, int server_index, uint32_t min_gap_ms, SleepFn sleeper = sleep_for_ms);
    ~Session();

    Session(const Session&)            = delete;
    Session& operator=(const Session&) = delete;

    bool open(Error& err);

    /// Makes close() disconnect even though open() was never reached. Used
    /// when the run fails before connecting but the bridge may hold a link.
    void require_disconnect() { attempted_ = true; }
    bool send(const std::string& command, RawReply& reply, Error& err);

    /// Idempotent. Returns whether the disconnect (if one was due) succeeded.
    bool close();

    bool is_open() const { return connected_; }
    int  server_index() const { return server_index_; }

    const std::string& connect_message()    const { return connect_message_; }
    const std::string& disconnect_message() const { return disconnect_message_; }
    const Error&       disconnect_error()   const { return disconnect_error_; }

private:
    IBridge&    bridge_;
    int         server_index_;
    uint32_t    min_gap_ms_;
    SleepFn     sleep_;

    bool attempted_{false};    // open() called at least once
    bool connected_{false};
    bool closed_{false};
    bool disconnect_ok_{true};
    bool have_last_{false};
    std::chrono::steady_clock::time_point last_send_{};

    std::string connect_message_;
    std::string disconnect_message_;
    Error       disconnect_error_;
};

} // namespace qlink
