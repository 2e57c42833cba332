// ============================================================================
// session.cpp - implementation for qlink/session.hpp
// ============================================================================

#include "qlink/session.hpp"

#include "qlink/commands.hpp"     // is_valid_command()
#include "qlink/log.hpp"
#include "qlink/normalizer.hpp"   // describe()

#include <thread>
#include <utility>

namespace qlink {

static const char* TAG = "session";

void sleep_for_ms(uint32_t ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

Session::Session(IBridge& bridge, int server_index, uint32_t min_gap_ms, SleepFn sleeper)
    : bridge_(bridge),
      server_index_(server_index),
      min_gap_ms_(min_gap_ms),
      sleep_(sleeper ? std::move(sleeper) : SleepFn(sleep_for_ms)) {}

Session::~Session() {
    close();
}

bool Session::open(Error& err) {
    if (connected_) return true;
    attempted_ = true;

    log::info(TAG, "connecting to server " + std::to_string(server_index_) + " via " + bridge_.name());
    if (!bridge_.connect(server_index_, connect_message_, err)) {
        log::error(TAG, "connect failed: " + err.to_line());
        return false;
    }
    connected_ = true;
    log::info(TAG, "connected: " + connect_message_);
    return true;
}

// ---------------------------------------------------------------------------
// send()
// ------
// Pacing: the gap is measured from the previous send's return, so a slow
// bridge reply already counts toward it.
// ---------------------------------------------------------------------------
bool Session::send(const std::string& command, RawReply& reply, Error& err) {
    if (!connected_) {
        err = make_error(ErrorKind::Protocol, "not_connected", command);
        return false;
    }
    if (!is_valid_command(command)) {
        err = make_error(ErrorKind::Protocol, "bad_command", command);
        return false;
    }

    if (have_last_ && min_gap_ms_ > 0) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - last_send_).count();
        if (elapsed < static_cast<long long>(min_gap_ms_))
            sleep_(static_cast<uint32_t>(min_gap_ms_ - elapsed));
    }

    log::debug(TAG, "send " + command);
    bool ok = bridge_.send(command, reply, err);
    last_send_ = std::chrono::steady_clock::now();
    have_last_ = true;

    if (!ok) {
        log::error(TAG, "send '" + command + "' failed: " + err.to_line());
        return false;
    }
    log::debug(TAG, "reply " + log::preview(describe(reply)));
    return true;
}

bool Session::close() {
    if (closed_) return disconnect_ok_;
    closed_ = true;
    if (!attempted_) return true;

    disconnect_ok_ = bridge_.disconnect(disconnect_message_, disconnect_error_);
    connected_ = false;
    if (disconnect_ok_) log::info(TAG, "disconnected: " + disconnect_message_);
    else                log::warn(TAG, "disconnect failed: " + disconnect_error_.to_line());
    return disconnect_ok_;
}

} // namespace qlink
