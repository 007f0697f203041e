#pragma once

#include "codec.hpp"
#include "udp_server.hpp"

#include "common/net_utils.hpp"
#include "common/sync.hpp"

#include <atomic>
#include <functional>
#include <optional>
#include <thread>

namespace vrb {

constexpr const char *mute_self_address = "/avatar/parameters/MuteSelf";

// returns the mute state if 'msg' is a "MuteSelf" avatar parameter message
std::optional<bool> match_mute_self(const osc_message& msg);

// Background OSC receiver. Can only be started once per instance;
// the receive thread runs until the object is destroyed or a socket
// error occurs. There is no way to restart it.
class osc_listener {
public:
    using mute_handler = std::function<void(bool muted)>;
    using error_handler = std::function<void(const socket_error& e)>;

    osc_listener() = default;
    ~osc_listener();

    osc_listener(const osc_listener&) = delete;
    osc_listener& operator=(const osc_listener&) = delete;

    // returns true if this call has actually started the listener
    bool start(const ip_address& bindaddr, mute_handler fn,
               error_handler err = nullptr);

    bool started() const {
        return started_.load(std::memory_order_acquire);
    }

    // true while the receive loop is active
    bool running() const {
        return server_.running();
    }

    int port() const {
        return server_.port();
    }

    void handle_packet(const VrbByte *data, VrbSize size, const ip_address& addr);
private:
    void run(const ip_address& bindaddr);

    std::atomic<bool> started_{false};
    sync::mutex mutex_;
    bool quit_ = false;
    udp_server server_;
    std::thread thread_;
    mute_handler mute_handler_;
    error_handler error_handler_;
};

} // vrb
