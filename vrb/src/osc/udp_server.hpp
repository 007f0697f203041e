#pragma once

#include "common/net_utils.hpp"

#include <atomic>
#include <functional>
#include <vector>

namespace vrb {

// socket errors raised by udp_server
class udp_error : public socket_error {
public:
    using socket_error::socket_error;

    udp_error(const socket_error& e)
        : socket_error(e) {}
};

// Blocking UDP receive loop. start() binds the socket, run() hands
// every non-empty datagram to the receive handler until stop() is
// called or the socket fails.
class udp_server {
public:
    // larger datagrams are truncated by the OS
    static constexpr size_t max_packet_size = 65536;

    using receive_handler = std::function<void(const VrbByte *data, VrbSize size,
                                               const ip_address& from)>;

    udp_server() = default;
    ~udp_server();

    udp_server(const udp_server&) = delete;
    udp_server& operator=(const udp_server&) = delete;

    // throws udp_error
    void start(const ip_address& bindaddr, receive_handler fn);

    // throws udp_error
    void run();

    // can be called from any thread
    void stop();

    bool running() const {
        return running_.load(std::memory_order_relaxed);
    }

    const ip_address& address() const { return bind_addr_; }

    int port() const { return bind_addr_.port(); }
private:
    bool receive_one();

    udp_socket socket_;
    ip_address bind_addr_;
    std::atomic<bool> running_{false};
    std::vector<VrbByte> buffer_;
    receive_handler handler_;
};

} // vrb
