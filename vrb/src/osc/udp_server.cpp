#include "udp_server.hpp"

#include "common/log.hpp"

namespace vrb {

udp_server::~udp_server() {
    stop();
}

void udp_server::start(const ip_address& bindaddr, receive_handler fn) {
    try {
        socket_ = udp_socket(bindaddr);
        bind_addr_ = socket_.address();
    } catch (const socket_error& e) {
        socket_.close();
        bind_addr_.clear();
        throw udp_error(e);
    }
    buffer_.resize(max_packet_size);
    handler_ = std::move(fn);
    running_.store(true);
}

void udp_server::run() {
    while (running_.load() && receive_one()) {}
}

void udp_server::stop() {
    if (running_.exchange(false) && !socket_.signal()) {
        // last resort, closing a socket that another thread is
        // blocking on is not portable
        socket_.close();
    }
}

// returns false when the loop should end
bool udp_server::receive_one() {
    ip_address from;
    int size = 0;
    try {
        size = socket_.receive(buffer_.data(), (int)buffer_.size(), from);
    } catch (const socket_error& e) {
#ifdef _WIN32
        // ICMP port unreachable from a previous send
        if (e.code() == WSAECONNRESET) {
            return true;
        }
#else
        if (e.code() == EINTR) {
            return true;
        }
#endif
        if (!running_.exchange(false)) {
            // socket was closed by stop()
            return false;
        }
        throw udp_error(e);
    }
    // empty packets are wakeup signals
    if (size > 0 && running_.load()) {
        handler_(buffer_.data(), size, from);
    }
    return true;
}

} // vrb
