#pragma once

#include "vrb/vrb_config.h"
#include "vrb/vrb_types.h"

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <sys/socket.h>
#include <netinet/in.h>
#include <errno.h>
#endif // _WIN32

namespace vrb {

namespace socket {

#ifdef _WIN32
using native_type = SOCKET;
constexpr native_type invalid = INVALID_SOCKET;
#else
using native_type = int;
constexpr native_type invalid = -1;
#endif

// WSAStartup() on Windows, no-op elsewhere
int init();

int get_last_error();

// system error message followed by the error number
std::string strerror(int err);

} // socket

class socket_error : public std::exception {
public:
    socket_error() = default;

    explicit socket_error(int err)
        : err_(err), msg_(socket::strerror(err)) {}

    socket_error(int err, std::string msg)
        : err_(err), msg_(std::move(msg)) {}

    const char* what() const noexcept override {
        return msg_.c_str();
    }

    int code() const { return err_; }
private:
    int err_ = 0;
    std::string msg_;
};

class resolve_error : public socket_error {
public:
    using socket_error::socket_error;
};

//-------------------- ip_address -----------------------//

using port_type = uint16_t;

class ip_address {
public:
    enum ip_type {
        Unspec,
        IPv4,
        IPv6
    };

    // throws resolve_error; never returns an empty list
    static std::vector<ip_address> resolve(std::string_view host, port_type port,
                                           ip_type type);

    ip_address() = default;

    ip_address(const sockaddr *sa, socklen_t len);

    // wildcard address of the given family
    ip_address(port_type port, ip_type type);

    // numeric hosts only, otherwise the address is invalid
    ip_address(std::string_view ip, port_type port, ip_type type = Unspec);

    bool operator==(const ip_address& other) const;

    bool operator!=(const ip_address& other) const {
        return !(*this == other);
    }

    void clear() { length_ = 0; storage_.ss_family = AF_UNSPEC; }

    bool valid() const { return length_ > 0; }

    ip_type type() const;

    // numeric host string, empty if invalid
    std::string name() const;

    port_type port() const;

    const sockaddr *address() const {
        return reinterpret_cast<const sockaddr *>(&storage_);
    }

    socklen_t length() const { return length_; }

    friend std::ostream& operator<<(std::ostream& os, const ip_address& addr);
private:
    friend class udp_socket;

    sockaddr *address_ptr() {
        return reinterpret_cast<sockaddr *>(&storage_);
    }

    sockaddr_storage storage_ {};
    socklen_t length_ = 0;
};

//-------------------- udp_socket -----------------------//

class udp_socket {
public:
    udp_socket() = default;

    // create and bind; throws socket_error
    explicit udp_socket(const ip_address& addr);

    ~udp_socket() { close(); }

    udp_socket(const udp_socket&) = delete;
    udp_socket& operator=(const udp_socket&) = delete;

    udp_socket(udp_socket&& other) noexcept
        : sock_(std::exchange(other.sock_, socket::invalid)) {}

    udp_socket& operator=(udp_socket&& other) noexcept {
        if (this != &other) {
            close();
            sock_ = std::exchange(other.sock_, socket::invalid);
        }
        return *this;
    }

    bool is_open() const { return sock_ != socket::invalid; }

    void close() noexcept;

    // the bound address; throws socket_error
    ip_address address() const;

    port_type port() const { return address().port(); }

    // throws socket_error
    int send(const void *buf, int size, const ip_address& addr);

    // blocks until a packet arrives; throws socket_error
    int receive(void *buf, int size, ip_address& from);

    // returns {false, 0} on timeout; throws socket_error
    std::pair<bool, int> receive(void *buf, int size, ip_address& from,
                                 double timeout);

    // wake up a blocking receive() with an empty packet to ourselves
    bool signal() noexcept;
private:
    socket::native_type sock_ = socket::invalid;
};

} // vrb
