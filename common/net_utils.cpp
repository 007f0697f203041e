/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#include "net_utils.hpp"
#include "log.hpp"

#ifndef _WIN32
#include <arpa/inet.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#endif

#include <algorithm>
#include <cstdio>
#include <cstring>

namespace vrb {

//------------------------ socket ----------------------------//

namespace socket {

int init() {
#ifdef _WIN32
    static bool initialized = [](){
        WSADATA wsadata;
        return WSAStartup(MAKEWORD(2, 2), &wsadata) == 0;
    }();
    return initialized ? 0 : -1;
#else
    return 0;
#endif
}

int get_last_error() {
#ifdef _WIN32
    return WSAGetLastError();
#else
    return errno;
#endif
}

std::string strerror(int err) {
    char buf[512];
#ifdef _WIN32
    auto len = FormatMessageA(FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                              nullptr, err, MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
                              buf, sizeof(buf), nullptr);
    // strip trailing line break
    while (len > 0 && (buf[len - 1] == '\n' || buf[len - 1] == '\r')) {
        len--;
    }
    std::string msg(buf, len);
#else
    std::string msg(::strerror(err));
#endif
    snprintf(buf, sizeof(buf), " [%d]", err);
    return msg + buf;
}

static void close_native(native_type sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    ::close(sock);
#endif
}

} // socket

//------------------------ ip_address ------------------------//

namespace {

int to_family(ip_address::ip_type type) {
    switch (type) {
    case ip_address::IPv4:
        return AF_INET;
    case ip_address::IPv6:
        return AF_INET6;
    default:
#if VRB_USE_IPV6
        return AF_UNSPEC;
#else
        return AF_INET;
#endif
    }
}

// call getaddrinfo() and hand every result to 'fn'; returns the error code
template<typename Fn>
int get_addresses(const std::string& host, port_type port, int family,
                  int flags, Fn&& fn) {
    addrinfo hints {};
    hints.ai_family = family;
    hints.ai_socktype = SOCK_DGRAM;
    hints.ai_flags = AI_NUMERICSERV | flags;

    auto service = std::to_string(port);
    addrinfo *list = nullptr;
    auto err = getaddrinfo(host.c_str(), service.c_str(), &hints, &list);
    if (err == 0) {
        for (auto ai = list; ai; ai = ai->ai_next) {
            fn(ai->ai_addr, static_cast<socklen_t>(ai->ai_addrlen));
        }
        freeaddrinfo(list);
    }
    return err;
}

} // namespace

std::vector<ip_address> ip_address::resolve(std::string_view host, port_type port,
                                            ip_type type) {
    if (host.empty()) {
        throw resolve_error(0, "empty host name");
    }
    std::vector<ip_address> result;
    auto err = get_addresses(std::string(host), port, to_family(type), 0,
        [&](const sockaddr *sa, socklen_t len) {
            ip_address addr(sa, len);
            if (std::find(result.begin(), result.end(), addr) == result.end()) {
                result.push_back(addr);
            }
        });
    if (err != 0) {
#ifdef _WIN32
        auto e = WSAGetLastError();
        throw resolve_error(e, socket::strerror(e));
#else
        if (err == EAI_SYSTEM) {
            throw resolve_error(errno, socket::strerror(errno));
        }
        throw resolve_error(err, gai_strerror(err));
#endif
    }
    if (result.empty()) {
        throw resolve_error(0, "no address found for " + std::string(host));
    }
    return result;
}

ip_address::ip_address(const sockaddr *sa, socklen_t len) {
    if (sa && len > 0 && len <= (socklen_t)sizeof(storage_)) {
        memcpy(&storage_, sa, len);
        length_ = len;
    }
}

ip_address::ip_address(port_type port, ip_type type) {
    if (type == IPv6) {
#if VRB_USE_IPV6
        auto sin6 = reinterpret_cast<sockaddr_in6 *>(&storage_);
        sin6->sin6_family = AF_INET6;
        sin6->sin6_port = htons(port);
        length_ = sizeof(sockaddr_in6);
#endif
    } else {
        auto sin = reinterpret_cast<sockaddr_in *>(&storage_);
        sin->sin_family = AF_INET;
        sin->sin_port = htons(port);
        length_ = sizeof(sockaddr_in);
    }
}

ip_address::ip_address(std::string_view ip, port_type port, ip_type type) {
    if (ip.empty()) {
        return;
    }
    // AI_NUMERICHOST makes sure we never block on DNS
    get_addresses(std::string(ip), port, to_family(type), AI_NUMERICHOST,
        [this](const sockaddr *sa, socklen_t len) {
            if (!valid()) {
                *this = ip_address(sa, len);
            }
        });
}

bool ip_address::operator==(const ip_address& other) const {
    if (type() != other.type() || port() != other.port()) {
        return false;
    }
    switch (storage_.ss_family) {
    case AF_INET:
        return reinterpret_cast<const sockaddr_in *>(&storage_)->sin_addr.s_addr
            == reinterpret_cast<const sockaddr_in *>(&other.storage_)->sin_addr.s_addr;
    case AF_INET6:
        return !memcmp(&reinterpret_cast<const sockaddr_in6 *>(&storage_)->sin6_addr,
                       &reinterpret_cast<const sockaddr_in6 *>(&other.storage_)->sin6_addr,
                       sizeof(in6_addr));
    default:
        return !valid() && !other.valid();
    }
}

ip_address::ip_type ip_address::type() const {
    if (!valid()) {
        return Unspec;
    }
    switch (storage_.ss_family) {
    case AF_INET:
        return IPv4;
    case AF_INET6:
        return IPv6;
    default:
        return Unspec;
    }
}

std::string ip_address::name() const {
    char host[256];
    if (valid() && getnameinfo(address(), length_, host, sizeof(host),
                               nullptr, 0, NI_NUMERICHOST) == 0) {
        return host;
    }
    return {};
}

port_type ip_address::port() const {
    switch (type()) {
    case IPv4:
        return ntohs(reinterpret_cast<const sockaddr_in *>(&storage_)->sin_port);
    case IPv6:
        return ntohs(reinterpret_cast<const sockaddr_in6 *>(&storage_)->sin6_port);
    default:
        return 0;
    }
}

std::ostream& operator<<(std::ostream& os, const ip_address& addr) {
    switch (addr.type()) {
    case ip_address::IPv4:
        return os << addr.name() << ":" << addr.port();
    case ip_address::IPv6:
        return os << "[" << addr.name() << "]:" << addr.port();
    default:
        return os << "[invalid]";
    }
}

//------------------------ udp_socket -------------------------//

udp_socket::udp_socket(const ip_address& addr) {
    if (!addr.valid()) {
        throw socket_error(0, "invalid bind address");
    }
    auto sock = ::socket(addr.address()->sa_family, SOCK_DGRAM, 0);
    if (sock == socket::invalid) {
        throw socket_error(socket::get_last_error());
    }
    // NB: no SO_REUSEADDR, binding to a taken port must fail
    if (::bind(sock, addr.address(), addr.length()) != 0) {
        auto err = socket::get_last_error();
        socket::close_native(sock);
        throw socket_error(err);
    }
    sock_ = sock;
}

void udp_socket::close() noexcept {
    if (sock_ != socket::invalid) {
        socket::close_native(sock_);
        sock_ = socket::invalid;
    }
}

ip_address udp_socket::address() const {
    ip_address addr;
    socklen_t len = sizeof(addr.storage_);
    if (::getsockname(sock_, addr.address_ptr(), &len) != 0) {
        throw socket_error(socket::get_last_error());
    }
    addr.length_ = len;
    return addr;
}

int udp_socket::send(const void *buf, int size, const ip_address& addr) {
    auto ret = ::sendto(sock_, static_cast<const char *>(buf), size, 0,
                        addr.address(), addr.length());
    if (ret < 0) {
        throw socket_error(socket::get_last_error());
    }
    return ret;
}

int udp_socket::receive(void *buf, int size, ip_address& from) {
    socklen_t len = sizeof(from.storage_);
    auto ret = ::recvfrom(sock_, static_cast<char *>(buf), size, 0,
                          from.address_ptr(), &len);
    if (ret < 0) {
        from.clear();
        throw socket_error(socket::get_last_error());
    }
    from.length_ = len;
    return ret;
}

std::pair<bool, int> udp_socket::receive(void *buf, int size, ip_address& from,
                                         double timeout) {
    pollfd p {};
    p.fd = sock_;
    p.events = POLLIN;
#ifdef _WIN32
    auto result = WSAPoll(&p, 1, static_cast<int>(timeout * 1000));
#else
    auto result = ::poll(&p, 1, static_cast<int>(timeout * 1000));
#endif
    if (result < 0) {
        throw socket_error(socket::get_last_error());
    } else if (result == 0) {
        return { false, 0 };
    }
    return { true, receive(buf, size, from) };
}

bool udp_socket::signal() noexcept {
    try {
        auto addr = address();
        auto loopback = addr.type() == ip_address::IPv6 ? "::1" : "127.0.0.1";
        send(nullptr, 0, ip_address(loopback, addr.port(), addr.type()));
        return true;
    } catch (const socket_error& e) {
        LOG_WARNING("udp_socket: could not signal: " << e.what());
        return false;
    }
}

} // vrb
