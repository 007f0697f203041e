#include "sender.hpp"

#include "common/log.hpp"

namespace vrb {

void osc_send(const std::string& host, port_type port, const osc_message& msg) {
    auto buf = osc_encode(msg);

    // the first result wins; resolve() never returns an empty list
    auto addr = ip_address::resolve(host, port, ip_address::Unspec).front();

    // bind to an ephemeral port of the same address family
    udp_socket sock(ip_address(0, addr.type()));
    sock.send(buf.data(), buf.size(), addr);

    LOG_DEBUG("osc_send: sent " << msg << " to " << addr);
}

void osc_send_typing(const std::string& host, port_type port) {
    osc_message msg;
    msg.address = chatbox_typing_address;
    msg.arguments.emplace_back(true);
    osc_send(host, port, msg);
}

void osc_send_chatbox(const std::string& host, port_type port,
                      const std::string& text) {
    osc_message msg;
    msg.address = chatbox_input_address;
    msg.arguments.emplace_back(text);
    msg.arguments.emplace_back(true);
    osc_send(host, port, msg);
}

} // vrb
