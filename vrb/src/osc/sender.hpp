#pragma once

#include "codec.hpp"

#include "common/net_utils.hpp"

#include <string>

namespace vrb {

// VRChat chatbox addresses
constexpr const char *chatbox_typing_address = "/chatbox/typing";
constexpr const char *chatbox_input_address = "/chatbox/input";

// Send a single OSC message from a fresh ephemeral UDP socket.
// Throws resolve_error or socket_error.
void osc_send(const std::string& host, port_type port, const osc_message& msg);

// /chatbox/typing T
void osc_send_typing(const std::string& host, port_type port);

// /chatbox/input <text> T
void osc_send_chatbox(const std::string& host, port_type port,
                      const std::string& text);

} // vrb
