#include "vrb/vrb.h"
#include "vrb/vrb_bridge.hpp"

#include "vrb/src/osc/codec.hpp"
#include "vrb/src/osc/sender.hpp"
#include "common/net_utils.hpp"

#include <cstring>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

using namespace vrb;

#define CHECK(cond) \
    do { \
        if (!(cond)) { \
            std::cout << "FAILED: " #cond " (line " << __LINE__ << ")" << std::endl; \
            return EXIT_FAILURE; \
        } \
    } while (false)

// the default VRChat OSC input port
const port_type vrchat_port = 9000;

std::optional<osc_message> receive_message(udp_socket& sock, double timeout = 2.0) {
    VrbByte buf[VRB_MAX_PACKET_SIZE];
    ip_address from;
    try {
        auto [success, size] = sock.receive(buf, sizeof(buf), from, timeout);
        if (!success) {
            std::cout << "  receive timed out" << std::endl;
            return std::nullopt;
        }
        auto msg = osc_decode(buf, size);
        std::cout << "  received " << msg << " from " << from << std::endl;
        return msg;
    } catch (const socket_error& e) {
        std::cout << "  socket error: " << e.what() << std::endl;
    } catch (const osc_error& e) {
        std::cout << "  osc error: " << e.what() << std::endl;
    }
    return std::nullopt;
}

int main(int argc, char *argv[])
{
    VrbSettings settings = VRB_SETTINGS_INIT();
    vrb_initialize(&settings);

    udp_socket peer;
    try {
        peer = udp_socket(ip_address("127.0.0.1", vrchat_port, ip_address::IPv4));
    } catch (const socket_error& e) {
        std::cout << "could not bind to port " << vrchat_port << ": "
                  << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    // sender module
    {
        std::cout << "osc_send_chatbox" << std::endl;
        osc_send_chatbox("127.0.0.1", vrchat_port, "hello");
        auto msg = receive_message(peer);
        CHECK(msg);
        osc_message expected { "/chatbox/input", { std::string("hello"), true } };
        CHECK(*msg == expected);
    }

    {
        std::cout << "osc_send_typing" << std::endl;
        osc_send_typing("127.0.0.1", vrchat_port);
        auto msg = receive_message(peer);
        CHECK(msg);
        CHECK(msg->address == "/chatbox/typing");
        CHECK(msg->arguments.size() == 1);
        CHECK(msg->bool_argument(0) && *msg->bool_argument(0) == true);
    }

    // through the bridge
    auto bridge = VrbBridge::create();
    CHECK(bridge);

    {
        std::cout << "sendMessage" << std::endl;
        VrbErrorInfo info;
        CHECK(bridge->sendMessage("grüße, world", "127.0.0.1", vrchat_port, &info) == kVrbOk);
        CHECK(info.code == kVrbOk);
        auto msg = receive_message(peer);
        CHECK(msg);
        CHECK(msg->address == "/chatbox/input");
        CHECK(std::get<std::string>(msg->arguments[0]) == "grüße, world");
        CHECK(*msg->bool_argument(1));
    }

    {
        std::cout << "sendTyping" << std::endl;
        CHECK(bridge->sendTyping("127.0.0.1", vrchat_port, nullptr) == kVrbOk);
        auto msg = receive_message(peer);
        CHECK(msg);
        CHECK(msg->address == "/chatbox/typing");
    }

    {
        std::cout << "bad arguments" << std::endl;
        VrbErrorInfo info;
        CHECK(bridge->sendTyping("127.0.0.1", 0, &info) == kVrbErrorBadArgument);
        CHECK(info.code == kVrbErrorBadArgument);
        std::cout << "  " << info.message << std::endl;
        CHECK(bridge->sendMessage("hello", "127.0.0.1", 70000, &info) == kVrbErrorBadArgument);
        CHECK(bridge->sendMessage(nullptr, "127.0.0.1", vrchat_port, &info) == kVrbErrorBadArgument);
    }

    {
        std::cout << "unresolvable host" << std::endl;
        VrbErrorInfo info;
        CHECK(bridge->sendTyping("no.such.host.invalid", vrchat_port, &info) == kVrbErrorSocket);
        CHECK(info.code == kVrbErrorSocket);
        CHECK(strlen(info.message) > 0);
        std::cout << "  " << info.message << std::endl;
    }

    bridge.reset();

    std::cout << "all tests passed" << std::endl;

    vrb_terminate();

    return EXIT_SUCCESS;
}
