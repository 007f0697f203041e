#include "vrb/vrb.h"
#include "vrb/vrb_bridge.hpp"

#include "vrb/src/bridge.hpp"
#include "vrb/src/realtime/client.hpp"
#include "common/sync.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/system/system_error.hpp>

#include <cstring>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <new>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using namespace vrb;

#define CHECK(cond) \
    do { \
        if (!(cond)) { \
            std::cout << "FAILED: " #cond " (line " << __LINE__ << ")" << std::endl; \
            return EXIT_FAILURE; \
        } \
    } while (false)

//------------------------ test server -----------------------//

// accepts a single connection and runs 'fn' on a background thread
struct test_server {
    using session_fn = std::function<void(tcp::socket&)>;

    test_server()
        : acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {}

    ~test_server() {
        join();
    }

    unsigned short port() const {
        return acceptor.local_endpoint().port();
    }

    std::string url() const {
        return "ws://127.0.0.1:" + std::to_string(port()) + "/realtime?model=%s";
    }

    void run(session_fn fn) {
        thread = std::thread([this, fn]() {
            try {
                tcp::socket sock(ioc);
                acceptor.accept(sock);
                fn(sock);
            } catch (const std::exception& e) {
                std::cout << "  server: " << e.what() << std::endl;
            }
        });
    }

    void join() {
        if (thread.joinable()) {
            thread.join();
        }
    }

    net::io_context ioc;
    tcp::acceptor acceptor;
    std::thread thread;
};

// the upgrade request as seen by the server
struct request_info {
    std::string target;
    std::string authorization;
    std::string beta;
};

websocket::stream<tcp::socket> accept_websocket(tcp::socket& sock, request_info& info) {
    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    http::read(sock, buffer, req);
    info.target = std::string(req.target());
    info.authorization = std::string(req[http::field::authorization]);
    info.beta = std::string(req["OpenAI-Beta"]);

    websocket::stream<tcp::socket> ws(std::move(sock));
    ws.accept(req);
    return ws;
}

// read text frames until the client closes the connection
std::vector<std::string> read_until_closed(websocket::stream<tcp::socket>& ws) {
    std::vector<std::string> frames;
    for (;;) {
        beast::flat_buffer buffer;
        beast::error_code ec;
        ws.read(buffer, ec);
        if (ec) {
            if (ec != websocket::error::closed) {
                std::cout << "  server: read error: " << ec.message() << std::endl;
            }
            break;
        }
        frames.push_back(beast::buffers_to_string(buffer.data()));
    }
    return frames;
}

//------------------------ event collector -----------------------//

struct collector : realtime_listener {
    using event = std::pair<std::string, std::string>;

    void on_message(std::string_view text) override {
        if (client) {
            // must be refused on the network thread
            try {
                client->send("nested");
            } catch (const realtime_error& e) {
                sync::scoped_lock<sync::mutex> lock(mutex);
                nested_error = e.code();
            }
        }
        push({ "message", std::string(text) });
    }

    void on_close() override {
        push({ "close", "" });
    }

    void on_error(VrbError code, const std::string& msg) override {
        push({ "error", msg });
    }

    void push(event e) {
        {
            sync::scoped_lock<sync::mutex> lock(mutex);
            events.push_back(std::move(e));
        }
        semaphore.post();
    }

    std::vector<event> get() {
        sync::scoped_lock<sync::mutex> lock(mutex);
        return events;
    }

    bool wait(double timeout = 2.0) {
        return semaphore.wait_for(timeout);
    }

    sync::mutex mutex;
    std::vector<event> events;
    sync::semaphore semaphore;
    realtime_client *client = nullptr;
    VrbError nested_error = kVrbOk;
};

template<typename Fn>
VrbError error_code_of(Fn&& fn) {
    try {
        fn();
        return kVrbOk;
    } catch (const realtime_error& e) {
        std::cout << "  realtime_error: " << e.what() << std::endl;
        return e.code();
    }
}

//------------------------ tests -----------------------//

int test_url() {
    std::cout << "URL parsing" << std::endl;

    auto url = format_realtime_url(VRB_REALTIME_URL, "qwen-omni");
    CHECK(url == "wss://dashscope.aliyuncs.com/api-ws/v1/realtime?model=qwen-omni");

    auto ep = parse_realtime_url(url);
    CHECK(ep.secure);
    CHECK(ep.host == "dashscope.aliyuncs.com");
    CHECK(ep.port == "443");
    CHECK(ep.target == "/api-ws/v1/realtime?model=qwen-omni");
    CHECK(ep.host_header() == "dashscope.aliyuncs.com");

    ep = parse_realtime_url("ws://user:pw@localhost:8080?model=x#frag");
    CHECK(!ep.secure);
    CHECK(ep.host == "localhost");
    CHECK(ep.port == "8080");
    CHECK(ep.target == "/?model=x");
    CHECK(ep.host_header() == "localhost:8080");

    ep = parse_realtime_url("WS://[::1]/rt");
    CHECK(ep.ipv6);
    CHECK(ep.host == "::1");
    CHECK(ep.port == "80");
    CHECK(ep.target == "/rt");
    CHECK(ep.host_header() == "[::1]");

    for (auto bad : { "dashscope.aliyuncs.com/realtime", "http://host/",
                      "wss:///path", "wss://host:99999/", "wss://host:12ab/",
                      "wss://[::1/" }) {
        CHECK(error_code_of([&]() { parse_realtime_url(bad); }) == kVrbErrorHandshake);
    }

    return EXIT_SUCCESS;
}

int test_not_connected() {
    std::cout << "not connected" << std::endl;
    collector events;
    realtime_client client(events);
    CHECK(!client.connected());
    CHECK(error_code_of([&]() { client.send("x"); }) == kVrbErrorNotConnected);
    CHECK(error_code_of([&]() { client.close(); }) == kVrbErrorNotConnected);
    CHECK(error_code_of([&]() { client.connect("", "model"); }) == kVrbErrorBadArgument);
    CHECK(error_code_of([&]() { client.connect("key", ""); }) == kVrbErrorBadArgument);
    client.set_url_template("http://127.0.0.1/%s");
    CHECK(error_code_of([&]() { client.connect("key", "model"); }) == kVrbErrorHandshake);
    CHECK(!client.connected());
    return EXIT_SUCCESS;
}

int test_session() {
    std::cout << "session" << std::endl;

    test_server server;
    request_info request;
    std::vector<std::string> frames;
    server.run([&](tcp::socket& sock) {
        auto ws = accept_websocket(sock, request);
        ws.text(true);
        ws.write(net::buffer(std::string("welcome")));
        frames = read_until_closed(ws);
    });

    collector events;
    realtime_client client(events);
    client.set_url_template(server.url());
    events.client = &client;

    CHECK(error_code_of([&]() { client.connect("secret", "qwen-test"); }) == kVrbOk);
    CHECK(client.connected());

    std::cout << "inbound text" << std::endl;
    CHECK(events.wait());
    auto list = events.get();
    CHECK(list.size() == 1);
    CHECK(list[0].first == "message");
    CHECK(list[0].second == "welcome");
    {
        sync::scoped_lock<sync::mutex> lock(events.mutex);
        CHECK(events.nested_error == kVrbErrorNotPermitted);
    }

    std::cout << "frame ordering" << std::endl;
    CHECK(error_code_of([&]() { client.send("x"); }) == kVrbOk);

    // a failed handshake leaves the current connection alone
    std::cout << "handshake failure" << std::endl;
    {
        tcp::acceptor tmp(server.ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        auto port = tmp.local_endpoint().port();
        tmp.close();
        client.set_url_template("ws://127.0.0.1:" + std::to_string(port) + "/%s");
        CHECK(error_code_of([&]() { client.connect("secret", "qwen-test"); }) == kVrbErrorHandshake);
        CHECK(client.connected());
    }

    CHECK(error_code_of([&]() { client.send("y"); }) == kVrbOk);

    std::cout << "close" << std::endl;
    CHECK(error_code_of([&]() { client.close(); }) == kVrbOk);
    CHECK(!client.connected());
    CHECK(error_code_of([&]() { client.send("z"); }) == kVrbErrorNotConnected);
    CHECK(error_code_of([&]() { client.close(); }) == kVrbErrorNotConnected);

    server.join();

    CHECK(request.target == "/realtime?model=qwen-test");
    CHECK(request.authorization == "Bearer secret");
    CHECK(request.beta == "realtime=v1");
    CHECK(frames == (std::vector<std::string> { "x", "y" }));

    return EXIT_SUCCESS;
}

int test_rejected() {
    std::cout << "rejected upgrade" << std::endl;

    test_server server;
    server.run([](tcp::socket& sock) {
        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        http::read(sock, buffer, req);
        http::response<http::string_body> res(http::status::unauthorized, req.version());
        res.body() = "invalid API key";
        res.prepare_payload();
        http::write(sock, res);
    });

    collector events;
    realtime_client client(events);
    client.set_url_template(server.url());
    CHECK(error_code_of([&]() { client.connect("wrong", "qwen-test"); }) == kVrbErrorHandshake);
    CHECK(!client.connected());
    CHECK(error_code_of([&]() { client.send("x"); }) == kVrbErrorNotConnected);
    server.join();
    CHECK(events.get().empty());

    return EXIT_SUCCESS;
}

int test_remote_close() {
    std::cout << "remote close" << std::endl;

    test_server server;
    server.run([](tcp::socket& sock) {
        request_info request;
        auto ws = accept_websocket(sock, request);
        ws.close(websocket::close_code::normal);
    });

    collector events;
    realtime_client client(events);
    client.set_url_template(server.url());
    CHECK(error_code_of([&]() { client.connect("secret", "qwen-test"); }) == kVrbOk);

    CHECK(events.wait());
    auto list = events.get();
    CHECK(list.size() == 1);
    CHECK(list[0].first == "close");
    // the connection state has been cleared
    CHECK(!client.connected());
    CHECK(error_code_of([&]() { client.send("x"); }) == kVrbErrorNotConnected);
    server.join();

    return EXIT_SUCCESS;
}

int test_read_error() {
    std::cout << "read error" << std::endl;

    test_server server;
    server.run([](tcp::socket& sock) {
        request_info request;
        auto ws = accept_websocket(sock, request);
        // drop the TCP connection without a close frame
        beast::error_code ec;
        ws.next_layer().shutdown(tcp::socket::shutdown_both, ec);
        ws.next_layer().close(ec);
    });

    collector events;
    realtime_client client(events);
    client.set_url_template(server.url());
    CHECK(error_code_of([&]() { client.connect("secret", "qwen-test"); }) == kVrbOk);

    CHECK(events.wait());
    auto list = events.get();
    CHECK(list.size() == 1);
    CHECK(list[0].first == "error");
    CHECK(!list[0].second.empty());
    // the forwarding loop has stopped and cleared the connection state
    CHECK(!client.connected());
    CHECK(error_code_of([&]() { client.send("x"); }) == kVrbErrorNotConnected);
    CHECK(error_code_of([&]() { client.close(); }) == kVrbErrorNotConnected);
    // no further events
    CHECK(!events.wait(0.2));
    server.join();

    return EXIT_SUCCESS;
}

int test_command_errors() {
    std::cout << "command errors" << std::endl;

    VrbErrorInfo info;
    CHECK(realtime_command("test", &info, []() {}) == kVrbOk);
    CHECK(info.code == kVrbOk);

    CHECK(realtime_command("test", &info, []() {
        throw realtime_error(kVrbErrorNotConnected, "not connected");
    }) == kVrbErrorNotConnected);
    CHECK(info.code == kVrbErrorNotConnected);
    CHECK(std::string(info.message) == "not connected");

    // other exceptions must not escape the command boundary
    CHECK(realtime_command("test", &info, []() {
        throw std::bad_alloc();
    }) == kVrbErrorSystem);
    CHECK(info.code == kVrbErrorSystem);

    CHECK(realtime_command("test", nullptr, []() {
        throw boost::system::system_error(
            make_error_code(boost::system::errc::not_enough_memory));
    }) == kVrbErrorSystem);

    // every error code has a description
    for (VrbError e = kVrbOk; e <= kVrbErrorSystem; ++e) {
        CHECK(strlen(vrb_strerror(e)) > 0);
    }
    CHECK(std::string(vrb_strerror(kVrbErrorSystem)) == "system error");
    CHECK(strlen(vrb_strerror(kVrbErrorSystem + 1)) == 0);

    return EXIT_SUCCESS;
}

int test_reconnect() {
    std::cout << "reconnect" << std::endl;

    bool first_closed = false;
    test_server first;
    first.run([&](tcp::socket& sock) {
        request_info request;
        auto ws = accept_websocket(sock, request);
        read_until_closed(ws);
        first_closed = true;
    });

    std::vector<std::string> frames;
    test_server second;
    second.run([&](tcp::socket& sock) {
        request_info request;
        auto ws = accept_websocket(sock, request);
        frames = read_until_closed(ws);
    });

    collector events;
    realtime_client client(events);
    client.set_url_template(first.url());
    CHECK(error_code_of([&]() { client.connect("secret", "a"); }) == kVrbOk);
    client.set_url_template(second.url());
    CHECK(error_code_of([&]() { client.connect("secret", "b"); }) == kVrbOk);

    // the previous connection has been closed
    first.join();
    CHECK(first_closed);
    // ... without emitting events
    CHECK(!events.wait(0.2));

    CHECK(error_code_of([&]() { client.send("to second"); }) == kVrbOk);
    CHECK(error_code_of([&]() { client.close(); }) == kVrbOk);
    second.join();
    CHECK(frames == std::vector<std::string> { "to second" });

    return EXIT_SUCCESS;
}

struct event_queue {
    static void VRB_CALL handle(void *user, const VrbEvent *event, VrbThreadLevel) {
        auto self = static_cast<event_queue *>(user);
        if (event->type == kVrbEventRealtimeMessage) {
            auto& e = event->realtimeMessage;
            self->messages.emplace_back(e.text, e.size);
        } else {
            self->types.push_back(event->type);
        }
    }

    std::vector<std::string> messages;
    std::vector<VrbEventType> types;
};

int test_bridge() {
    std::cout << "bridge" << std::endl;

    test_server server;
    server.run([](tcp::socket& sock) {
        request_info request;
        auto ws = accept_websocket(sock, request);
        ws.text(true);
        // echo
        for (;;) {
            beast::flat_buffer buffer;
            beast::error_code ec;
            ws.read(buffer, ec);
            if (ec) {
                break;
            }
            ws.write(buffer.data());
        }
    });

    auto bridge = VrbBridge::create();
    CHECK(bridge);

    event_queue queue;
    bridge->setEventHandler(event_queue::handle, &queue, kVrbEventModePoll);

    auto url = server.url();
    VrbBridgeSettings settings = VRB_BRIDGE_SETTINGS_INIT();
    settings.realtimeUrl = url.c_str();
    CHECK(bridge->setup(settings) == kVrbOk);

    VrbErrorInfo info;
    CHECK(bridge->realtimeSend("x", &info) == kVrbErrorNotConnected);
    CHECK(info.code == kVrbErrorNotConnected);
    CHECK(strlen(info.message) > 0);
    CHECK(bridge->realtimeConnect("", "qwen-test", &info) == kVrbErrorBadArgument);

    CHECK(bridge->realtimeConnect("secret", "qwen-test", &info) == kVrbOk);
    CHECK(bridge->realtimeSend("{\"type\":\"session.update\"}", &info) == kVrbOk);

    for (int i = 0; i < 200 && queue.messages.empty(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        bridge->pollEvents();
    }
    CHECK(queue.messages == std::vector<std::string> { "{\"type\":\"session.update\"}" });

    CHECK(bridge->realtimeClose(&info) == kVrbOk);
    CHECK(bridge->realtimeClose(&info) == kVrbErrorNotConnected);
    server.join();

    for (int i = 0; i < 200 && queue.types.empty(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        bridge->pollEvents();
    }
    CHECK(queue.types == std::vector<VrbEventType> { kVrbEventRealtimeClose });

    return EXIT_SUCCESS;
}

int main(int argc, char *argv[])
{
    vrb_initialize(nullptr);

    using test_fn = int (*)();
    for (test_fn fn : { test_url, test_not_connected, test_session,
                        test_rejected, test_remote_close, test_read_error,
                        test_reconnect, test_command_errors, test_bridge }) {
        if (fn() != EXIT_SUCCESS) {
            return EXIT_FAILURE;
        }
    }

    std::cout << "all tests passed" << std::endl;

    vrb_terminate();

    return EXIT_SUCCESS;
}
