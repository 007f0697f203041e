/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#include "client.hpp"

#include "vrb/vrb_config.h"
#include "vrb/vrb.h"

#include "common/log.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <future>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace vrb {

//------------------- URL ------------------------//

std::string realtime_endpoint::host_header() const {
    std::string result = ipv6 ? "[" + host + "]" : host;
    if (port != (secure ? "443" : "80")) {
        result += ":" + port;
    }
    return result;
}

std::string format_realtime_url(std::string_view tmpl, std::string_view model) {
    std::string result(tmpl);
    auto pos = result.find("%s");
    if (pos != std::string::npos) {
        result.replace(pos, 2, model.data(), model.size());
    }
    return result;
}

realtime_endpoint parse_realtime_url(std::string_view url) {
    auto fail = [url](const char *what) {
        return realtime_error(kVrbErrorHandshake,
            "bad URL '" + std::string(url) + "': " + what);
    };

    realtime_endpoint ep;

    auto sep = url.find("://");
    if (sep == std::string_view::npos) {
        throw fail("missing scheme");
    }
    std::string scheme(url.substr(0, sep));
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (scheme == "wss") {
        ep.secure = true;
    } else if (scheme == "ws") {
        ep.secure = false;
    } else {
        throw fail("unsupported scheme");
    }

    auto rest = url.substr(sep + 3);
    auto end = rest.find_first_of("/?#");
    auto authority = rest.substr(0, end);

    std::string_view target;
    if (end != std::string_view::npos) {
        target = rest.substr(end);
        // the fragment is never sent
        target = target.substr(0, target.find('#'));
    }
    if (target.empty()) {
        ep.target = "/";
    } else if (target.front() == '?') {
        ep.target = "/" + std::string(target);
    } else {
        ep.target = target;
    }

    // strip userinfo
    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }

    std::string_view port;
    if (!authority.empty() && authority.front() == '[') {
        auto bracket = authority.find(']');
        if (bracket == std::string_view::npos) {
            throw fail("unterminated IPv6 address");
        }
        ep.host = authority.substr(1, bracket - 1);
        ep.ipv6 = true;
        auto tail = authority.substr(bracket + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                throw fail("bad port");
            }
            port = tail.substr(1);
        }
    } else {
        auto colon = authority.find(':');
        ep.host = authority.substr(0, colon);
        if (colon != std::string_view::npos) {
            port = authority.substr(colon + 1);
        }
    }

    if (ep.host.empty()) {
        throw fail("missing host");
    }

    if (!port.empty()) {
        if (port.size() > 5 || !std::all_of(port.begin(), port.end(),
                [](unsigned char c) { return std::isdigit(c); })) {
            throw fail("bad port");
        }
        auto value = std::stoi(std::string(port));
        if (value < 1 || value > 65535) {
            throw fail("port out of range");
        }
        ep.port = port;
    } else {
        ep.port = ep.secure ? "443" : "80";
    }

    return ep;
}

//------------------- realtime_session ---------------//

// One WebSocket connection. The client holds the send half in its
// connection slot, the forwarding loop holds the receive half.
class realtime_session : public std::enable_shared_from_this<realtime_session> {
public:
    realtime_session(realtime_client& owner)
        : owner_(owner) {}

    virtual ~realtime_session() {}

    // connect + TLS + WebSocket handshake on the calling thread;
    // throws realtime_error
    virtual void handshake(const realtime_endpoint& ep,
                           const std::string& api_key) = 0;

    // start the forwarding loop on the network thread
    virtual void start_read() = 0;

    // blocks until the frame has been written
    virtual beast::error_code write(std::string_view text) = 0;

    // blocks until the close handshake has finished
    virtual beast::error_code close() = 0;

    // a detached session doesn't emit events anymore
    void detach() {
        detached_.store(true);
    }

    bool detached() const {
        return detached_.load();
    }

    // the forwarding loop has terminated
    bool finished() const {
        return finished_.load();
    }
protected:
    void on_message(std::string_view text) {
        if (!detached()) {
            owner_.listener().on_message(text);
        }
    }

    void on_read_finished(const beast::error_code& ec);

    realtime_client& owner_;
    std::atomic<bool> detached_{false};
    std::atomic<bool> finished_{false};
    std::atomic<bool> closing_{false};
};

void realtime_session::on_read_finished(const beast::error_code& ec) {
    finished_.store(true);
    // clear the connection state before notifying the host
    owner_.read_finished(*this);

    if (detached()) {
        LOG_DEBUG("realtime: superseded connection finished: " << ec.message());
    } else if (ec == websocket::error::closed || closing_.load()) {
        // NB: if we have initiated the close handshake, the pending
        // read fails with 'operation_aborted'.
        LOG_VERBOSE("realtime: connection closed");
        owner_.listener().on_close();
    } else {
        LOG_ERROR("realtime: could not read from connection: " << ec.message());
        owner_.listener().on_error(kVrbErrorTransport, ec.message());
    }
}

namespace {

using plain_stream = websocket::stream<beast::tcp_stream>;
using tls_stream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

void secure_handshake(plain_stream&, const realtime_endpoint&) {}

void secure_handshake(tls_stream& ws, const realtime_endpoint& ep) {
    auto& tls = ws.next_layer();
    // SNI
    if (!ep.ipv6 && !SSL_set_tlsext_host_name(tls.native_handle(), ep.host.c_str())) {
        beast::error_code ec(static_cast<int>(::ERR_get_error()),
                             net::error::get_ssl_category());
        throw realtime_error(kVrbErrorHandshake,
            "could not set TLS host name: " + ec.message());
    }
    tls.set_verify_callback(ssl::host_name_verification(ep.host));

    beast::error_code ec;
    tls.handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw realtime_error(kVrbErrorHandshake,
            "TLS handshake with " + ep.host + " failed: " + ec.message());
    }
}

template<typename Stream>
class websocket_session final : public realtime_session {
public:
    template<typename... Args>
    websocket_session(realtime_client& owner, Args&&... args)
        : realtime_session(owner), ws_(std::forward<Args>(args)...) {}

    void handshake(const realtime_endpoint& ep, const std::string& api_key) override;

    void start_read() override {
        net::post(ws_.get_executor(), [self = shared()]() {
            self->do_read();
        });
    }

    beast::error_code write(std::string_view text) override {
        std::promise<beast::error_code> promise;
        auto future = promise.get_future();
        net::post(ws_.get_executor(), [&, self = shared()]() {
            ws_.async_write(net::buffer(text.data(), text.size()),
                [&promise](beast::error_code ec, std::size_t) {
                    promise.set_value(ec);
                });
        });
        return future.get();
    }

    beast::error_code close() override {
        closing_.store(true);
        std::promise<beast::error_code> promise;
        auto future = promise.get_future();
        net::post(ws_.get_executor(), [&, self = shared()]() {
            ws_.async_close(websocket::close_code::normal,
                [&promise](beast::error_code ec) {
                    promise.set_value(ec);
                });
        });
        return future.get();
    }
private:
    std::shared_ptr<websocket_session> shared() {
        return std::static_pointer_cast<websocket_session>(shared_from_this());
    }

    void do_read() {
        ws_.async_read(buffer_, [self = shared()](beast::error_code ec, std::size_t) {
            self->on_read(ec);
        });
    }

    void on_read(const beast::error_code& ec) {
        if (ec) {
            on_read_finished(ec);
            return;
        }
        if (ws_.got_text()) {
            auto data = buffer_.data();
            on_message(std::string_view(
                static_cast<const char *>(data.data()), data.size()));
        } else {
            LOG_DEBUG("realtime: ignore binary frame (" << buffer_.size() << " bytes)");
        }
        buffer_.consume(buffer_.size());
        do_read();
    }

    Stream ws_;
    beast::flat_buffer buffer_;
};

template<typename Stream>
void websocket_session<Stream>::handshake(const realtime_endpoint& ep,
                                          const std::string& api_key) {
    beast::error_code ec;

    tcp::resolver resolver(ws_.get_executor());
    auto results = resolver.resolve(ep.host, ep.port, ec);
    if (ec) {
        throw realtime_error(kVrbErrorHandshake,
            "could not resolve " + ep.host + ": " + ec.message());
    }

    auto& socket = beast::get_lowest_layer(ws_);
    socket.expires_never();
    socket.connect(results, ec);
    if (ec) {
        throw realtime_error(kVrbErrorHandshake,
            "could not connect to " + ep.host_header() + ": " + ec.message());
    }

    secure_handshake(ws_, ep);

    ws_.set_option(websocket::stream_base::decorator(
        [api_key](websocket::request_type& req) {
            req.set(http::field::user_agent, "vrb/" + std::string(vrb_getVersionString()));
            req.set(http::field::authorization, "Bearer " + api_key);
            req.set("OpenAI-Beta", "realtime=v1");
        }));

    websocket::response_type res;
    ws_.handshake(res, ep.host_header(), ep.target, ec);
    if (ec) {
        std::string msg = "WebSocket handshake with " + ep.host_header()
            + " failed: " + ec.message();
        if (ec == websocket::error::upgrade_declined) {
            msg += " (HTTP " + std::to_string(res.result_int()) + ")";
        }
        beast::error_code ignore;
        socket.socket().close(ignore);
        throw realtime_error(kVrbErrorHandshake, msg);
    }

    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_.text(true);
}

// close a connection that has been replaced
void retire(realtime_client::session_ptr session) {
    session->detach();
    if (auto ec = session->close()) {
        LOG_WARNING("realtime: could not close previous connection: " << ec.message());
    }
}

} // namespace

//------------------- realtime_client ----------------//

realtime_client::realtime_client(realtime_listener& listener)
    : work_(net::make_work_guard(io_context_)),
      ssl_context_(ssl::context::tls_client),
      listener_(listener),
      url_template_(VRB_REALTIME_URL)
{
    beast::error_code ec;
    ssl_context_.set_default_verify_paths(ec);
    if (ec) {
        LOG_WARNING("realtime: could not load system certificates: " << ec.message());
    }
    ssl_context_.set_verify_mode(ssl::verify_peer);

    thread_ = std::thread([this]() {
        run();
    });
}

realtime_client::~realtime_client() {
    if (auto session = send_half_.checkout()) {
        session->detach();
    }
    work_.reset();
    io_context_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void realtime_client::run() {
    for (;;) {
        try {
            io_context_.run();
            break;
        } catch (const std::exception& e) {
            LOG_ERROR("realtime: exception on network thread: " << e.what());
        }
    }
}

void realtime_client::check_thread(const char *what) {
    if (io_context_.get_executor().running_in_this_thread()) {
        throw realtime_error(kVrbErrorNotPermitted, std::string(what)
            + ": must not be called from a realtime event handler");
    }
}

void realtime_client::connect(const std::string& api_key, const std::string& model) {
    check_thread("connect");

    if (api_key.empty()) {
        throw realtime_error(kVrbErrorBadArgument, "connect: empty API key");
    }
    if (model.empty()) {
        throw realtime_error(kVrbErrorBadArgument, "connect: empty model name");
    }

    auto ep = parse_realtime_url(format_realtime_url(url_template_, model));

    session_ptr session;
    if (ep.secure) {
        session = std::make_shared<websocket_session<tls_stream>>(
            *this, io_context_, ssl_context_);
    } else {
        session = std::make_shared<websocket_session<plain_stream>>(
            *this, io_context_);
    }

    LOG_VERBOSE("realtime: connecting to " << ep.host_header() << ep.target);

    // on failure the current connection stays untouched
    session->handshake(ep, api_key);

    if (auto old = send_half_.checkout()) {
        retire(std::move(old));
    }
    // connect() might have been called concurrently
    if (auto old = send_half_.exchange(session)) {
        retire(std::move(old));
    }

    session->start_read();

    LOG_VERBOSE("realtime: connected to " << ep.host_header());
}

void realtime_client::send(std::string_view text) {
    check_thread("send");

    auto session = send_half_.checkout();
    if (!session) {
        throw realtime_error(kVrbErrorNotConnected, "send: not connected");
    }

    auto ec = session->write(text);

    // put the send half back, unless the connection has terminated
    // in the meantime
    if (!session->finished()) {
        if (auto old = send_half_.restore(std::move(session))) {
            // replaced by connect()
            retire(std::move(old));
        } else {
            send_half_.checkout_if([](const realtime_session& s) {
                return s.finished();
            });
        }
    }

    if (ec) {
        throw realtime_error(kVrbErrorTransport,
            "send: could not write message: " + ec.message());
    }

    LOG_DEBUG("realtime: sent " << text.size() << " bytes");
}

void realtime_client::close() {
    check_thread("close");

    auto session = send_half_.checkout();
    if (!session) {
        throw realtime_error(kVrbErrorNotConnected, "close: not connected");
    }

    if (auto ec = session->close()) {
        throw realtime_error(kVrbErrorTransport,
            "close: could not close connection: " + ec.message());
    }

    LOG_VERBOSE("realtime: connection closed");
}

void realtime_client::read_finished(const realtime_session& session) {
    auto s = send_half_.checkout_if([&session](const realtime_session& x) {
        return &x == &session;
    });
    if (s) {
        LOG_DEBUG("realtime: connection state cleared");
    }
}

} // vrb
