#pragma once

#include "vrb/vrb_types.h"

#include "common/checkout_slot.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>

namespace vrb {

//------------------- realtime_error -------------------//

class realtime_error : public std::runtime_error {
public:
    realtime_error(VrbError code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    VrbError code() const { return code_; }
private:
    VrbError code_;
};

//------------------- realtime_endpoint ----------------//

struct realtime_endpoint {
    bool secure = true;
    bool ipv6 = false;
    std::string host;
    std::string port;
    std::string target;

    // value of the HTTP "Host" header
    std::string host_header() const;
};

// replace "%s" in the URL template with the model name
std::string format_realtime_url(std::string_view tmpl, std::string_view model);

// parse a "ws://" or "wss://" URL; throws realtime_error (kVrbErrorHandshake)
realtime_endpoint parse_realtime_url(std::string_view url);

//------------------- realtime_client ------------------//

// receives the events of the forwarding loop on the network thread
class realtime_listener {
public:
    virtual ~realtime_listener() {}

    virtual void on_message(std::string_view text) = 0;

    virtual void on_close() = 0;

    virtual void on_error(VrbError code, const std::string& msg) = 0;
};

class realtime_session;

// Manages a single WebSocket connection to the realtime service.
// All methods throw realtime_error on failure and must not be
// called from a realtime_listener method.
class realtime_client {
public:
    using session_ptr = std::shared_ptr<realtime_session>;

    realtime_client(realtime_listener& listener);
    ~realtime_client();

    realtime_client(const realtime_client&) = delete;
    realtime_client& operator=(const realtime_client&) = delete;

    // call before connect()
    void set_url_template(std::string_view tmpl) {
        url_template_ = tmpl;
    }

    const std::string& url_template() const {
        return url_template_;
    }

    void connect(const std::string& api_key, const std::string& model);

    void send(std::string_view text);

    void close();

    bool connected() const {
        return !send_half_.empty();
    }

    // called by the forwarding loop when it has terminated
    void read_finished(const realtime_session& session);

    realtime_listener& listener() { return listener_; }
private:
    void check_thread(const char *what);
    void run();

    // NB: must be declared first, so that it is destroyed last.
    boost::asio::io_context io_context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    boost::asio::ssl::context ssl_context_;
    realtime_listener& listener_;
    std::string url_template_;
    checkout_slot<session_ptr> send_half_;
    std::thread thread_;
};

} // vrb
