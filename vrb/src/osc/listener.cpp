/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#include "listener.hpp"

#include "common/log.hpp"

namespace vrb {

std::optional<bool> match_mute_self(const osc_message& msg) {
    if (msg.address == mute_self_address) {
        if (auto b = msg.bool_argument(0)) {
            return *b;
        }
    }
    return std::nullopt;
}

bool osc_listener::start(const ip_address& bindaddr, mute_handler fn,
                         error_handler err) {
    if (started_.exchange(true, std::memory_order_acq_rel)) {
        LOG_DEBUG("OSC listener: already started");
        return false;
    }

    mute_handler_ = std::move(fn);
    error_handler_ = std::move(err);
    // the socket is bound on the listener thread
    thread_ = std::thread([this, bindaddr]() {
        run(bindaddr);
    });

    return true;
}

osc_listener::~osc_listener() {
    {
        sync::scoped_lock<sync::mutex> lock(mutex_);
        quit_ = true;
        server_.stop();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

void osc_listener::run(const ip_address& bindaddr) {
    {
        sync::scoped_lock<sync::mutex> lock(mutex_);
        if (quit_) {
            return;
        }
        try {
            server_.start(bindaddr, [this](const VrbByte *data, VrbSize size,
                                           const ip_address& addr) {
                handle_packet(data, size, addr);
            });
        } catch (const udp_error& e) {
            // NB: the listener stays 'started', so it will never try again.
            LOG_ERROR("OSC listener: could not bind to " << bindaddr
                      << ": " << e.what());
            if (error_handler_) {
                error_handler_(e);
            }
            return;
        }
    }

    LOG_VERBOSE("OSC listener: listening on " << server_.address());

    try {
        server_.run();
    } catch (const udp_error& e) {
        LOG_ERROR("OSC listener: could not receive from socket: " << e.what());
        LOG_ERROR("OSC listener: stopped");
        if (error_handler_) {
            error_handler_(e);
        }
    }
}

void osc_listener::handle_packet(const VrbByte *data, VrbSize size,
                                 const ip_address& addr) {
    if (osc_is_bundle(data, size)) {
        try {
            auto messages = osc_decode_bundle(data, size);
            LOG_DEBUG("OSC listener: ignore bundle with " << messages.size()
                      << " messages from " << addr);
        } catch (const osc_error& e) {
            LOG_WARNING("OSC listener: " << e.what() << " (from " << addr << ")");
        }
        return;
    }

    try {
        auto msg = osc_decode(data, size);
        if (auto muted = match_mute_self(msg)) {
            LOG_VERBOSE("OSC listener: " << msg);
            if (mute_handler_) {
                mute_handler_(*muted);
            }
        } else {
            LOG_DEBUG("OSC listener: ignore " << msg);
        }
    } catch (const osc_error& e) {
        // skip the datagram, but keep the receive loop alive
        LOG_WARNING("OSC listener: " << e.what() << " (from " << addr << ")");
    }
}

} // vrb
