/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#include "bridge.hpp"
#include "detail.hpp"

#include "osc/sender.hpp"

#include "common/log.hpp"

#ifdef _WIN32
# include <windows.h>
#endif

//------------------------- Bridge --------------------------------//

VRB_API VrbBridge * VRB_CALL VrbBridge_new(void) {
    try {
        return new vrb::Bridge();
    } catch (const std::exception& e) {
        LOG_ERROR("VrbBridge_new: " << e.what());
        return nullptr;
    }
}

vrb::Bridge::Bridge()
    : listen_address_(VRB_OSC_LISTEN_ADDRESS, VRB_OSC_LISTEN_PORT),
      realtime_(*this) {}

VRB_API void VRB_CALL VrbBridge_free(VrbBridge *bridge){
    // cast to correct type because base class
    // has no virtual destructor!
    delete static_cast<vrb::Bridge *>(bridge);
}

vrb::Bridge::~Bridge() {}

namespace vrb {

VrbError VRB_CALL Bridge::setup(const VrbBridgeSettings& settings) {
    if (listener_.started()) {
        LOG_ERROR("Bridge: setup() must be called before startOscListener()");
        return kVrbErrorNotPermitted;
    }

    if (!check_port(settings.listenPort)) {
        LOG_ERROR("Bridge: bad listen port " << settings.listenPort);
        return kVrbErrorBadArgument;
    }

    auto host = settings.listenAddress ? settings.listenAddress : VRB_OSC_LISTEN_ADDRESS;
    ip_address addr(host, settings.listenPort);
    if (!addr.valid()) {
        // not a numeric address
        try {
            addr = ip_address::resolve(host, settings.listenPort, ip_address::Unspec).front();
        } catch (const resolve_error& e) {
            LOG_ERROR("Bridge: could not resolve listen address " << host
                      << ": " << e.what());
            return kVrbErrorBadArgument;
        }
    }
    listen_address_ = addr;

    if (settings.realtimeUrl) {
        realtime_.set_url_template(settings.realtimeUrl);
    }

    LOG_VERBOSE("Bridge: listen address " << listen_address_
                << ", realtime URL " << realtime_.url_template());

    return kVrbOk;
}

VrbError VRB_CALL Bridge::setEventHandler(
    VrbEventHandler fn, void *user, VrbEventMode mode)
{
    event_handler_ = fn;
    event_context_ = user;
    event_mode_ = fn ? mode : kVrbEventModeNone;
    return kVrbOk;
}

VrbBool VRB_CALL Bridge::eventsAvailable() {
    sync::scoped_lock<sync::mutex> lock(event_mutex_);
    return !event_queue_.empty();
}

VrbError VRB_CALL Bridge::pollEvents() {
    if (event_mode_ != kVrbEventModePoll) {
        return kVrbErrorNotPermitted;
    }
    // always thread-safe
    event_handler fn(event_handler_, event_context_, kVrbThreadLevelUnknown);
    for (;;) {
        event_ptr e;
        {
            sync::scoped_lock<sync::mutex> lock(event_mutex_);
            if (event_queue_.empty()) {
                break;
            }
            e = std::move(event_queue_.front());
            event_queue_.pop_front();
        }
        // dispatch without holding the lock
        e->dispatch(fn);
    }
    return kVrbOk;
}

void Bridge::send_event(event_ptr e, VrbThreadLevel level) {
    switch (event_mode_) {
    case kVrbEventModePoll:
    {
        sync::scoped_lock<sync::mutex> lock(event_mutex_);
        event_queue_.push_back(std::move(e));
        break;
    }
    case kVrbEventModeCallback:
    {
        event_handler fn(event_handler_, event_context_, level);
        e->dispatch(fn);
        break;
    }
    default:
        break;
    }
}

//------------------------- OSC ----------------------------//

VrbError VRB_CALL Bridge::sendTyping(
    const VrbChar *address, VrbInt32 port, VrbErrorInfo *info)
{
    if (!address) {
        return set_error(info, kVrbErrorBadArgument, "missing address");
    }
    if (!check_port(port)) {
        return set_error(info, kVrbErrorBadArgument,
                         "port " + std::to_string(port) + " out of range");
    }
    try {
        osc_send_typing(address, port);
        return set_error(info, kVrbOk);
    } catch (const socket_error& e) {
        LOG_ERROR("Bridge: could not send typing indicator to "
                  << address << ":" << port << ": " << e.what());
        return set_error(info, kVrbErrorSocket, e.what());
    } catch (const osc_error& e) {
        LOG_ERROR("Bridge: " << e.what());
        return set_error(info, kVrbErrorBadArgument, e.what());
    }
}

VrbError VRB_CALL Bridge::sendMessage(
    const VrbChar *text, const VrbChar *address, VrbInt32 port,
    VrbErrorInfo *info)
{
    if (!text || !address) {
        return set_error(info, kVrbErrorBadArgument, "missing text or address");
    }
    if (!check_port(port)) {
        return set_error(info, kVrbErrorBadArgument,
                         "port " + std::to_string(port) + " out of range");
    }
    try {
        osc_send_chatbox(address, port, text);
        return set_error(info, kVrbOk);
    } catch (const socket_error& e) {
        LOG_ERROR("Bridge: could not send chatbox message to "
                  << address << ":" << port << ": " << e.what());
        return set_error(info, kVrbErrorSocket, e.what());
    } catch (const osc_error& e) {
        // e.g. text too large
        LOG_ERROR("Bridge: " << e.what());
        return set_error(info, kVrbErrorBadArgument, e.what());
    }
}

VrbError VRB_CALL Bridge::startOscListener() {
    auto mute = [this](bool muted) {
        send_event(std::make_unique<vrchat_mute_event>(muted),
                   kVrbThreadLevelListener);
    };
    auto error = [this](const socket_error& e) {
        send_event(std::make_unique<error_event>(kVrbErrorSocket,
                       std::string("OSC listener: ") + e.what()),
                   kVrbThreadLevelListener);
    };
    if (listener_.start(listen_address_, mute, error)) {
        LOG_VERBOSE("Bridge: start OSC listener on " << listen_address_);
    }
    return kVrbOk;
}

//------------------------- system ----------------------------//

VrbError VRB_CALL Bridge::showAudioSettings() {
#ifdef _WIN32
    STARTUPINFOW si;
    ZeroMemory(&si, sizeof(si));
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi;
    ZeroMemory(&pi, sizeof(pi));
    // NB: the command line buffer must be writeable
    wchar_t cmd[] = L"powershell.exe -NoProfile -Command Start ms-settings:sound";
    if (!CreateProcessW(nullptr, cmd, nullptr, nullptr, FALSE, CREATE_NO_WINDOW,
                        nullptr, nullptr, &si, &pi)) {
        LOG_ERROR("Bridge: could not open sound settings (error "
                  << GetLastError() << ")");
        return kVrbErrorSystem;
    }
    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);
    return kVrbOk;
#else
    LOG_WARNING("Bridge: showAudioSettings() is only supported on Windows");
    return kVrbOk;
#endif
}

//------------------------- realtime ----------------------------//

VrbError VRB_CALL Bridge::realtimeConnect(
    const VrbChar *apiKey, const VrbChar *model, VrbErrorInfo *info)
{
    if (!apiKey || !model) {
        return set_error(info, kVrbErrorBadArgument, "missing API key or model");
    }
    return realtime_command("realtimeConnect", info, [&]() {
        realtime_.connect(apiKey, model);
    });
}

VrbError VRB_CALL Bridge::realtimeSend(const VrbChar *text, VrbErrorInfo *info) {
    if (!text) {
        return set_error(info, kVrbErrorBadArgument, "missing text");
    }
    return realtime_command("realtimeSend", info, [&]() {
        realtime_.send(text);
    });
}

VrbError VRB_CALL Bridge::realtimeClose(VrbErrorInfo *info) {
    return realtime_command("realtimeClose", info, [&]() {
        realtime_.close();
    });
}

void Bridge::on_message(std::string_view text) {
    send_event(std::make_unique<realtime_message_event>(text),
               kVrbThreadLevelNetwork);
}

void Bridge::on_close() {
    send_event(std::make_unique<realtime_close_event>(),
               kVrbThreadLevelNetwork);
}

void Bridge::on_error(VrbError code, const std::string& msg) {
    send_event(std::make_unique<realtime_error_event>(code, msg),
               kVrbThreadLevelNetwork);
}

} // vrb
