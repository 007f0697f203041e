#pragma once

#include "vrb/vrb_bridge.hpp"

#include "detail.hpp"
#include "event.hpp"
#include "osc/listener.hpp"
#include "realtime/client.hpp"

#include "common/log.hpp"
#include "common/net_utils.hpp"
#include "common/sync.hpp"

#include <deque>
#include <string>

namespace vrb {

// Run a realtime command and convert its exceptions into an error code.
// realtime_error carries its own code, anything else (e.g. std::bad_alloc
// or boost::system::system_error) becomes kVrbErrorSystem.
template<typename Fn>
VrbError realtime_command(const char *name, VrbErrorInfo *info, Fn&& fn) {
    try {
        fn();
        return set_error(info, kVrbOk);
    } catch (const realtime_error& e) {
        LOG_WARNING("Bridge: " << e.what());
        return set_error(info, e.code(), e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Bridge: " << name << ": " << e.what());
        return set_error(info, kVrbErrorSystem,
                         std::string(name) + ": " + e.what());
    }
}

class Bridge final : public VrbBridge, private realtime_listener {
public:
    Bridge();
    ~Bridge();

    VrbError VRB_CALL setup(const VrbBridgeSettings& settings) override;

    VrbError VRB_CALL setEventHandler(
        VrbEventHandler fn, void *user, VrbEventMode mode) override;

    VrbBool VRB_CALL eventsAvailable() override;

    VrbError VRB_CALL pollEvents() override;

    VrbError VRB_CALL sendTyping(
        const VrbChar *address, VrbInt32 port, VrbErrorInfo *info) override;

    VrbError VRB_CALL sendMessage(
        const VrbChar *text, const VrbChar *address, VrbInt32 port,
        VrbErrorInfo *info) override;

    VrbError VRB_CALL startOscListener() override;

    VrbError VRB_CALL showAudioSettings() override;

    VrbError VRB_CALL realtimeConnect(
        const VrbChar *apiKey, const VrbChar *model, VrbErrorInfo *info) override;

    VrbError VRB_CALL realtimeSend(
        const VrbChar *text, VrbErrorInfo *info) override;

    VrbError VRB_CALL realtimeClose(VrbErrorInfo *info) override;
private:
    void send_event(event_ptr e, VrbThreadLevel level);

    // realtime_listener
    void on_message(std::string_view text) override;

    void on_close() override;

    void on_error(VrbError code, const std::string& msg) override;

    // settings
    ip_address listen_address_;
    // events
    VrbEventHandler event_handler_ = nullptr;
    void *event_context_ = nullptr;
    VrbEventMode event_mode_ = kVrbEventModeNone;
    sync::mutex event_mutex_;
    std::deque<event_ptr> event_queue_;
    // NB: must come last because they send events
    osc_listener listener_;
    realtime_client realtime_;
};

} // vrb
