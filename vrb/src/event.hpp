#pragma once

#include "vrb/vrb_events.h"

#include <memory>
#include <string>
#include <string_view>

#define VRB_EVENT_INIT(ptr, name, field) \
    (ptr)->type = k##name; \
    (ptr)->structSize = VRB_STRUCT_SIZE(name, field);

namespace vrb {

struct event_handler {
    event_handler(VrbEventHandler fn, void *user, VrbThreadLevel level)
        : fn_(fn), user_(user), level_(level) {}

    template<typename T>
    void operator()(const T& event) const {
        fn_(user_, reinterpret_cast<const VrbEvent *>(&event), level_);
    }
private:
    VrbEventHandler fn_;
    void *user_;
    VrbThreadLevel level_;
};

struct ievent {
    virtual ~ievent() {}

    virtual void dispatch(const event_handler& fn) const = 0;
};

using event_ptr = std::unique_ptr<ievent>;

//---------------------- events -------------------------//

struct error_event : ievent {
    error_event(VrbError code, std::string msg)
        : code_(code), msg_(std::move(msg)) {}

    void dispatch(const event_handler& fn) const override {
        VrbEventError e;
        VRB_EVENT_INIT(&e, VrbEventError, errorMessage);
        e.errorCode = code_;
        e.errorMessage = msg_.c_str();

        fn(e);
    }

    VrbError code_;
    std::string msg_;
};

struct vrchat_mute_event : ievent {
    vrchat_mute_event(bool muted)
        : muted_(muted) {}

    void dispatch(const event_handler& fn) const override {
        VrbEventVrchatMute e;
        VRB_EVENT_INIT(&e, VrbEventVrchatMute, muted);
        e.muted = muted_;

        fn(e);
    }

    bool muted_;
};

struct realtime_message_event : ievent {
    realtime_message_event(std::string_view text)
        : text_(text) {}

    void dispatch(const event_handler& fn) const override {
        VrbEventRealtimeMessage e;
        VRB_EVENT_INIT(&e, VrbEventRealtimeMessage, size);
        e.text = text_.data();
        e.size = text_.size();

        fn(e);
    }

    std::string text_;
};

struct realtime_close_event : ievent {
    void dispatch(const event_handler& fn) const override {
        VrbEventRealtimeClose e;
        VRB_EVENT_INIT(&e, VrbEventRealtimeClose, structSize);

        fn(e);
    }
};

struct realtime_error_event : ievent {
    realtime_error_event(VrbError code, std::string msg)
        : code_(code), msg_(std::move(msg)) {}

    void dispatch(const event_handler& fn) const override {
        VrbEventRealtimeError e;
        VRB_EVENT_INIT(&e, VrbEventRealtimeError, errorMessage);
        e.errorCode = code_;
        e.errorMessage = msg_.c_str();

        fn(e);
    }

    VrbError code_;
    std::string msg_;
};

} // vrb
