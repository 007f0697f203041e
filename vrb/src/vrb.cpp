/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#include "vrb/vrb.h"

#include "common/log.hpp"
#include "common/net_utils.hpp"
#include "common/sync.hpp"

#include <array>
#include <cstdio>
#include <cstring>

namespace vrb {

void VRB_CALL default_logfunc(VrbLogLevel level, const char *message);

static VrbLogFunc g_logfunc = default_logfunc;

//----------------------- logging --------------------------//

static sync::mutex g_log_mutex;

void VRB_CALL default_logfunc(VrbLogLevel level, const char *message) {
    const char *label = nullptr;

    switch (level) {
    case kVrbLogLevelError:
        label = "error";
        break;
    case kVrbLogLevelWarning:
        label = "warning";
        break;
    case kVrbLogLevelVerbose:
        label = "verbose";
        break;
    case kVrbLogLevelDebug:
        label = "debug";
        break;
    default:
        break;
    }

    const auto size = Log::buffer_size + 32;
    char buffer[size];
    int count;
    if (label) {
        count = snprintf(buffer, size, "[vrb][%s] %s\n", label, message);
    } else {
        count = snprintf(buffer, size, "[vrb] %s\n", message);
    }
    if (count > size - 1) {
        count = size - 1; // truncated
    }

    sync::scoped_lock<sync::mutex> lock(g_log_mutex);
    fwrite(buffer, count, 1, stderr);
    fflush(stderr);
}

Log::int_type Log::overflow(int_type c) {
    if (pos_ < buffer_size - 1) {
        buffer_[pos_++] = c;
        return 0;
    } else {
        return std::streambuf::traits_type::eof();
    }
}

std::streamsize Log::xsputn(const char_type *s, std::streamsize n) {
    auto limit = buffer_size - 1;
    if (pos_ < limit) {
        if (pos_ + n > limit) {
            n = limit - pos_;
        }
        memcpy(buffer_ + pos_, s, n);
        pos_ += n;
        return n;
    } else {
        return 0;
    }
}

Log::~Log() {
    if (g_logfunc) {
        buffer_[pos_] = '\0';
        g_logfunc(level_, buffer_);
    }
}

} // vrb

//----------------------- errors --------------------------//

static std::array g_error_names {
    "no error",
    "not permitted",
    "bad argument",
    "socket error",
    "handshake failed",
    "not connected",
    "transport error",
    "system error"
};

static_assert(g_error_names.size() == kVrbErrorSystem + 1,
              "errors are missing");

VRB_API const VrbChar * VRB_CALL vrb_strerror(VrbError e) {
    if (e >= 0 && e < (VrbError)g_error_names.size()) {
        return g_error_names[e];
    } else {
        return "";
    }
}

//----------------------- events --------------------------//

static std::array g_event_names {
    "error",
    "vrchat-mute",
    "realtime-message",
    "realtime-close",
    "realtime-error"
};

static_assert(g_event_names.size() == kVrbEventRealtimeError + 1,
              "events are missing");

VRB_API const VrbChar * VRB_CALL vrb_eventName(VrbEventType type) {
    if (type >= 0 && type < (VrbEventType)g_event_names.size()) {
        return g_event_names[type];
    } else {
        return "";
    }
}

//---------------------- version -------------------------//

VRB_API void VRB_CALL vrb_getVersion(
        VrbInt32 *major, VrbInt32 *minor, VrbInt32 *patch) {
    if (major) *major = VRB_VERSION_MAJOR;
    if (minor) *minor = VRB_VERSION_MINOR;
    if (patch) *patch = VRB_VERSION_PATCH;
}

#define STR_HELPER(x) #x
#define STR(x) STR_HELPER(x)

VRB_API const VrbChar * VRB_CALL vrb_getVersionString(void) {
    return STR(VRB_VERSION_MAJOR) "." STR(VRB_VERSION_MINOR) "." STR(VRB_VERSION_PATCH);
}

//--------------------------- (de)initialize -----------------------------------//

#define CHECK_SETTING(ptr, field) \
    (ptr && (ptr)->structSize >= VRB_STRUCT_SIZE(VrbSettings, field))

VRB_API VrbError VRB_CALL vrb_initialize(const VrbSettings *settings) {
    static bool initialized = false;
    if (!initialized) {
        vrb::socket::init();
        // optional settings
        if (CHECK_SETTING(settings, logFunc) && settings->logFunc) {
            vrb::g_logfunc = settings->logFunc;
        }
        LOG_VERBOSE("VRB bridge library v" << vrb_getVersionString());

        initialized = true;
    }
    return kVrbOk;
}

VRB_API void VRB_CALL vrb_terminate(void) {
    LOG_DEBUG("vrb_terminate");
}
