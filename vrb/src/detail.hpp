#pragma once

#include "vrb/vrb_config.h"
#include "vrb/vrb_defines.h"
#include "vrb/vrb_types.h"

#include <cstdio>
#include <string_view>

namespace vrb {

//--------------- helper functions ----------------//

// write code and message into the (optional) error info struct
inline VrbError set_error(VrbErrorInfo *info, VrbError code,
                          std::string_view msg = {}) {
    if (info) {
        info->code = code;
        std::snprintf(info->message, sizeof(info->message), "%.*s",
                      (int)msg.size(), msg.data());
    }
    return code;
}

inline bool check_port(VrbInt32 port) {
    return port > 0 && port <= 65535;
}

} // vrb
