#pragma once

#include "vrb/vrb_types.h"

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace vrb {

//------------------- osc_error -----------------------//

// malformed packet, unsupported type tag or insufficient buffer
class osc_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//------------------- osc_argument --------------------//

struct osc_nil {
    bool operator==(const osc_nil&) const { return true; }
};

using osc_blob = std::vector<VrbByte>;

using osc_argument = std::variant<osc_nil, bool, int32_t, int64_t,
                                  float, double, std::string, osc_blob>;

//------------------- osc_message ---------------------//

struct osc_message {
    std::string address;
    std::vector<osc_argument> arguments;

    const bool* bool_argument(size_t index) const {
        if (index < arguments.size()) {
            return std::get_if<bool>(&arguments[index]);
        } else {
            return nullptr;
        }
    }
};

bool operator==(const osc_message& a, const osc_message& b);

inline bool operator!=(const osc_message& a, const osc_message& b) {
    return !(a == b);
}

std::ostream& operator<<(std::ostream& os, const osc_message& msg);

//------------------- encode/decode ---------------------//

// throws osc_error if the message does not fit into VRB_MAX_PACKET_SIZE
std::vector<VrbByte> osc_encode(const std::string& address,
                                const std::vector<osc_argument>& args);

inline std::vector<VrbByte> osc_encode(const osc_message& msg) {
    return osc_encode(msg.address, msg.arguments);
}

bool osc_is_bundle(const VrbByte *data, VrbSize size);

// decode a single OSC message; throws osc_error
osc_message osc_decode(const VrbByte *data, VrbSize size);

inline osc_message osc_decode(const std::vector<VrbByte>& data) {
    return osc_decode(data.data(), data.size());
}

// flatten an OSC bundle (including nested bundles); throws osc_error
std::vector<osc_message> osc_decode_bundle(const VrbByte *data, VrbSize size);

} // vrb
