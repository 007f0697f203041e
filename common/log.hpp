#pragma once

#include "vrb/vrb_types.h"

#include <cstdint>
#include <ostream>
#include <streambuf>

// Stream-style logging, e.g. LOG_WARNING("could not bind: " << e.what());
// Messages above VRB_LOG_LEVEL are compiled out.

#define VRB_DO_LOG(level, msg) do { vrb::Log(level) << msg; } while (false)
#define VRB_NO_LOG(msg) do {} while (false)

#if VRB_LOG_LEVEL >= kVrbLogLevelError
# define LOG_ERROR(msg) VRB_DO_LOG(kVrbLogLevelError, msg)
#else
# define LOG_ERROR(msg) VRB_NO_LOG(msg)
#endif

#if VRB_LOG_LEVEL >= kVrbLogLevelWarning
# define LOG_WARNING(msg) VRB_DO_LOG(kVrbLogLevelWarning, msg)
#else
# define LOG_WARNING(msg) VRB_NO_LOG(msg)
#endif

#if VRB_LOG_LEVEL >= kVrbLogLevelVerbose
# define LOG_VERBOSE(msg) VRB_DO_LOG(kVrbLogLevelVerbose, msg)
#else
# define LOG_VERBOSE(msg) VRB_NO_LOG(msg)
#endif

#if VRB_LOG_LEVEL >= kVrbLogLevelDebug
# define LOG_DEBUG(msg) VRB_DO_LOG(kVrbLogLevelDebug, msg)
#else
# define LOG_DEBUG(msg) VRB_NO_LOG(msg)
#endif

namespace vrb {

// Collects one log line in a fixed buffer (longer lines are truncated)
// and passes it to the current log function on destruction.
class Log final : std::streambuf, public std::ostream {
public:
    static constexpr int32_t buffer_size = 256;

    explicit Log(VrbLogLevel level)
        : std::ostream(this), level_(level) {}

    ~Log();

    Log(const Log&) = delete;
    Log& operator=(const Log&) = delete;
private:
    // both bases define these
    using int_type = std::streambuf::int_type;
    using char_type = std::streambuf::char_type;

    int_type overflow(int_type c) override;

    std::streamsize xsputn(const char_type *s, std::streamsize n) override;

    VrbLogLevel level_;
    int32_t pos_ = 0;
    char buffer_[buffer_size];
};

} // vrb
