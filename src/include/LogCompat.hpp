#pragma once

/**
 * Stream-style logging macros on top of spdlog.
 * LOG(INFO) << "x" ends up in the default spdlog logger at the mapped level.
 */

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <string>

namespace LogCompat {

// Severity tokens accepted by LOG()/DLOG()
constexpr auto kSeverity_DEBUG = spdlog::level::debug;
constexpr auto kSeverity_INFO = spdlog::level::info;
constexpr auto kSeverity_WARNING = spdlog::level::warn;
constexpr auto kSeverity_ERROR = spdlog::level::err;
constexpr auto kSeverity_FATAL = spdlog::level::critical;

class LogStream {
    std::ostringstream oss;
    spdlog::level::level_enum level;

   public:
    explicit LogStream(spdlog::level::level_enum l) : level(l) {}

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template <typename T>
    LogStream& operator<<(const T& value) {
        oss << value;
        return *this;
    }

    // Special handling for manipulators like std::endl
    LogStream& operator<<(std::ostream& (*manip)(std::ostream&)) {
        manip(oss);
        return *this;
    }

    ~LogStream() {
        const std::string msg = oss.str();
        if (!msg.empty()) {
            spdlog::default_logger_raw()->log(level, "{}", msg);
        }
    }
};

}  // namespace LogCompat

#define LOG(severity) \
    ::LogCompat::LogStream(::LogCompat::kSeverity_##severity)

#ifdef NDEBUG
#define DLOG(severity) \
    if (false) ::LogCompat::LogStream(::LogCompat::kSeverity_##severity)
#else
#define DLOG(severity) LOG(severity)
#endif

// Log with errno description prefixed
#define PLOG(severity) LOG(severity) << std::strerror(errno) << ": "
