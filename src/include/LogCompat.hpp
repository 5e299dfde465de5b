#pragma once

/**
 * Stream-style logging macros on top of spdlog.
 * LOG(INFO) << "text" builds the message in a stream and hands the finished
 * line to the default spdlog logger when the temporary is destroyed.
 */

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <string>

namespace HealthUploader::log {

enum class Severity { INFO, WARNING, ERROR, FATAL };

constexpr spdlog::level::level_enum toSpdlogLevel(const Severity severity) {
    switch (severity) {
        case Severity::INFO:
            return spdlog::level::info;
        case Severity::WARNING:
            return spdlog::level::warn;
        case Severity::ERROR:
            return spdlog::level::err;
        case Severity::FATAL:
            return spdlog::level::critical;
    }
    return spdlog::level::info;
}

class LogStream {
    std::ostringstream oss;
    Severity level;
    bool enabled;

   public:
    explicit LogStream(Severity l, bool enabled = true)
        : level(l), enabled(enabled) {}

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template <typename T>
    LogStream& operator<<(const T& value) {
        if (enabled) {
            oss << value;
        }
        return *this;
    }

    LogStream& operator<<(std::ostream& (*manip)(std::ostream&)) {
        if (enabled) {
            manip(oss);
        }
        return *this;
    }

    ~LogStream() {
        if (!enabled) {
            return;
        }
        const std::string msg = oss.str();
        if (!msg.empty()) {
            spdlog::log(toSpdlogLevel(level), "{}", msg);
        }
    }
};

}  // namespace HealthUploader::log

#define LOG(severity)                 \
    ::HealthUploader::log::LogStream( \
        ::HealthUploader::log::Severity::severity)

#ifdef NDEBUG
#define DLOG(severity)                \
    ::HealthUploader::log::LogStream( \
        ::HealthUploader::log::Severity::severity, false)
#else
#define DLOG(severity) LOG(severity)
#endif

// Prefixes the message with strerror(errno)
#define PLOG(severity) LOG(severity) << std::strerror(errno) << ": "
