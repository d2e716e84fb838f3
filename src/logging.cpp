#include "kmeanix/logging.hpp"

#include <cctype>
#include <cstdlib>
#include <string>

namespace kmeanix {

namespace {

thread_local LogLevel tls_level = LogLevel::Warn;

}  // namespace

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Off:   return "off";
        case LogLevel::Error: return "error";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Info:  return "info";
        case LogLevel::Debug: return "debug";
    }
    return "unknown";
}

std::optional<LogLevel> parse_log_level(std::string_view s) {
    std::string lower(s);
    for (auto& ch : lower)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));

    if (lower == "off" || lower == "0" || lower == "none") return LogLevel::Off;
    if (lower == "error") return LogLevel::Error;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "info" || lower == "1") return LogLevel::Info;
    if (lower == "debug") return LogLevel::Debug;
    return std::nullopt;
}

std::optional<LogLevel> env_log_level() {
    static const std::optional<LogLevel> once = []() -> std::optional<LogLevel> {
        const char* e = std::getenv("KMEANIX_LOG");
        if (!e || !*e) return std::nullopt;
        return parse_log_level(e);
    }();
    return once;
}

LogLevel log_threshold() {
    if (auto env = env_log_level()) return *env;
    return tls_level;
}

ScopedLogLevel::ScopedLogLevel(LogLevel level) : prev_(tls_level) {
    tls_level = level;
}

ScopedLogLevel::~ScopedLogLevel() { tls_level = prev_; }

}  // namespace kmeanix
