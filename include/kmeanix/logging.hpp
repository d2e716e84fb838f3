#ifndef KMEANIX_LOGGING_HPP
#define KMEANIX_LOGGING_HPP

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string_view>

namespace kmeanix {

enum class LogLevel : uint8_t { Off, Error, Warn, Info, Debug };

const char* to_string(LogLevel level);
std::optional<LogLevel> parse_log_level(std::string_view s);

// Level taken from KMEANIX_LOG, read once per process.
std::optional<LogLevel> env_log_level();

// Threshold for the calling thread: KMEANIX_LOG when set, otherwise the
// level installed by the innermost ScopedLogLevel (Warn when none).
LogLevel log_threshold();

inline bool log_enabled(LogLevel level) {
    return level != LogLevel::Off &&
           static_cast<uint8_t>(level) <= static_cast<uint8_t>(log_threshold());
}

// Installs a per-thread threshold for the lifetime of the guard.
class ScopedLogLevel {
public:
    explicit ScopedLogLevel(LogLevel level);
    ~ScopedLogLevel();

    ScopedLogLevel(const ScopedLogLevel&) = delete;
    ScopedLogLevel& operator=(const ScopedLogLevel&) = delete;

private:
    LogLevel prev_;
};

}  // namespace kmeanix

#define KMEANIX_LOG(level, tag, fmt, ...)                                     \
    do {                                                                      \
        if (::kmeanix::log_enabled(level))                                    \
            std::fprintf(stderr, "[kmeanix:" tag "] " fmt "\n", ##__VA_ARGS__); \
    } while (0)

#define KMEANIX_ERROR(tag, fmt, ...) KMEANIX_LOG(::kmeanix::LogLevel::Error, tag, fmt, ##__VA_ARGS__)
#define KMEANIX_WARN(tag, fmt, ...)  KMEANIX_LOG(::kmeanix::LogLevel::Warn, tag, fmt, ##__VA_ARGS__)
#define KMEANIX_INFO(tag, fmt, ...)  KMEANIX_LOG(::kmeanix::LogLevel::Info, tag, fmt, ##__VA_ARGS__)
#define KMEANIX_DEBUG(tag, fmt, ...) KMEANIX_LOG(::kmeanix::LogLevel::Debug, tag, fmt, ##__VA_ARGS__)

#endif  // KMEANIX_LOGGING_HPP
