#pragma once

#include <chrono>
#include <cstdio>

#ifdef ERROR
#undef ERROR
#endif

namespace votelink {

enum class LogLevel : int {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG = 4,
    TRACE = 5,
};

// Per-subsystem enable flags
struct LogCategories {
    bool proto = true;     // Frame codec, registry, ledger, retries
    bool session = true;   // Round lifecycle
    bool link = true;      // Transport / simulation
};

extern LogLevel g_log_level;
extern LogCategories g_log_categories;
extern std::chrono::steady_clock::time_point g_log_start_time;

void setLogLevel(LogLevel level);
LogLevel getLogLevel();
LogLevel parseLogLevel(const char* name, LogLevel fallback = LogLevel::INFO);
const char* logLevelToString(LogLevel level);

// Redirect all output (nullptr restores stderr). The caller keeps ownership.
void setLogFile(FILE* file);

void log(LogLevel level, const char* category, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

} // namespace votelink

#define VOTELINK_LOG_CAT(flag, tag, level, ...)                                  \
    do {                                                                          \
        if (::votelink::g_log_level >= ::votelink::LogLevel::level &&            \
            ::votelink::g_log_categories.flag) {                                  \
            ::votelink::log(::votelink::LogLevel::level, tag, __VA_ARGS__);       \
        }                                                                         \
    } while (0)

#define LOG_PROTO(level, ...)   VOTELINK_LOG_CAT(proto, "PROTO", level, __VA_ARGS__)
#define LOG_SESSION(level, ...) VOTELINK_LOG_CAT(session, "SESS", level, __VA_ARGS__)
#define LOG_LINK(level, ...)    VOTELINK_LOG_CAT(link, "LINK", level, __VA_ARGS__)
