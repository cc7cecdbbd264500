#include "votelink/logging.hpp"
#include <cctype>
#include <cstdarg>
#include <mutex>

namespace votelink {

LogLevel g_log_level = LogLevel::INFO;
LogCategories g_log_categories;
std::chrono::steady_clock::time_point g_log_start_time = std::chrono::steady_clock::now();

namespace {

std::mutex g_log_mutex;
FILE* g_log_file = nullptr;

const char* levelTag(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "     ";
    }
}

bool equalsIgnoreCase(const char* a, const char* b) {
    while (*a && *b) {
        if (std::tolower(static_cast<unsigned char>(*a)) !=
            std::tolower(static_cast<unsigned char>(*b))) {
            return false;
        }
        ++a;
        ++b;
    }
    return *a == *b;
}

} // namespace

void setLogLevel(LogLevel level) {
    g_log_level = level;
}

LogLevel getLogLevel() {
    return g_log_level;
}

const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::NONE:  return "NONE";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKNOWN";
    }
}

LogLevel parseLogLevel(const char* name, LogLevel fallback) {
    if (!name) return fallback;
    if (equalsIgnoreCase(name, "none"))  return LogLevel::NONE;
    if (equalsIgnoreCase(name, "error")) return LogLevel::ERROR;
    if (equalsIgnoreCase(name, "warn"))  return LogLevel::WARN;
    if (equalsIgnoreCase(name, "info"))  return LogLevel::INFO;
    if (equalsIgnoreCase(name, "debug")) return LogLevel::DEBUG;
    if (equalsIgnoreCase(name, "trace")) return LogLevel::TRACE;
    return fallback;
}

void setLogFile(FILE* file) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_file = file;
}

void log(LogLevel level, const char* category, const char* fmt, ...) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - g_log_start_time).count();
    int secs = static_cast<int>(elapsed / 1000);
    int ms = static_cast<int>(elapsed % 1000);

    char buf[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    FILE* out = g_log_file ? g_log_file : stderr;
    fprintf(out, "[%3d.%03d][%s][%-5s] %s\n", secs, ms, levelTag(level), category, buf);
    fflush(out);
}

} // namespace votelink
