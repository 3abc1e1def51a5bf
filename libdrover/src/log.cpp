#include "drover_log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace drover {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
std::mutex g_write_mutex;

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "error";
        case LogLevel::WARN:  return "warn";
        case LogLevel::INFO:  return "info";
        case LogLevel::DEBUG: return "debug";
    }
    return "info";
}

} // anonymous namespace

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    if (name == "error") { out = LogLevel::ERROR; return true; }
    if (name == "warn")  { out = LogLevel::WARN;  return true; }
    if (name == "info")  { out = LogLevel::INFO;  return true; }
    if (name == "debug") { out = LogLevel::DEBUG; return true; }
    return false;
}

void log_write(LogLevel level, const char* fmt, ...) {
    if (static_cast<int>(level) > g_level.load()) return;

    char message[1024];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    char stamp[32];
    std::time_t now = std::time(nullptr);
    struct tm tm_buf{};
    localtime_r(&now, &tm_buf);
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_buf);

    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::fprintf(stderr, "%s [%s] %s\n", stamp, level_name(level), message);
    std::fflush(stderr);
}

} // namespace drover
