#ifndef DROVER_LOG_H
#define DROVER_LOG_H

#include <string>

namespace drover {

enum class LogLevel {
    ERROR = 0,
    WARN  = 1,
    INFO  = 2,
    DEBUG = 3
};

void set_log_level(LogLevel level);
LogLevel log_level();

// "error", "warn", "info", "debug" (case-sensitive). Returns false on anything else.
bool parse_log_level(const std::string& name, LogLevel& out);

// Thread-safe; one line per call on stderr.
void log_write(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace drover

#define DROVER_LOG(fmt, ...)       ::drover::log_write(::drover::LogLevel::INFO, fmt, ##__VA_ARGS__)
#define DROVER_LOG_ERROR(fmt, ...) ::drover::log_write(::drover::LogLevel::ERROR, fmt, ##__VA_ARGS__)
#define DROVER_LOG_WARN(fmt, ...)  ::drover::log_write(::drover::LogLevel::WARN, fmt, ##__VA_ARGS__)
#define DROVER_LOG_DEBUG(fmt, ...) ::drover::log_write(::drover::LogLevel::DEBUG, fmt, ##__VA_ARGS__)

#endif // DROVER_LOG_H
