#include "../include/logger.hpp"
#include <stdarg.h>
#include <string.h>
#include <cstdio>


Logger::Level Logger::min_level_ = Logger::INFO;
Logger::TimeSource Logger::time_source_ = nullptr;
bool Logger::flush_on_write_ = false;

bool Logger::parseLevel(const std::string& name, Level& out) {
    if (strcmp(name.c_str(), "DEBUG") == 0) out = Logger::DEBUG;
    else if (strcmp(name.c_str(), "INFO") == 0) out = Logger::INFO;
    else if (strcmp(name.c_str(), "WARN") == 0) out = Logger::WARN;
    else if (strcmp(name.c_str(), "ERROR") == 0) out = Logger::ERROR;
    else return false;
    return true;
}

void Logger::begin(const LoggingConfig& cfg) {
    Level parsed = Logger::INFO;
    if (!cfg.log_level.empty() && !parseLevel(cfg.log_level, parsed)) {
        parsed = Logger::INFO;
    }
    min_level_ = parsed;
    flush_on_write_ = cfg.flush_on_write;
}

void Logger::write_log(Level level, const char* fmt, va_list args) {
    if (level < min_level_) return;
    char buf[160];
    (void)vsnprintf(buf, sizeof(buf), fmt, args);
    const char* level_str = "INFO";
    switch (level) {
        case Logger::DEBUG: level_str = "DEBUG"; break;
        case Logger::INFO:  level_str = "INFO"; break;
        case Logger::WARN:  level_str = "WARN"; break;
        case Logger::ERROR: level_str = "ERROR"; break;
    }
    // [HH:MM:SS.mmm] uptime prefix; there is no RTC on the board
    unsigned long ms = time_source_ ? (unsigned long)time_source_() : 0UL;
    unsigned long seconds = ms / 1000;
    unsigned long minutes = seconds / 60;
    unsigned long hours = minutes / 60;
    char time_buf[24];
    snprintf(time_buf, sizeof(time_buf), "%02lu:%02lu:%02lu.%03lu",
             hours % 100, minutes % 60, seconds % 60, ms % 1000);

    // stderr keeps stdout free for the CSV sample stream
    fprintf(stderr, "[%s] [%s] %s\n", time_buf, level_str, buf);
    if (flush_on_write_) fflush(stderr);
}

void Logger::log(Level level, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(level, fmt, args);
    va_end(args);
}

void Logger::debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(DEBUG, fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(INFO, fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(WARN, fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(ERROR, fmt, args);
    va_end(args);
}

void Logger::flush() {
    fflush(stderr);
}
