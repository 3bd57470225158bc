#pragma once

#include <string>
#include <cstdarg>
#include <cstdint>
#include "config_manager.hpp"

class Logger {
public:
    enum Level { DEBUG, INFO, WARN, ERROR };
    // Millisecond uptime used for the line prefix; millis() on the board.
    using TimeSource = uint32_t (*)();

    static void begin(const LoggingConfig& cfg);
    static void setLevel(Level level) { min_level_ = level; }
    static Level level() { return min_level_; }
    static bool parseLevel(const std::string& name, Level& out);
    static void setTimeSource(TimeSource source) { time_source_ = source; }

    static void log(Level level, const char* fmt, ...);
    static void debug(const char* fmt, ...);
    static void info(const char* fmt, ...);
    static void warn(const char* fmt, ...);
    static void error(const char* fmt, ...);
    static void flush();
private:
    static Level min_level_;
    static TimeSource time_source_;
    static bool flush_on_write_;
    static void write_log(Level level, const char* fmt, va_list args);
};
