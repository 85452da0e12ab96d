#pragma once
// Diagnostic logging to stderr
//
//   [HH:MM:SS.mmm][component] message
//
// Debug lines only appear in verbose mode. Everything else is filtered
// by a minimum level so test runs and cron jobs can stay quiet.

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>

namespace viveka {
namespace log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4,
};

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> flag{false};
    return flag;
}

inline std::atomic<int>& min_level() {
    static std::atomic<int> level{static_cast<int>(Level::Info)};
    return level;
}

inline void set_verbose(bool on) { verbose_flag() = on; }
inline bool verbose() { return verbose_flag(); }
inline void set_min_level(Level level) { min_level() = static_cast<int>(level); }

inline void vwrite(Level level, const char* component, const char* fmt, va_list args) {
    if (level == Level::Debug && !verbose()) return;
    if (level != Level::Debug && static_cast<int>(level) < min_level()) return;

    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_local{};
    localtime_r(&now_time_t, &tm_local);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_local);

    const char* tag = "";
    if (level == Level::Warn) tag = "warning: ";
    else if (level == Level::Error) tag = "error: ";

    fprintf(stderr, "[%s.%03d][%s] %s", time_buf, static_cast<int>(now_ms.count()), component, tag);
    vfprintf(stderr, fmt, args);
    fputc('\n', stderr);
}

inline void debug(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(Level::Debug, component, fmt, args);
    va_end(args);
}

inline void info(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(Level::Info, component, fmt, args);
    va_end(args);
}

inline void warn(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(Level::Warn, component, fmt, args);
    va_end(args);
}

inline void error(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vwrite(Level::Error, component, fmt, args);
    va_end(args);
}

} // namespace log
} // namespace viveka
