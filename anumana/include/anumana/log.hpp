#pragma once
// Logging: timestamped component-tagged lines on stderr
//
// log_debug is silent unless verbose mode is on.
// log_info always prints.

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>

namespace anumana {

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> verbose{false};
    return verbose;
}

inline void set_verbose(bool on) { verbose_flag() = on; }
inline bool verbose() { return verbose_flag(); }

inline void log_prefix(const char* component) {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", std::localtime(&now_time_t));
    std::fprintf(stderr, "[%s.%03d][%s] ", time_buf,
                 static_cast<int>(now_ms.count()), component);
}

inline void vlog(const char* component, const char* fmt, va_list args) {
    log_prefix(component);
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

inline void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose()) return;

    va_list args;
    va_start(args, fmt);
    vlog(component, fmt, args);
    va_end(args);
}

inline void log_info(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(component, fmt, args);
    va_end(args);
}

} // namespace anumana
