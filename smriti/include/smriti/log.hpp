#pragma once
// Log: stderr diagnostics
//
// stdout belongs to the protocol, so everything here goes to stderr.
// log_debug is silent unless verbose mode is on; log_error always prints.

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>

namespace smriti {

namespace detail {

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> flag{false};
    return flag;
}

inline void write_prefix(const char* component) {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buf[32];
    std::tm local{};
    localtime_r(&now_time_t, &local);
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &local);

    std::fprintf(stderr, "[%s.%03d][%s] ", time_buf,
                 static_cast<int>(now_ms.count()), component);
}

} // namespace detail

inline void set_verbose(bool enabled) {
    detail::verbose_flag().store(enabled);
}

inline bool verbose() {
    return detail::verbose_flag().load();
}

inline void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose()) return;

    detail::write_prefix(component);
    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fputc('\n', stderr);
}

inline void log_error(const char* component, const char* fmt, ...) {
    detail::write_prefix(component);
    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
    std::fputc('\n', stderr);
}

} // namespace smriti
