#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace impactflow {

/// Process-wide switch for informational output; warnings and errors always print.
inline std::atomic<bool>& log_verbose_flag() {
    static std::atomic<bool> verbose{true};
    return verbose;
}

inline void set_log_verbose(bool on) { log_verbose_flag().store(on, std::memory_order_relaxed); }

namespace detail {

inline void vlog(std::FILE* out, const char* tag, const char* level, const char* fmt, va_list args) {
    char buf[1024];
    std::vsnprintf(buf, sizeof(buf), fmt, args);
    if (level) std::fprintf(out, "[%s] %s: %s\n", tag, level, buf);
    else std::fprintf(out, "[%s] %s\n", tag, buf);
}

} // namespace detail

#if defined(__GNUC__)
#define IMPACTFLOW_PRINTF_ATTR __attribute__((format(printf, 2, 3)))
#else
#define IMPACTFLOW_PRINTF_ATTR
#endif

inline void log_info(const char* tag, const char* fmt, ...) IMPACTFLOW_PRINTF_ATTR;
inline void log_warn(const char* tag, const char* fmt, ...) IMPACTFLOW_PRINTF_ATTR;
inline void log_error(const char* tag, const char* fmt, ...) IMPACTFLOW_PRINTF_ATTR;

inline void log_info(const char* tag, const char* fmt, ...) {
    if (!log_verbose_flag().load(std::memory_order_relaxed)) return;
    va_list args;
    va_start(args, fmt);
    detail::vlog(stdout, tag, nullptr, fmt, args);
    va_end(args);
}

inline void log_warn(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    detail::vlog(stderr, tag, "warning", fmt, args);
    va_end(args);
}

inline void log_error(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    detail::vlog(stderr, tag, "error", fmt, args);
    va_end(args);
}

} // namespace impactflow
