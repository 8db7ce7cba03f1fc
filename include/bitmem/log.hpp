#ifndef BITMEM_LOG_HPP_
#define BITMEM_LOG_HPP_

#include <bitmem/bitmem_export.h>

#include <cstdarg>
#include <cstdio>
#include <ctime>

namespace bitmem {

// ============================================================================
// Diagnostics Logging
// ============================================================================

enum class log_level : int {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    off = 5
};

[[nodiscard]] inline const char* to_string(log_level lvl) noexcept {
    switch (lvl) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info:  return "INFO";
        case log_level::warn:  return "WARN";
        case log_level::error: return "ERROR";
        case log_level::off:   return "OFF";
    }
    return "OFF";
}

namespace detail {

// Defined in the library so every module shares one level
[[nodiscard]] BITMEM_EXPORT log_level& global_log_level() noexcept;

} // namespace detail

inline void set_log_level(log_level lvl) noexcept {
    detail::global_log_level() = lvl;
}

[[nodiscard]] inline log_level get_log_level() noexcept {
    return detail::global_log_level();
}

[[nodiscard]] inline bool log_enabled(log_level lvl) noexcept {
    const log_level current = get_log_level();
    return current != log_level::off && lvl != log_level::off && lvl >= current;
}

inline void vlogf(log_level lvl, const char* fmt, va_list args) {
    if (!log_enabled(lvl)) {
        return;
    }

    std::time_t t = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif

    char ts[16];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d", tm.tm_hour, tm.tm_min, tm.tm_sec);

    char msg[1024];
    std::vsnprintf(msg, sizeof(msg), fmt, args);

    std::fprintf(stderr, "[%s] %-5s: %s\n", ts, to_string(lvl), msg);
}

inline void logf(log_level lvl, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlogf(lvl, fmt, args);
    va_end(args);
}

} // namespace bitmem

#define BITMEM_LOG_TRACE(...) ::bitmem::logf(::bitmem::log_level::trace, __VA_ARGS__)
#define BITMEM_LOG_DEBUG(...) ::bitmem::logf(::bitmem::log_level::debug, __VA_ARGS__)
#define BITMEM_LOG_INFO(...)  ::bitmem::logf(::bitmem::log_level::info, __VA_ARGS__)
#define BITMEM_LOG_WARN(...)  ::bitmem::logf(::bitmem::log_level::warn, __VA_ARGS__)
#define BITMEM_LOG_ERROR(...) ::bitmem::logf(::bitmem::log_level::error, __VA_ARGS__)

#endif // BITMEM_LOG_HPP_
