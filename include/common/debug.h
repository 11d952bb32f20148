#pragma once

#include <stdio.h>
#include <string.h>
#include <errno.h>
#include <atomic>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>

#include <source_location>

#ifndef RELAY_DEBUG
#define RELAY_DEBUG 0
#endif

#if RELAY_DEBUG==1
    #define DEBUG_PRINT(fmt, ...) \
        printf("[DEBUG] file: %s, function: %s, line: %d | " fmt "\n", \
               __FILE__, __func__, __LINE__  __VA_OPT__(, __VA_ARGS__))
#else
    #define DEBUG_PRINT(fmt, ...)
#endif

#define RUNTIME_ERROR(fmt, ...) \
    fprintf(stderr, "[ERROR] file: %s, function: %s, line: %d | " fmt "\n", \
            __FILE__, __func__, __LINE__ __VA_OPT__(, __VA_ARGS__))

#define ERR_CHECK(cond, msg) \
    if (cond) {            \
        RUNTIME_ERROR(msg);  \
        return -1;          \
    }

namespace common::detail {

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> flag{RELAY_DEBUG == 1};
    return flag;
}

inline std::mutex& output_mutex() {
    static std::mutex m;
    return m;
}

inline void write_line(std::ostream& os, const char* level, const std::string& message,
                       const std::source_location& location) {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%F %T", &tm_buf);

    const char* file = location.file_name();
    if (const char* slash = strrchr(file, '/')) file = slash + 1;

    std::lock_guard<std::mutex> lock(output_mutex());
    os << stamp << " [" << level << "] [" << file
       << ":" << location.line() << "] "
       << location.function_name() << "() - "
       << message << std::endl;
}

} // namespace common::detail

// Info lines are printed only when verbose logging is on (-v or "verbose": true).
inline void set_log_verbose(bool on) {
    common::detail::verbose_flag().store(on, std::memory_order_relaxed);
}

inline bool log_verbose() {
    return common::detail::verbose_flag().load(std::memory_order_relaxed);
}

inline void log_cpp20(const std::string& message,
               const std::source_location& location = std::source_location::current()) {
    if (!log_verbose()) return;
    common::detail::write_line(std::clog, "INFO", message, location);
}

inline void warn_cpp20(const std::string& message,
               const std::source_location& location = std::source_location::current()) {
    common::detail::write_line(std::clog, "WARN", message, location);
}

inline void error_cpp20(const std::string& message,
               const std::source_location& location = std::source_location::current()) {
    common::detail::write_line(std::cerr, "ERROR", message, location);
}
