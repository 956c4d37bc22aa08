#pragma once
#include <cstdio>
#include <cstdarg>
#include <chrono>
#include <ctime>
#include <string>

namespace ifx {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

inline LogLevel g_log_level = LogLevel::INFO;

// Optional mirror of every log line (opened by log_open_file, append mode)
inline std::FILE* g_log_file = nullptr;

inline LogLevel parse_log_level(const std::string& s) {
    if (s == "debug") return LogLevel::DEBUG;
    if (s == "warn")  return LogLevel::WARN;
    if (s == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

inline bool log_open_file(const std::string& path) {
    if (g_log_file) std::fclose(g_log_file);
    g_log_file = std::fopen(path.c_str(), "a");
    return g_log_file != nullptr;
}

inline void log_close_file() {
    if (g_log_file) {
        std::fclose(g_log_file);
        g_log_file = nullptr;
    }
}

inline void log(LogLevel level, const char* fmt, ...) {
    if (level < g_log_level) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) .count() % 1000;

    struct tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    const char* prefix = "???";
    switch (level) {
        case LogLevel::DEBUG: prefix = "DBG"; break;
        case LogLevel::INFO:  prefix = "INF"; break;
        case LogLevel::WARN:  prefix = "WRN"; break;
        case LogLevel::ERROR: prefix = "ERR"; break;
    }

    char stamp[64];
    std::snprintf(stamp, sizeof(stamp), "[%04d-%02d-%02d %02d:%02d:%02d.%03d] [%s] ",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms),
        prefix);

    va_list args;
    va_start(args, fmt);
    if (g_log_file) {
        va_list file_args;
        va_copy(file_args, args);
        std::fputs(stamp, g_log_file);
        std::vfprintf(g_log_file, fmt, file_args);
        std::fputc('\n', g_log_file);
        std::fflush(g_log_file);
        va_end(file_args);
    }
    std::fputs(stamp, stderr);
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
    va_end(args);
}

#define LOG_DBG(...) ::ifx::log(::ifx::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INF(...) ::ifx::log(::ifx::LogLevel::INFO,  __VA_ARGS__)
#define LOG_WRN(...) ::ifx::log(::ifx::LogLevel::WARN,  __VA_ARGS__)
#define LOG_ERR(...) ::ifx::log(::ifx::LogLevel::ERROR, __VA_ARGS__)

} // namespace ifx
