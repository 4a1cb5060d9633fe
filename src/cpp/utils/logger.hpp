#pragma once
#include <cstdio>
#include <cstdarg>
#include <chrono>
#include <ctime>
#include <mutex>

namespace credingest {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

inline LogLevel g_log_level = LogLevel::INFO;

// Serializes whole lines -- watcher, workers and CLI all log concurrently
inline std::mutex g_log_mutex;

inline void log(LogLevel level, const char* fmt, ...) {
    if (level < g_log_level) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    struct tm tm_buf{};
    localtime_r(&t, &tm_buf);

    const char* prefix = "???";
    switch (level) {
        case LogLevel::DEBUG: prefix = "DBG"; break;
        case LogLevel::INFO:  prefix = "INF"; break;
        case LogLevel::WARN:  prefix = "WRN"; break;
        case LogLevel::ERROR: prefix = "ERR"; break;
    }

    char line[2048];
    int n = std::snprintf(line, sizeof(line), "[%04d-%02d-%02d %02d:%02d:%02d.%03d] [%s] ",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms),
        prefix);

    if (n > 0 && static_cast<size_t>(n) < sizeof(line)) {
        va_list args;
        va_start(args, fmt);
        std::vsnprintf(line + n, sizeof(line) - static_cast<size_t>(n), fmt, args);
        va_end(args);
    }

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::fputs(line, stderr);
    std::fputc('\n', stderr);
}

#define LOG_DBG(...) ::credingest::log(::credingest::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INF(...) ::credingest::log(::credingest::LogLevel::INFO,  __VA_ARGS__)
#define LOG_WRN(...) ::credingest::log(::credingest::LogLevel::WARN,  __VA_ARGS__)
#define LOG_ERR(...) ::credingest::log(::credingest::LogLevel::ERROR, __VA_ARGS__)

} // namespace credingest
