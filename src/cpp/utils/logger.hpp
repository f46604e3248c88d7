#pragma once
#include <cstdio>
#include <cstdarg>
#include <chrono>
#include <ctime>
#include <mutex>
#include <string>

namespace ledgerflow {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

inline LogLevel g_log_level = LogLevel::INFO;

// Optional second sink; stderr always receives the line
inline FILE* g_log_file = nullptr;

// Serializes lines written from chunk workers
inline std::mutex g_log_mutex;

inline LogLevel parse_log_level(const std::string& s) {
    if (s == "debug") return LogLevel::DEBUG;
    if (s == "warn" || s == "warning") return LogLevel::WARN;
    if (s == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

inline bool open_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) std::fclose(g_log_file);
    g_log_file = std::fopen(path.c_str(), "a");
    return g_log_file != nullptr;
}

inline void close_log_file() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
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

    char stamp[64];
    std::snprintf(stamp, sizeof(stamp), "[%04d-%02d-%02d %02d:%02d:%02d.%03d] [%s] ",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms),
        prefix);

    char body[2048];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(body, sizeof(body), fmt, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::fprintf(stderr, "%s%s\n", stamp, body);
    if (g_log_file) {
        std::fprintf(g_log_file, "%s%s\n", stamp, body);
        std::fflush(g_log_file);
    }
}

#define LOG_DBG(...) ::ledgerflow::log(::ledgerflow::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INF(...) ::ledgerflow::log(::ledgerflow::LogLevel::INFO,  __VA_ARGS__)
#define LOG_WRN(...) ::ledgerflow::log(::ledgerflow::LogLevel::WARN,  __VA_ARGS__)
#define LOG_ERR(...) ::ledgerflow::log(::ledgerflow::LogLevel::ERROR, __VA_ARGS__)

} // namespace ledgerflow
