#pragma once

#include <atomic>
#include <cstdio>
#include <cstdarg>
#include <cstring>
#include <ctime>
#include <mutex>
#include <sys/time.h>

namespace screen_mirror {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

// printf-style stderr logger shared by every thread
class Logger {
public:
    static void set_level(LogLevel level) { s_level = level; }
    static LogLevel get_level() { return s_level; }

    static bool enabled(LogLevel level) { return level >= s_level.load(); }

    // Parse "debug", "info", "warn" or "error"
    static bool parse_level(const char* name, LogLevel& out) {
        if (!name) {
            return false;
        }
        for (int i = 0; i < LEVEL_COUNT; i++) {
            if (strcmp(name, level_name(static_cast<LogLevel>(i), true)) == 0) {
                out = static_cast<LogLevel>(i);
                return true;
            }
        }
        if (strcmp(name, "warning") == 0) {
            out = LogLevel::WARN;
            return true;
        }
        return false;
    }

    static void write(LogLevel level, const char* fmt, ...) {
        if (!enabled(level)) {
            return;
        }

        struct timeval now;
        gettimeofday(&now, nullptr);
        struct tm local;
        localtime_r(&now.tv_sec, &local);
        char clock[16];
        strftime(clock, sizeof(clock), "%H:%M:%S", &local);

        va_list args;
        va_start(args, fmt);
        {
            // One line at a time across threads
            std::lock_guard<std::mutex> lock(s_mutex);
            fprintf(stderr, "[%s.%03d] [%s] ", clock, static_cast<int>(now.tv_usec / 1000),
                    level_name(level, false));
            vfprintf(stderr, fmt, args);
            fputc('\n', stderr);
        }
        va_end(args);
    }

private:
    static constexpr int LEVEL_COUNT = 4;

    static const char* level_name(LogLevel level, bool lower) {
        static const char* const upper_names[LEVEL_COUNT] = {"DEBUG", "INFO", "WARN", "ERROR"};
        static const char* const lower_names[LEVEL_COUNT] = {"debug", "info", "warn", "error"};
        int index = static_cast<int>(level);
        return lower ? lower_names[index] : upper_names[index];
    }

    static inline std::atomic<LogLevel> s_level{LogLevel::WARN};
    static inline std::mutex s_mutex;
};

#define LOG_DEBUG(...) screen_mirror::Logger::write(screen_mirror::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  screen_mirror::Logger::write(screen_mirror::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...)  screen_mirror::Logger::write(screen_mirror::LogLevel::WARN, __VA_ARGS__)
#define LOG_ERROR(...) screen_mirror::Logger::write(screen_mirror::LogLevel::ERROR, __VA_ARGS__)

}  // namespace screen_mirror
