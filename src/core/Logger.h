#pragma once

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace labflow {

enum class LogLevel : int { off = 0, warn = 1, info = 2, debug = 3, trace = 4 };

class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel getLevel();

    // Parses "off", "warn", "info", "debug", "trace". Returns false on anything else.
    static bool parseLevel(const char* text, LogLevel& level);

    // Scheduler-thread logging
    static void log(LogLevel level, const char* file, int line, const char* fmt, ...);

    // Worker / reader thread logging. Same sink, tagged WK.
    static void logWorker(LogLevel level, const char* file, int line, const char* fmt, ...);

    // Optional callback for host capture (tests, embedding applications)
    using LogCallback = void(*)(int level, const char* message, void* userData);
    static void setCallback(LogCallback callback, void* userData);

private:
    static long elapsedMs();
    static void emit(LogLevel level, const char* tag, const char* file, int line,
                     const char* fmt, va_list args);

    static std::atomic<int> level_;
    static std::chrono::steady_clock::time_point startTime_;
    static std::mutex sinkMutex_;
    static LogCallback callback_;
    static void* callbackUserData_;
};

} // namespace labflow

// --- Macros ---

#define LF_WARN(fmt, ...) \
    do { if (labflow::Logger::getLevel() >= labflow::LogLevel::warn) \
        labflow::Logger::log(labflow::LogLevel::warn, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define LF_WARN_WK(fmt, ...) \
    do { if (labflow::Logger::getLevel() >= labflow::LogLevel::warn) \
        labflow::Logger::logWorker(labflow::LogLevel::warn, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define LF_INFO(fmt, ...) \
    do { if (labflow::Logger::getLevel() >= labflow::LogLevel::info) \
        labflow::Logger::log(labflow::LogLevel::info, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define LF_INFO_WK(fmt, ...) \
    do { if (labflow::Logger::getLevel() >= labflow::LogLevel::info) \
        labflow::Logger::logWorker(labflow::LogLevel::info, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define LF_DEBUG(fmt, ...) \
    do { if (labflow::Logger::getLevel() >= labflow::LogLevel::debug) \
        labflow::Logger::log(labflow::LogLevel::debug, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define LF_DEBUG_WK(fmt, ...) \
    do { if (labflow::Logger::getLevel() >= labflow::LogLevel::debug) \
        labflow::Logger::logWorker(labflow::LogLevel::debug, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define LF_TRACE(fmt, ...) \
    do { if (labflow::Logger::getLevel() >= labflow::LogLevel::trace) \
        labflow::Logger::log(labflow::LogLevel::trace, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)

#define LF_TRACE_WK(fmt, ...) \
    do { if (labflow::Logger::getLevel() >= labflow::LogLevel::trace) \
        labflow::Logger::logWorker(labflow::LogLevel::trace, __FILE__, __LINE__, fmt, ##__VA_ARGS__); } while(0)
