#include "core/Logger.h"

#include <cstring>

namespace labflow {

// --- Static storage ---

std::atomic<int> Logger::level_{static_cast<int>(LogLevel::warn)};

std::chrono::steady_clock::time_point Logger::startTime_ = std::chrono::steady_clock::now();

std::mutex Logger::sinkMutex_;
Logger::LogCallback Logger::callback_ = nullptr;
void* Logger::callbackUserData_ = nullptr;

// --- Helpers ---

static const char* basename(const char* path)
{
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

static const char* levelTag(LogLevel level)
{
    static const char* const tags[] = {"off", "warn", "info", "debug", "trace"};
    int index = static_cast<int>(level);
    return index >= 0 && index < 5 ? tags[index] : "???";
}

long Logger::elapsedMs()
{
    using namespace std::chrono;
    return static_cast<long>(duration_cast<milliseconds>(steady_clock::now() - startTime_).count());
}

void Logger::emit(LogLevel level, const char* tag, const char* file, int line,
                  const char* fmt, va_list args)
{
    char userMsg[384];
    vsnprintf(userMsg, sizeof(userMsg), fmt, args);

    char fullMsg[512];
    snprintf(fullMsg, sizeof(fullMsg), "[%06ld][%s][%s] %s:%d %s",
             elapsedMs(), tag, levelTag(level), basename(file), line, userMsg);

    std::lock_guard<std::mutex> lock(sinkMutex_);
    if (callback_)
        callback_(static_cast<int>(level), fullMsg, callbackUserData_);
    else
        fprintf(stderr, "%s\n", fullMsg);
}

// --- Public API ---

void Logger::setLevel(LogLevel level)
{
    level_.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Logger::getLevel()
{
    return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
}

bool Logger::parseLevel(const char* text, LogLevel& level)
{
    if (!text)
        return false;
    if (std::strcmp(text, "off") == 0)   { level = LogLevel::off;   return true; }
    if (std::strcmp(text, "warn") == 0)  { level = LogLevel::warn;  return true; }
    if (std::strcmp(text, "info") == 0)  { level = LogLevel::info;  return true; }
    if (std::strcmp(text, "debug") == 0) { level = LogLevel::debug; return true; }
    if (std::strcmp(text, "trace") == 0) { level = LogLevel::trace; return true; }
    return false;
}

void Logger::log(LogLevel level, const char* file, int line, const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    emit(level, "ST", file, line, fmt, args);
    va_end(args);
}

void Logger::logWorker(LogLevel level, const char* file, int line, const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    emit(level, "WK", file, line, fmt, args);
    va_end(args);
}

void Logger::setCallback(LogCallback callback, void* userData)
{
    std::lock_guard<std::mutex> lock(sinkMutex_);
    callback_ = callback;
    callbackUserData_ = userData;
}

} // namespace labflow
