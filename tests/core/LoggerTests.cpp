#include <catch2/catch_test_macros.hpp>

#include "core/Logger.h"

#include <string>
#include <thread>
#include <vector>

using namespace labflow;

// --- Callback helpers ---

struct CapturedLog {
    int level;
    std::string message;
};

static std::vector<CapturedLog> g_captured;

static void captureCallback(int level, const char* message, void* /*userData*/)
{
    g_captured.push_back({level, message});
}

static void resetLogger()
{
    Logger::setCallback(nullptr, nullptr);
    Logger::setLevel(LogLevel::warn);
    g_captured.clear();
}

// --- Levels ---

TEST_CASE("Logger default level is warn")
{
    resetLogger();
    REQUIRE(Logger::getLevel() == LogLevel::warn);
}

TEST_CASE("Logger parseLevel accepts the five level names")
{
    LogLevel level = LogLevel::warn;
    REQUIRE(Logger::parseLevel("off", level));
    REQUIRE(level == LogLevel::off);
    REQUIRE(Logger::parseLevel("trace", level));
    REQUIRE(level == LogLevel::trace);
    REQUIRE(Logger::parseLevel("info", level));
    REQUIRE(level == LogLevel::info);
}

TEST_CASE("Logger parseLevel rejects unknown names and leaves the level untouched")
{
    LogLevel level = LogLevel::debug;
    REQUIRE_FALSE(Logger::parseLevel("verbose", level));
    REQUIRE_FALSE(Logger::parseLevel(nullptr, level));
    REQUIRE(level == LogLevel::debug);
}

// --- Macro gating ---

TEST_CASE("LF_WARN fires at warn level")
{
    resetLogger();
    Logger::setCallback(captureCallback, nullptr);

    LF_WARN("warn msg %d", 42);
    REQUIRE(g_captured.size() == 1);
    REQUIRE(g_captured[0].message.find("[warn]") != std::string::npos);
    REQUIRE(g_captured[0].message.find("warn msg 42") != std::string::npos);
    REQUIRE(g_captured[0].level == static_cast<int>(LogLevel::warn));

    resetLogger();
}

TEST_CASE("LF_WARN is a no-op when level is off")
{
    resetLogger();
    Logger::setLevel(LogLevel::off);
    Logger::setCallback(captureCallback, nullptr);

    LF_WARN("should not appear");
    REQUIRE(g_captured.empty());

    resetLogger();
}

TEST_CASE("LF_INFO is suppressed at warn level and fires at info")
{
    resetLogger();
    Logger::setCallback(captureCallback, nullptr);

    LF_INFO("hidden");
    REQUIRE(g_captured.empty());

    Logger::setLevel(LogLevel::info);
    LF_INFO("shown");
    REQUIRE(g_captured.size() == 1);
    REQUIRE(g_captured[0].message.find("[info]") != std::string::npos);

    resetLogger();
}

TEST_CASE("LF_TRACE only fires at trace level")
{
    resetLogger();
    Logger::setLevel(LogLevel::debug);
    Logger::setCallback(captureCallback, nullptr);

    LF_TRACE("hidden");
    LF_DEBUG("debug %s", "shown");
    REQUIRE(g_captured.size() == 1);

    Logger::setLevel(LogLevel::trace);
    LF_TRACE("trace shown");
    REQUIRE(g_captured.size() == 2);
    REQUIRE(g_captured[1].message.find("[trace]") != std::string::npos);

    resetLogger();
}

// --- Message format ---

TEST_CASE("Scheduler-thread message carries timestamp, ST tag, level, file and text")
{
    resetLogger();
    Logger::setLevel(LogLevel::debug);
    Logger::setCallback(captureCallback, nullptr);

    LF_DEBUG("format test %d", 123);
    REQUIRE(g_captured.size() == 1);

    const auto& msg = g_captured[0].message;
    REQUIRE(msg[0] == '[');
    REQUIRE(msg.find("[ST]") != std::string::npos);
    REQUIRE(msg.find("[debug]") != std::string::npos);
    REQUIRE(msg.find("LoggerTests.cpp") != std::string::npos);
    REQUIRE(msg.find("format test 123") != std::string::npos);

    resetLogger();
}

TEST_CASE("Worker-thread message is tagged WK")
{
    resetLogger();
    Logger::setCallback(captureCallback, nullptr);

    std::thread worker([] { LF_WARN_WK("from worker %d", 5); });
    worker.join();

    REQUIRE(g_captured.size() == 1);
    REQUIRE(g_captured[0].message.find("[WK]") != std::string::npos);
    REQUIRE(g_captured[0].message.find("from worker 5") != std::string::npos);

    resetLogger();
}

TEST_CASE("Long messages are truncated, not overflowed")
{
    resetLogger();
    Logger::setCallback(captureCallback, nullptr);

    std::string longText(2000, 'x');
    LF_WARN("%s", longText.c_str());
    REQUIRE(g_captured.size() == 1);
    REQUIRE(g_captured[0].message.size() < 512);

    resetLogger();
}

// --- Callback ---

TEST_CASE("callback receives the level of each message")
{
    resetLogger();
    Logger::setLevel(LogLevel::trace);
    Logger::setCallback(captureCallback, nullptr);

    LF_WARN("w");
    LF_INFO("i");
    LF_DEBUG("d");
    LF_TRACE("t");

    REQUIRE(g_captured.size() == 4);
    REQUIRE(g_captured[0].level == static_cast<int>(LogLevel::warn));
    REQUIRE(g_captured[1].level == static_cast<int>(LogLevel::info));
    REQUIRE(g_captured[2].level == static_cast<int>(LogLevel::debug));
    REQUIRE(g_captured[3].level == static_cast<int>(LogLevel::trace));

    resetLogger();
}

TEST_CASE("setCallback nullptr reverts to stderr")
{
    resetLogger();
    Logger::setCallback(captureCallback, nullptr);
    Logger::setCallback(nullptr, nullptr);

    LF_WARN("after clear");
    REQUIRE(g_captured.empty());

    resetLogger();
}
