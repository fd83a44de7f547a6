#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/Config.h"

#include <cstdio>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace labflow;
using Catch::Matchers::WithinAbs;

static std::string tempPath(const char* name)
{
    return "/tmp/labflow_" + std::to_string(::getpid()) + "_" + name;
}

TEST_CASE("Config defaults")
{
    Config config;
    REQUIRE_THAT(config.timing.functionExecutionTimeout, WithinAbs(60.0, 1e-12));
    REQUIRE_THAT(config.timing.reconnectInterval, WithinAbs(5.0, 1e-12));
    REQUIRE_THAT(config.hardware.adcReferenceVoltage, WithinAbs(5.0, 1e-12));
    REQUIRE(config.hardware.serialBaud == 115200);
    REQUIRE(config.logging.level == LogLevel::warn);
}

TEST_CASE("applyJson overlays only the keys present")
{
    Config config;
    std::string error;
    nlohmann::json json = {
        {"timing", {{"function_execution_timeout", 5.0}}},
        {"hardware", {{"adc_reference_voltage", 3.3}}},
        {"logging", {{"level", "debug"}}},
        {"unknown_section", 1},
    };

    REQUIRE(config.applyJson(json, error));
    REQUIRE_THAT(config.timing.functionExecutionTimeout, WithinAbs(5.0, 1e-12));
    REQUIRE_THAT(config.timing.reconnectInterval, WithinAbs(5.0, 1e-12));
    REQUIRE_THAT(config.hardware.adcReferenceVoltage, WithinAbs(3.3, 1e-12));
    REQUIRE(config.logging.level == LogLevel::debug);
}

TEST_CASE("applyJson rejects bad values with a message")
{
    Config config;
    std::string error;

    REQUIRE_FALSE(config.applyJson(nlohmann::json::array(), error));
    REQUIRE_FALSE(error.empty());

    error.clear();
    REQUIRE_FALSE(config.applyJson({{"logging", {{"level", "loud"}}}}, error));
    REQUIRE(error.find("loud") != std::string::npos);

    error.clear();
    REQUIRE_FALSE(config.applyJson({{"timing", {{"reconnect_interval", "soon"}}}}, error));
    REQUIRE_FALSE(error.empty());
}

TEST_CASE("load of a missing file keeps defaults and succeeds")
{
    Config config;
    std::string error;
    REQUIRE(config.load(tempPath("does_not_exist.json"), error));
    REQUIRE(error.empty());
    REQUIRE_THAT(config.timing.functionExecutionTimeout, WithinAbs(60.0, 1e-12));
}

TEST_CASE("load of a malformed file fails and leaves the config unchanged")
{
    auto path = tempPath("malformed.json");
    {
        std::ofstream out(path);
        out << "{ not json";
    }

    Config config;
    config.timing.pulseDuration = 0.2;
    std::string error;
    REQUIRE_FALSE(config.load(path, error));
    REQUIRE_FALSE(error.empty());
    REQUIRE_THAT(config.timing.pulseDuration, WithinAbs(0.2, 1e-12));
    std::remove(path.c_str());
}

TEST_CASE("save then load restores the values")
{
    auto path = tempPath("saved.json");
    Config original;
    original.timing.functionExecutionTimeout = 12.5;
    original.hardware.servoMaxAngle = 170;
    original.logging.level = LogLevel::info;

    std::string error;
    REQUIRE(original.save(path, error));

    Config loaded;
    REQUIRE(loaded.load(path, error));
    REQUIRE_THAT(loaded.timing.functionExecutionTimeout, WithinAbs(12.5, 1e-12));
    REQUIRE(loaded.hardware.servoMaxAngle == 170);
    REQUIRE(loaded.logging.level == LogLevel::info);
    std::remove(path.c_str());
}
