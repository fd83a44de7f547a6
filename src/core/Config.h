#pragma once

#include "core/Logger.h"

#include <nlohmann/json.hpp>

#include <string>

namespace labflow {

struct TimingConfig {
    double functionExecutionTimeout = 60.0;  // seconds
    double reconnectInterval = 5.0;
    double boardReadyTimeout = 10.0;
    double defaultPollInterval = 0.1;
    double pulseDuration = 0.05;
};

struct HardwareConfig {
    double adcReferenceVoltage = 5.0;
    int servoMinAngle = 0;
    int servoMaxAngle = 180;
    int serialBaud = 115200;
};

struct LoggingConfig {
    LogLevel level = LogLevel::warn;
};

struct Config {
    TimingConfig timing;
    HardwareConfig hardware;
    LoggingConfig logging;

    nlohmann::json toJson() const;

    // Overlays recognised keys onto *this; unknown keys are ignored.
    bool applyJson(const nlohmann::json& json, std::string& error);

    // A missing file leaves defaults and succeeds.
    bool load(const std::string& path, std::string& error);
    bool save(const std::string& path, std::string& error) const;

    static std::string defaultPath();
};

} // namespace labflow
