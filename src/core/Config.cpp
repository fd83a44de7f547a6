#include "core/Config.h"

#include <cstdlib>
#include <fstream>
#include <sys/stat.h>

namespace labflow {

static const char* levelName(LogLevel level)
{
    switch (level)
    {
        case LogLevel::off:   return "off";
        case LogLevel::warn:  return "warn";
        case LogLevel::info:  return "info";
        case LogLevel::debug: return "debug";
        case LogLevel::trace: return "trace";
    }
    return "warn";
}

template <typename T>
static void readKey(const nlohmann::json& section, const char* key, T& target)
{
    auto it = section.find(key);
    if (it != section.end() && !it->is_null())
        target = it->get<T>();
}

nlohmann::json Config::toJson() const
{
    return {
        {"timing", {
            {"function_execution_timeout", timing.functionExecutionTimeout},
            {"reconnect_interval", timing.reconnectInterval},
            {"board_ready_timeout", timing.boardReadyTimeout},
            {"default_poll_interval", timing.defaultPollInterval},
            {"pulse_duration", timing.pulseDuration},
        }},
        {"hardware", {
            {"adc_reference_voltage", hardware.adcReferenceVoltage},
            {"servo_min_angle", hardware.servoMinAngle},
            {"servo_max_angle", hardware.servoMaxAngle},
            {"serial_baud", hardware.serialBaud},
        }},
        {"logging", {
            {"level", levelName(logging.level)},
        }},
    };
}

bool Config::applyJson(const nlohmann::json& json, std::string& error)
{
    if (!json.is_object())
    {
        error = "configuration root must be an object";
        return false;
    }

    try
    {
        if (json.contains("timing") && json["timing"].is_object())
        {
            const auto& t = json["timing"];
            readKey(t, "function_execution_timeout", timing.functionExecutionTimeout);
            readKey(t, "reconnect_interval", timing.reconnectInterval);
            readKey(t, "board_ready_timeout", timing.boardReadyTimeout);
            readKey(t, "default_poll_interval", timing.defaultPollInterval);
            readKey(t, "pulse_duration", timing.pulseDuration);
        }
        if (json.contains("hardware") && json["hardware"].is_object())
        {
            const auto& h = json["hardware"];
            readKey(h, "adc_reference_voltage", hardware.adcReferenceVoltage);
            readKey(h, "servo_min_angle", hardware.servoMinAngle);
            readKey(h, "servo_max_angle", hardware.servoMaxAngle);
            readKey(h, "serial_baud", hardware.serialBaud);
        }
        if (json.contains("logging") && json["logging"].is_object())
        {
            std::string level;
            readKey(json["logging"], "level", level);
            if (!level.empty() && !Logger::parseLevel(level.c_str(), logging.level))
            {
                error = "unknown log level '" + level + "'";
                return false;
            }
        }
    }
    catch (const nlohmann::json::exception& e)
    {
        error = std::string("invalid configuration value: ") + e.what();
        return false;
    }

    if (timing.functionExecutionTimeout <= 0.0 || timing.reconnectInterval <= 0.0)
    {
        error = "timeouts and intervals must be positive";
        return false;
    }
    return true;
}

bool Config::load(const std::string& path, std::string& error)
{
    std::ifstream in(path);
    if (!in)
    {
        LF_INFO("Config::load: %s not found, using defaults", path.c_str());
        return true;
    }

    nlohmann::json json = nlohmann::json::parse(in, nullptr, false);
    if (json.is_discarded())
    {
        error = "malformed configuration file: " + path;
        LF_WARN("Config::load: %s", error.c_str());
        return false;
    }

    Config candidate = *this;
    if (!candidate.applyJson(json, error))
    {
        LF_WARN("Config::load: %s: %s", path.c_str(), error.c_str());
        return false;
    }
    *this = candidate;
    LF_INFO("Config::load: loaded %s", path.c_str());
    return true;
}

bool Config::save(const std::string& path, std::string& error) const
{
    auto slash = path.find_last_of('/');
    if (slash != std::string::npos && slash > 0)
        ::mkdir(path.substr(0, slash).c_str(), 0755);

    std::ofstream out(path);
    if (!out)
    {
        error = "cannot write configuration file: " + path;
        LF_WARN("Config::save: %s", error.c_str());
        return false;
    }
    out << toJson().dump(2) << "\n";
    LF_INFO("Config::save: wrote %s", path.c_str());
    return true;
}

std::string Config::defaultPath()
{
    const char* home = std::getenv("HOME");
    std::string base = home ? home : ".";
    return base + "/.labflow/config.json";
}

} // namespace labflow
