#include "core/Value.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>

namespace labflow {

double toDouble(const Value& value, double fallback)
{
    if (value.is_number())
        return value.get<double>();
    if (value.is_boolean())
        return value.get<bool>() ? 1.0 : 0.0;
    if (value.is_string())
    {
        const auto& text = value.get_ref<const std::string&>();
        char* end = nullptr;
        double parsed = std::strtod(text.c_str(), &end);
        if (end != text.c_str() && *end == '\0')
            return parsed;
    }
    return fallback;
}

// Out-of-range numbers saturate at the int limits.
int toInt(const Value& value, int fallback)
{
    using Limits = std::numeric_limits<int>;
    if (value.is_number_unsigned())
        return static_cast<int>(std::min<uint64_t>(value.get<uint64_t>(), Limits::max()));
    if (value.is_number_integer())
    {
        int64_t n = value.get<int64_t>();
        return static_cast<int>(std::max<int64_t>(Limits::min(), std::min<int64_t>(n, Limits::max())));
    }
    if (value.is_null())
        return fallback;

    double d = toDouble(value, static_cast<double>(fallback));
    if (std::isnan(d))
        return fallback;
    d = std::round(d);
    if (d >= static_cast<double>(Limits::max()))
        return Limits::max();
    if (d <= static_cast<double>(Limits::min()))
        return Limits::min();
    return static_cast<int>(d);
}

bool toBool(const Value& value, bool fallback)
{
    if (value.is_boolean())
        return value.get<bool>();
    if (value.is_number())
        return value.get<double>() != 0.0;
    if (value.is_string())
    {
        const auto& text = value.get_ref<const std::string&>();
        if (text == "true" || text == "HIGH" || text == "on" || text == "1")
            return true;
        if (text == "false" || text == "LOW" || text == "off" || text == "0" || text.empty())
            return false;
    }
    return fallback;
}

std::string toDisplayString(const Value& value)
{
    if (value.is_null())
        return "";
    if (value.is_string())
        return value.get<std::string>();
    return value.dump();
}

double stateDouble(const Value& state, const char* key, double fallback)
{
    if (!state.is_object() || !state.contains(key))
        return fallback;
    return toDouble(state.at(key), fallback);
}

int stateInt(const Value& state, const char* key, int fallback)
{
    if (!state.is_object() || !state.contains(key))
        return fallback;
    return toInt(state.at(key), fallback);
}

bool stateBool(const Value& state, const char* key, bool fallback)
{
    if (!state.is_object() || !state.contains(key))
        return fallback;
    return toBool(state.at(key), fallback);
}

std::string stateString(const Value& state, const char* key, const std::string& fallback)
{
    if (!state.is_object() || !state.contains(key))
        return fallback;
    const auto& v = state.at(key);
    if (v.is_string())
        return v.get<std::string>();
    if (v.is_null())
        return fallback;
    return v.dump();
}

} // namespace labflow
