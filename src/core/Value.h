#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace labflow {

// Port values, node state and layouts are all JSON values. null means "unset".
using Value = nlohmann::json;

double toDouble(const Value& value, double fallback = 0.0);
int toInt(const Value& value, int fallback = 0);
bool toBool(const Value& value, bool fallback = false);
std::string toDisplayString(const Value& value);

// Reads key from a JSON object, falling back when missing or null.
double stateDouble(const Value& state, const char* key, double fallback);
int stateInt(const Value& state, const char* key, int fallback);
bool stateBool(const Value& state, const char* key, bool fallback);
std::string stateString(const Value& state, const char* key, const std::string& fallback);

} // namespace labflow
