#pragma once

#include "core/Value.h"

#include <functional>
#include <map>
#include <set>
#include <string>

namespace labflow {

enum class OperationKind { digital, analog, pwm, servo, i2c, spi };
enum class PinMode { input, output, inputPullup, inputPulldown };
enum class BoardState { disconnected, connecting, connected, error, reconnecting };

const char* toString(OperationKind kind);
const char* toString(PinMode mode);
const char* toString(BoardState state);

bool parseOperationKind(const std::string& text, OperationKind& kind);

std::string describeKinds(const std::set<OperationKind>& kinds);

struct PinCapability {
    std::set<OperationKind> kinds;
    int maxValue = 1;
    std::string description;

    bool supports(OperationKind kind) const { return kinds.count(kind) > 0; }
};

struct BoardCapabilities {
    std::string name;
    std::map<int, PinCapability> pins;
    int analogResolution = 10;   // bits
    int pwmMax = 255;
    int servoMax = 180;

    const PinCapability* find(int pin) const;
    bool supports(int pin, OperationKind kind) const;

    // Largest value accepted (writes) or produced (reads) for kind on pin.
    int maxValueFor(int pin, OperationKind kind) const;
};

/// Outcome of an asynchronous hardware operation.
struct IoResult {
    bool ok = true;
    std::string error;
    Value value;

    static IoResult success(Value value = nullptr) { return {true, {}, std::move(value)}; }
    static IoResult failure(std::string error) { return {false, std::move(error), nullptr}; }
};

using IoCallback = std::function<void(const IoResult&)>;

} // namespace labflow
