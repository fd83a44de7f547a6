#include "hal/HalTypes.h"

namespace labflow {

const char* toString(OperationKind kind)
{
    switch (kind)
    {
        case OperationKind::digital: return "DIGITAL";
        case OperationKind::analog:  return "ANALOG";
        case OperationKind::pwm:     return "PWM";
        case OperationKind::servo:   return "SERVO";
        case OperationKind::i2c:     return "I2C";
        case OperationKind::spi:     return "SPI";
    }
    return "UNKNOWN";
}

const char* toString(PinMode mode)
{
    switch (mode)
    {
        case PinMode::input:         return "INPUT";
        case PinMode::output:        return "OUTPUT";
        case PinMode::inputPullup:   return "INPUT_PULLUP";
        case PinMode::inputPulldown: return "INPUT_PULLDOWN";
    }
    return "UNKNOWN";
}

const char* toString(BoardState state)
{
    switch (state)
    {
        case BoardState::disconnected: return "DISCONNECTED";
        case BoardState::connecting:   return "CONNECTING";
        case BoardState::connected:    return "CONNECTED";
        case BoardState::error:        return "ERROR";
        case BoardState::reconnecting: return "RECONNECTING";
    }
    return "UNKNOWN";
}

bool parseOperationKind(const std::string& text, OperationKind& kind)
{
    static const std::map<std::string, OperationKind> names = {
        {"DIGITAL", OperationKind::digital}, {"digital", OperationKind::digital},
        {"ANALOG", OperationKind::analog},   {"analog", OperationKind::analog},
        {"PWM", OperationKind::pwm},         {"pwm", OperationKind::pwm},
        {"SERVO", OperationKind::servo},     {"servo", OperationKind::servo},
        {"I2C", OperationKind::i2c},         {"i2c", OperationKind::i2c},
        {"SPI", OperationKind::spi},         {"spi", OperationKind::spi},
    };
    auto it = names.find(text);
    if (it == names.end())
        return false;
    kind = it->second;
    return true;
}

std::string describeKinds(const std::set<OperationKind>& kinds)
{
    std::string out = "{";
    bool first = true;
    for (auto kind : kinds)
    {
        if (!first)
            out += ", ";
        out += toString(kind);
        first = false;
    }
    return out + "}";
}

const PinCapability* BoardCapabilities::find(int pin) const
{
    auto it = pins.find(pin);
    return it == pins.end() ? nullptr : &it->second;
}

bool BoardCapabilities::supports(int pin, OperationKind kind) const
{
    const PinCapability* cap = find(pin);
    return cap && cap->supports(kind);
}

int BoardCapabilities::maxValueFor(int pin, OperationKind kind) const
{
    switch (kind)
    {
        case OperationKind::digital: return 1;
        case OperationKind::analog:  return (1 << analogResolution) - 1;
        case OperationKind::pwm:     return pwmMax;
        case OperationKind::servo:   return servoMax;
        default: break;
    }
    const PinCapability* cap = find(pin);
    return cap ? cap->maxValue : 0;
}

} // namespace labflow
