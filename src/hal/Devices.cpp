#include "hal/Devices.h"
#include "core/Logger.h"

#include <algorithm>

namespace labflow {

static IoResult unknownAction(const std::string& type, const std::string& name)
{
    return IoResult::failure("Unknown action for " + type + ": " + name);
}

// ═══════════════════════════════════════════════════════════════════
// DigitalOutputDevice
// ═══════════════════════════════════════════════════════════════════

void DigitalOutputDevice::doInitialize(IoCallback done)
{
    int p = pin("output");
    runSteps({
        [this, p](IoCallback next) { board_.setPinMode(p, PinMode::output, OperationKind::digital, next); },
        [this](IoCallback next) { write(false, next); },
    }, std::move(done));
}

void DigitalOutputDevice::doShutdown(IoCallback done)
{
    write(false, std::move(done));
}

void DigitalOutputDevice::write(bool value, IoCallback done)
{
    board_.writeDigital(pin("output"), value, guard([this, value, done](const IoResult& result) {
        if (result.ok)
            state_ = value;
        if (done)
            done(result.ok ? IoResult::success(state_) : result);
    }));
}

void DigitalOutputDevice::doAction(const std::string& name, const Value& argument, IoCallback done)
{
    if (name == "on")
        write(true, std::move(done));
    else if (name == "off")
        write(false, std::move(done));
    else if (name == "toggle")
        write(!state_, std::move(done));
    else if (name == "set")
        write(toBool(argument), std::move(done));
    else if (name == "get_state")
        done(IoResult::success(state_));
    else
        done(unknownAction(getType(), name));
}

// ═══════════════════════════════════════════════════════════════════
// DigitalInputDevice
// ═══════════════════════════════════════════════════════════════════

DigitalInputDevice::~DigitalInputDevice()
{
    unsubscribe();
}

void DigitalInputDevice::unsubscribe()
{
    if (pinSubscription_ != 0)
    {
        board_.removePinObserver(pinSubscription_);
        pinSubscription_ = 0;
    }
}

void DigitalInputDevice::doInitialize(IoCallback done)
{
    PinMode mode = stateBool(config_.settings, "pullup", false) ? PinMode::inputPullup : PinMode::input;
    unsubscribe();
    pinSubscription_ = board_.addPinObserver(pin("input"), [this](int, const Value& value) {
        update(toBool(value));
    });
    board_.setPinMode(pin("input"), mode, OperationKind::digital, std::move(done));
}

void DigitalInputDevice::doShutdown(IoCallback done)
{
    unsubscribe();
    done(IoResult::success());
}

void DigitalInputDevice::update(bool value)
{
    if (lastValue_.is_boolean() && lastValue_.get<bool>() == value)
        return;
    lastValue_ = value;
    notifyChange(lastValue_);
}

void DigitalInputDevice::doAction(const std::string& name, const Value&, IoCallback done)
{
    if (name != "read")
    {
        done(unknownAction(getType(), name));
        return;
    }
    board_.readDigital(pin("input"), guard([this, done](const IoResult& result) {
        if (result.ok)
            update(toBool(result.value));
        done(result.ok ? IoResult::success(toBool(result.value)) : result);
    }));
}

// ═══════════════════════════════════════════════════════════════════
// AnalogInputDevice
// ═══════════════════════════════════════════════════════════════════

int AnalogInputDevice::maxRaw() const
{
    return board_.getCapabilities().maxValueFor(pin("input"), OperationKind::analog);
}

double AnalogInputDevice::referenceVoltage() const
{
    return stateDouble(config_.settings, "reference_voltage", 5.0);
}

void AnalogInputDevice::doInitialize(IoCallback done)
{
    board_.setPinMode(pin("input"), PinMode::input, OperationKind::analog, std::move(done));
}

void AnalogInputDevice::read(std::function<void(const IoResult&, int)> done)
{
    board_.readAnalog(pin("input"), guard([this, done](const IoResult& result) {
        if (!result.ok)
        {
            done(result, 0);
            return;
        }
        int raw = toInt(result.value);
        int limit = maxRaw();
        if (raw < 0 || raw > limit)
        {
            LF_WARN("AnalogInput %s: value %d out of range, clamping to 0-%d",
                    getId().c_str(), raw, limit);
            raw = std::max(0, std::min(raw, limit));
        }
        lastValue_ = raw;
        done(IoResult::success(raw), raw);
    }));
}

void AnalogInputDevice::doAction(const std::string& name, const Value&, IoCallback done)
{
    if (name == "read")
    {
        read([done](const IoResult& result, int) { done(result); });
    }
    else if (name == "read_voltage")
    {
        read([this, done](const IoResult& result, int raw) {
            if (!result.ok)
            {
                done(result);
                return;
            }
            int limit = maxRaw();
            double volts = limit > 0 ? (static_cast<double>(raw) / limit) * referenceVoltage() : 0.0;
            done(IoResult::success(volts));
        });
    }
    else
    {
        done(unknownAction(getType(), name));
    }
}

// ═══════════════════════════════════════════════════════════════════
// PWMOutputDevice
// ═══════════════════════════════════════════════════════════════════

void PWMOutputDevice::doInitialize(IoCallback done)
{
    int p = pin("output");
    runSteps({
        [this, p](IoCallback next) { board_.setPinMode(p, PinMode::output, OperationKind::pwm, next); },
        [this](IoCallback next) { setValue(0, next); },
    }, std::move(done));
}

void PWMOutputDevice::doShutdown(IoCallback done)
{
    setValue(0, std::move(done));
}

void PWMOutputDevice::setValue(int value, IoCallback done)
{
    value = std::max(0, std::min(value, board_.getCapabilities().pwmMax));
    board_.writeAnalog(pin("output"), value, guard([this, value, done](const IoResult& result) {
        if (result.ok)
            value_ = value;
        if (done)
            done(result.ok ? IoResult::success(value) : result);
    }));
}

void PWMOutputDevice::doAction(const std::string& name, const Value& argument, IoCallback done)
{
    if (name == "set")
    {
        setValue(toInt(argument), std::move(done));
    }
    else if (name == "set_percent")
    {
        double percent = std::max(0.0, std::min(toDouble(argument), 100.0));
        setValue(static_cast<int>(percent / 100.0 * board_.getCapabilities().pwmMax), std::move(done));
    }
    else if (name == "off")
    {
        setValue(0, std::move(done));
    }
    else
    {
        done(unknownAction(getType(), name));
    }
}

// ═══════════════════════════════════════════════════════════════════
// ServoDevice
// ═══════════════════════════════════════════════════════════════════

ServoDevice::ServoDevice(std::string id, std::string name, Board& board, DeviceConfig config)
    : Device(std::move(id), std::move(name), board, std::move(config))
    , minAngle_(stateInt(config_.settings, "min_angle", 0))
    , maxAngle_(stateInt(config_.settings, "max_angle", 180))
{
    if (minAngle_ > maxAngle_)
        std::swap(minAngle_, maxAngle_);
}

void ServoDevice::doInitialize(IoCallback done)
{
    int p = pin("signal");
    int center = (minAngle_ + maxAngle_) / 2;
    runSteps({
        [this, p](IoCallback next) { board_.setPinMode(p, PinMode::output, OperationKind::servo, next); },
        [this, center](IoCallback next) { setAngle(center, next); },
    }, std::move(done));
}

void ServoDevice::setAngle(int angle, IoCallback done)
{
    angle = std::max(minAngle_, std::min(angle, maxAngle_));
    board_.writeServo(pin("signal"), angle, guard([this, angle, done](const IoResult& result) {
        if (result.ok)
            angle_ = angle;
        if (done)
            done(result.ok ? IoResult::success(angle) : result);
    }));
}

void ServoDevice::doAction(const std::string& name, const Value& argument, IoCallback done)
{
    if (name == "set_angle")
        setAngle(toInt(argument, angle_), std::move(done));
    else if (name == "center")
        setAngle((minAngle_ + maxAngle_) / 2, std::move(done));
    else
        done(unknownAction(getType(), name));
}

// ═══════════════════════════════════════════════════════════════════
// MotorGovernorDevice
// ═══════════════════════════════════════════════════════════════════

double MotorGovernorDevice::pulseDuration() const
{
    return stateDouble(config_.settings, "pulse_duration", 0.05);
}

void MotorGovernorDevice::doInitialize(IoCallback done)
{
    int up = pin("up");
    int down = pin("down");
    int signal = pin("signal");
    runSteps({
        [this, up](IoCallback next) { board_.setPinMode(up, PinMode::output, OperationKind::digital, next); },
        [this, up](IoCallback next) { board_.writeDigital(up, false, next); },
        [this, down](IoCallback next) { board_.setPinMode(down, PinMode::output, OperationKind::digital, next); },
        [this, down](IoCallback next) { board_.writeDigital(down, false, next); },
        [this, signal](IoCallback next) { board_.setPinMode(signal, PinMode::input, OperationKind::analog, next); },
    }, std::move(done));
}

void MotorGovernorDevice::doShutdown(IoCallback done)
{
    stop(std::move(done));
}

void MotorGovernorDevice::move(const std::string& hold, const std::string& pulse, IoCallback done)
{
    int holdPin = pin(hold);
    int pulsePin = pin(pulse);
    double duration = pulseDuration();
    runSteps({
        [this, holdPin](IoCallback next) { board_.writeDigital(holdPin, true, next); },
        [this, pulsePin](IoCallback next) { board_.writeDigital(pulsePin, true, next); },
        [this, duration](IoCallback next) {
            tasks_.callAfter(duration, [next]() { next(IoResult::success()); });
        },
        [this, pulsePin](IoCallback next) { board_.writeDigital(pulsePin, false, next); },
    }, std::move(done));
}

void MotorGovernorDevice::stop(IoCallback done)
{
    int up = pin("up");
    int down = pin("down");
    runSteps({
        [this, up](IoCallback next) { board_.writeDigital(up, false, next); },
        [this, down](IoCallback next) { board_.writeDigital(down, false, next); },
    }, std::move(done));
}

void MotorGovernorDevice::doAction(const std::string& name, const Value&, IoCallback done)
{
    if (name == "up")
    {
        move("down", "up", std::move(done));
    }
    else if (name == "down")
    {
        move("up", "down", std::move(done));
    }
    else if (name == "stop")
    {
        stop(std::move(done));
    }
    else if (name == "read_position")
    {
        board_.readAnalog(pin("signal"), guard([this, done](const IoResult& result) {
            if (result.ok)
                position_ = toInt(result.value);
            done(result);
        }));
    }
    else
    {
        done(unknownAction(getType(), name));
    }
}

} // namespace labflow
