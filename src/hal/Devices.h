#pragma once

#include "hal/Device.h"

namespace labflow {

/// LED, relay. Role "output".
class DigitalOutputDevice : public Device {
public:
    using Device::Device;

    std::string getType() const override { return "DigitalOutput"; }
    std::vector<std::string> requiredPins() const override { return {"output"}; }
    OperationKind pinKind(const std::string&) const override { return OperationKind::digital; }
    std::vector<std::string> actions() const override
    {
        return {"on", "off", "toggle", "set", "get_state"};
    }

    bool getOutputState() const { return state_; }

protected:
    void doInitialize(IoCallback done) override;
    void doShutdown(IoCallback done) override;
    void doAction(const std::string& name, const Value& argument, IoCallback done) override;

private:
    void write(bool value, IoCallback done);

    bool state_ = false;
};

/// Button, beam break. Role "input"; setting "pullup".
/// Pin reports from the board update the last value and notify change
/// observers without an explicit read.
class DigitalInputDevice : public Device {
public:
    using Device::Device;
    ~DigitalInputDevice() override;

    std::string getType() const override { return "DigitalInput"; }
    std::vector<std::string> requiredPins() const override { return {"input"}; }
    OperationKind pinKind(const std::string&) const override { return OperationKind::digital; }
    std::vector<std::string> actions() const override { return {"read"}; }

    // null until the first read or report
    const Value& getLastValue() const { return lastValue_; }

protected:
    void doInitialize(IoCallback done) override;
    void doShutdown(IoCallback done) override;
    void doAction(const std::string& name, const Value& argument, IoCallback done) override;

private:
    void update(bool value);
    void unsubscribe();

    Value lastValue_;
    uint32_t pinSubscription_ = 0;
};

/// Potentiometer, light sensor. Role "input"; setting "reference_voltage".
class AnalogInputDevice : public Device {
public:
    using Device::Device;

    std::string getType() const override { return "AnalogInput"; }
    std::vector<std::string> requiredPins() const override { return {"input"}; }
    OperationKind pinKind(const std::string&) const override { return OperationKind::analog; }
    std::vector<std::string> actions() const override { return {"read", "read_voltage"}; }

    int maxRaw() const;
    double referenceVoltage() const;
    const Value& getLastValue() const { return lastValue_; }

protected:
    void doInitialize(IoCallback done) override;
    void doAction(const std::string& name, const Value& argument, IoCallback done) override;

private:
    void read(std::function<void(const IoResult&, int)> done);

    Value lastValue_;
};

/// Dimmable LED, motor speed. Role "output".
class PWMOutputDevice : public Device {
public:
    using Device::Device;

    std::string getType() const override { return "PWMOutput"; }
    std::vector<std::string> requiredPins() const override { return {"output"}; }
    OperationKind pinKind(const std::string&) const override { return OperationKind::pwm; }
    std::vector<std::string> actions() const override { return {"set", "set_percent", "off"}; }

    int getValue() const { return value_; }

protected:
    void doInitialize(IoCallback done) override;
    void doShutdown(IoCallback done) override;
    void doAction(const std::string& name, const Value& argument, IoCallback done) override;

private:
    void setValue(int value, IoCallback done);

    int value_ = 0;
};

/// Hobby servo. Role "signal"; settings "min_angle", "max_angle".
/// Servos hold position on shutdown.
class ServoDevice : public Device {
public:
    ServoDevice(std::string id, std::string name, Board& board, DeviceConfig config);

    std::string getType() const override { return "Servo"; }
    std::vector<std::string> requiredPins() const override { return {"signal"}; }
    OperationKind pinKind(const std::string&) const override { return OperationKind::servo; }
    std::vector<std::string> actions() const override { return {"set_angle", "center"}; }

    int getAngle() const { return angle_; }
    int getMinAngle() const { return minAngle_; }
    int getMaxAngle() const { return maxAngle_; }

protected:
    void doInitialize(IoCallback done) override;
    void doAction(const std::string& name, const Value& argument, IoCallback done) override;

private:
    void setAngle(int angle, IoCallback done);

    int angle_ = 90;
    int minAngle_;
    int maxAngle_;
};

/// Motorised positioner driven by two pulse lines with analog position
/// feedback. Roles "up", "down" (digital) and "signal" (analog); setting
/// "pulse_duration" in seconds.
class MotorGovernorDevice : public Device {
public:
    using Device::Device;

    std::string getType() const override { return "MotorGovernor"; }
    std::vector<std::string> requiredPins() const override { return {"up", "down", "signal"}; }
    OperationKind pinKind(const std::string& role) const override
    {
        return role == "signal" ? OperationKind::analog : OperationKind::digital;
    }
    std::vector<std::string> actions() const override
    {
        return {"up", "down", "stop", "read_position"};
    }

    const Value& getPosition() const { return position_; }
    double pulseDuration() const;

protected:
    void doInitialize(IoCallback done) override;
    void doShutdown(IoCallback done) override;
    void doAction(const std::string& name, const Value& argument, IoCallback done) override;

private:
    // Holds `hold` high, pulses `pulse` high for pulseDuration(), then low.
    void move(const std::string& hold, const std::string& pulse, IoCallback done);
    void stop(IoCallback done);

    Value position_;
};

} // namespace labflow
