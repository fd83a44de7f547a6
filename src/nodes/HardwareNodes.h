#pragma once

#include "engine/Node.h"

namespace labflow {

/// Writes HIGH/LOW through the device `set` action. State `value` overrides
/// the value input.
class OutputNode : public HardwareNode {
public:
    explicit OutputNode(std::string id);
    static NodeDefinition describe();

protected:
    void onDeviceExec(int inputIndex) override;
};

/// Reads the device (`read`, or `get_state` for output devices).
class InputNode : public HardwareNode {
public:
    explicit InputNode(std::string id);
    static NodeDefinition describe();

protected:
    void onDeviceExec(int inputIndex) override;
};

/// Runs state `action` (up, down or stop) on a motor governor device.
class MotorGovernorNode : public HardwareNode {
public:
    explicit MotorGovernorNode(std::string id);
    static NodeDefinition describe();

protected:
    void onDeviceExec(int inputIndex) override;
};

/// Runs any named device action (state `action`) with the `argument` input.
class DeviceActionNode : public HardwareNode {
public:
    explicit DeviceActionNode(std::string id);
    static NodeDefinition describe();

protected:
    void onDeviceExec(int inputIndex) override;
};

/// Base of the read nodes. With state `continuous` set, the node triggers
/// itself every `poll_interval` seconds while the flow runs.
class PollingReadNode : public HardwareNode {
public:
    PollingReadNode(std::string id, NodeDefinition definition, double defaultPollInterval);

    double pollInterval() const;

protected:
    void onStart() override;

private:
    void poll();

    double defaultPollInterval_;
};

/// Reads the device (state `read_action`, default `read`).
class DeviceReadNode : public PollingReadNode {
public:
    explicit DeviceReadNode(std::string id);
    static NodeDefinition describe();

protected:
    void onDeviceExec(int inputIndex) override;
};

class DigitalWriteNode : public HardwareNode {
public:
    explicit DigitalWriteNode(std::string id);
    static NodeDefinition describe();

protected:
    void onDeviceExec(int inputIndex) override;
};

class DigitalReadNode : public PollingReadNode {
public:
    explicit DigitalReadNode(std::string id);
    static NodeDefinition describe();

protected:
    void onDeviceExec(int inputIndex) override;
};

/// Raw reading plus its voltage (`reference_voltage` over `resolution` bits)
/// and, with `threshold_enabled`, whether it exceeds `threshold`.
class AnalogReadNode : public PollingReadNode {
public:
    explicit AnalogReadNode(std::string id);
    static NodeDefinition describe();

protected:
    void onDeviceExec(int inputIndex) override;
};

/// PWM duty 0 to 255. An unconnected value input writes 0.
class PWMWriteNode : public HardwareNode {
public:
    explicit PWMWriteNode(std::string id);
    static NodeDefinition describe();

protected:
    void onDeviceExec(int inputIndex) override;
};

/// Polls the bound device until a digital rising edge, or an analog value
/// above / below `threshold`, then fires `triggered` with the value. Fires
/// `timeout` after `timeout` seconds (0 waits forever). Three consecutive
/// read failures abort the wait with an error.
class WaitForInputNode : public HardwareNode {
public:
    explicit WaitForInputNode(std::string id);
    static NodeDefinition describe();

    bool isWaiting() const { return waiting_; }

protected:
    void onDeviceExec(int inputIndex) override;
    void onStop() override;

private:
    void poll();
    void schedulePoll();
    bool conditionMet(const Value& value) const;

    bool waiting_ = false;
    double startedAt_ = 0.0;
    int errorCount_ = 0;
    Value lastValue_;
};

} // namespace labflow
