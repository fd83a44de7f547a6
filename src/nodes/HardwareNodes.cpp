#include "nodes/HardwareNodes.h"
#include "core/Config.h"
#include "core/Logger.h"
#include "hal/Device.h"

#include <algorithm>
#include <cmath>

namespace labflow {

namespace {

NodeDefinition hardwareDefinition(const char* name, const char* description)
{
    NodeDefinition d;
    d.typeName = name;
    d.category = NodeCategory::hardware;
    d.description = description;
    return d;
}

// Output devices have no `read`; their last written state stands in.
std::string readActionFor(const Device& device)
{
    return device.hasAction("read") ? "read" : "get_state";
}

} // namespace

// ═══════════════════════════════════════════════════════════════════
// Experiment-level device nodes
// ═══════════════════════════════════════════════════════════════════

OutputNode::OutputNode(std::string id) : HardwareNode(std::move(id), describe()) {}

NodeDefinition OutputNode::describe()
{
    auto d = hardwareDefinition("Output", "Write HIGH/LOW to a device");
    d.inputs = {execPort("exec"), dataPort("value", "bool", true, "HIGH (1) or LOW (0)")};
    d.outputs = {execPort("next", "Triggers after the write")};
    return d;
}

void OutputNode::onDeviceExec(int)
{
    const Value& state = getState();
    bool value = state.contains("value") ? toBool(state["value"], true) : toBool(getInput(1), true);
    LF_DEBUG("Output %s: %s", getId().c_str(), value ? "HIGH" : "LOW");
    runAction("set", value, [this](const Value&) { fireExec(0); });
}

InputNode::InputNode(std::string id) : HardwareNode(std::move(id), describe()) {}

NodeDefinition InputNode::describe()
{
    auto d = hardwareDefinition("Input", "Read from a device (digital or analog)");
    d.inputs = {execPort("exec")};
    d.outputs = {dataPort("value", "any", nullptr, "Read value"), execPort("next")};
    return d;
}

void InputNode::onDeviceExec(int)
{
    runAction(readActionFor(*getDevice()), nullptr, [this](const Value& value) {
        setOutput(0, value);
        fireExec(1);
    });
}

MotorGovernorNode::MotorGovernorNode(std::string id) : HardwareNode(std::move(id), describe()) {}

NodeDefinition MotorGovernorNode::describe()
{
    auto d = hardwareDefinition("MotorGovernor", "Control a motor governor (up/down/stop)");
    d.inputs = {execPort("exec")};
    d.outputs = {execPort("next", "Triggers after the action")};
    return d;
}

void MotorGovernorNode::onDeviceExec(int)
{
    std::string action = stateString(getState(), "action", "stop");
    if (action != "up" && action != "down" && action != "stop")
    {
        setError("Unknown motor governor action: " + action);
        return;
    }
    runAction(action, nullptr, [this](const Value&) { fireExec(0); });
}

DeviceActionNode::DeviceActionNode(std::string id) : HardwareNode(std::move(id), describe()) {}

NodeDefinition DeviceActionNode::describe()
{
    auto d = hardwareDefinition("DeviceAction", "Execute a named action on a device");
    d.inputs = {execPort("exec"), dataPort("argument", "any", nullptr, "Optional action argument")};
    d.outputs = {execPort("next"), dataPort("result", "any", nullptr, "Action result")};
    return d;
}

void DeviceActionNode::onDeviceExec(int)
{
    std::string action = stateString(getState(), "action",
                                     stateString(getState(), "action_name", ""));
    if (action.empty())
    {
        setError("No action specified");
        return;
    }
    runAction(action, getInput(1), [this](const Value& result) {
        setOutput(1, result);
        fireExec(0);
    });
}

// ═══════════════════════════════════════════════════════════════════
// Polling reads
// ═══════════════════════════════════════════════════════════════════

PollingReadNode::PollingReadNode(std::string id, NodeDefinition definition, double defaultPollInterval)
    : HardwareNode(std::move(id), std::move(definition))
    , defaultPollInterval_(defaultPollInterval)
{
}

double PollingReadNode::pollInterval() const
{
    return std::max(0.001, stateNumber("poll_interval", defaultPollInterval_));
}

void PollingReadNode::onStart()
{
    if (!stateBool(getState(), "continuous", false))
        return;
    LF_DEBUG("%s %s: polling every %.3f s", getTypeName().c_str(), getId().c_str(), pollInterval());
    tasks().callAfter(0.0, [this]() { poll(); });
}

void PollingReadNode::poll()
{
    trigger(0);
    if (isRunning())
        tasks().callAfter(pollInterval(), [this]() { poll(); });
}

DeviceReadNode::DeviceReadNode(std::string id)
    : PollingReadNode(std::move(id), describe(), 0.1)
{
}

NodeDefinition DeviceReadNode::describe()
{
    auto d = hardwareDefinition("DeviceRead", "Read a value from a device");
    d.inputs = {execPort("exec")};
    d.outputs = {execPort("next"), dataPort("value", "any", nullptr, "Read value")};
    return d;
}

void DeviceReadNode::onDeviceExec(int)
{
    std::string action = stateString(getState(), "read_action", "read");
    runAction(action, nullptr, [this](const Value& value) {
        setOutput(1, value);
        fireExec(0);
    });
}

DigitalReadNode::DigitalReadNode(std::string id)
    : PollingReadNode(std::move(id), describe(), 0.1)
{
}

NodeDefinition DigitalReadNode::describe()
{
    auto d = hardwareDefinition("DigitalRead", "Read HIGH or LOW from a digital input pin");
    d.inputs = {execPort("exec")};
    d.outputs = {execPort("exec"), dataPort("value", "bool", nullptr, "True = HIGH")};
    return d;
}

void DigitalReadNode::onDeviceExec(int)
{
    runAction(readActionFor(*getDevice()), nullptr, [this](const Value& value) {
        setOutput(1, toBool(value));
        fireExec(0);
    });
}

AnalogReadNode::AnalogReadNode(std::string id)
    : PollingReadNode(std::move(id), describe(), 0.05)
{
}

NodeDefinition AnalogReadNode::describe()
{
    auto d = hardwareDefinition("AnalogRead", "Read an analog value (0-1023 for a 10-bit ADC)");
    d.inputs = {execPort("exec")};
    d.outputs = {execPort("exec"), dataPort("value", "int", nullptr, "Raw analog value"),
                 dataPort("voltage", "number"), dataPort("threshold_exceeded", "bool")};
    return d;
}

void AnalogReadNode::onDeviceExec(int)
{
    const Value& state = getState();
    double reference = stateDouble(state, "reference_voltage",
                                   config() ? config()->hardware.adcReferenceVoltage : 5.0);
    int resolution = stateInt(state, "resolution",
                              getDevice()->getBoard().getCapabilities().analogResolution);
    bool thresholdEnabled = stateBool(state, "threshold_enabled", false);
    double threshold = stateDouble(state, "threshold", 512.0);

    runAction("read", nullptr, [=](const Value& raw) {
        double value = toDouble(raw);
        double maxValue = resolution > 0 ? std::pow(2.0, resolution) - 1.0 : 1.0;
        setOutput(1, raw);
        setOutput(2, value / maxValue * reference);
        setOutput(3, thresholdEnabled && value > threshold);
        fireExec(0);
    });
}

DigitalWriteNode::DigitalWriteNode(std::string id) : HardwareNode(std::move(id), describe()) {}

NodeDefinition DigitalWriteNode::describe()
{
    auto d = hardwareDefinition("DigitalWrite", "Write HIGH or LOW to a digital output pin");
    d.inputs = {execPort("exec"), dataPort("value", "bool", false, "True = HIGH")};
    d.outputs = {execPort("exec", "Triggered after the write completes")};
    return d;
}

void DigitalWriteNode::onDeviceExec(int)
{
    runAction("set", toBool(getInput(1)), [this](const Value&) { fireExec(0); });
}

PWMWriteNode::PWMWriteNode(std::string id) : HardwareNode(std::move(id), describe()) {}

NodeDefinition PWMWriteNode::describe()
{
    auto d = hardwareDefinition("PWMWrite", "Write a PWM value (0-255)");
    d.inputs = {execPort("exec"), dataPort("value", "int", 0, "PWM duty 0-255")};
    d.outputs = {execPort("exec", "Triggered after the write completes")};
    return d;
}

void PWMWriteNode::onDeviceExec(int)
{
    int value = std::max(0, std::min(255, toInt(getInput(1), 0)));
    runAction("set", value, [this](const Value&) { fireExec(0); });
}

// ═══════════════════════════════════════════════════════════════════
// WaitForInput
// ═══════════════════════════════════════════════════════════════════

WaitForInputNode::WaitForInputNode(std::string id) : HardwareNode(std::move(id), describe()) {}

NodeDefinition WaitForInputNode::describe()
{
    auto d = hardwareDefinition("WaitForInput", "Wait for input trigger (digital or analog threshold)");
    d.inputs = {execPort("exec", "Start waiting")};
    d.outputs = {execPort("triggered", "Executes when triggered"),
                 execPort("timeout", "Executes on timeout"),
                 dataPort("value", "any", nullptr, "Value that met the condition")};
    return d;
}

void WaitForInputNode::onDeviceExec(int)
{
    // A new trigger restarts the wait.
    tasks().cancelAll();
    waiting_ = true;
    startedAt_ = scheduler() ? scheduler()->now() : 0.0;
    errorCount_ = 0;
    lastValue_ = nullptr;
    poll();
}

bool WaitForInputNode::conditionMet(const Value& value) const
{
    const Value& state = getState();
    if (stateString(state, "threshold_mode", "digital") == "analog")
    {
        if (!value.is_number())
            return false;
        double threshold = stateDouble(state, "threshold", 512.0);
        double v = value.get<double>();
        return stateString(state, "threshold_direction", "above") == "below" ? v < threshold
                                                                             : v > threshold;
    }
    // Rising edge. A first reading that is already HIGH counts.
    return !toBool(lastValue_) && toBool(value);
}

void WaitForInputNode::schedulePoll()
{
    double interval = std::max(0.001, stateNumber("poll_interval", 0.05));
    tasks().callAfter(interval, [this]() { poll(); });
}

void WaitForInputNode::poll()
{
    if (!waiting_)
        return;

    double timeout = stateNumber("timeout", 0.0);
    if (timeout > 0.0 && scheduler() && scheduler()->now() - startedAt_ >= timeout)
    {
        waiting_ = false;
        LF_DEBUG("WaitForInput %s: timed out", getId().c_str());
        fireExec(1);
        return;
    }

    Device* device = getDevice();
    if (!device)
    {
        waiting_ = false;
        setError("No device bound");
        return;
    }

    std::function<void(const IoResult&)> onRead = [this](const IoResult& result) {
        if (!waiting_)
            return;
        if (!result.ok)
        {
            if (++errorCount_ >= 3)
            {
                waiting_ = false;
                setError("Device polling failed: " + result.error);
                return;
            }
            LF_WARN("WaitForInput %s: read failed (%d): %s", getId().c_str(), errorCount_,
                    result.error.c_str());
            schedulePoll();
            return;
        }

        errorCount_ = 0;
        if (conditionMet(result.value))
        {
            waiting_ = false;
            setOutput(2, result.value);
            fireExec(0);
            return;
        }
        lastValue_ = result.value;
        schedulePoll();
    };
    device->executeAction(readActionFor(*device), nullptr, tasks().wrap(onRead));
}

void WaitForInputNode::onStop()
{
    waiting_ = false;
}

} // namespace labflow
