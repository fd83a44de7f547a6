#include "nodes/LogicNodes.h"

#include <algorithm>
#include <chrono>

namespace labflow {

namespace {

NodeDefinition binaryOperation(const char* name, const char* description, double defaultB)
{
    NodeDefinition d;
    d.typeName = name;
    d.category = NodeCategory::logic;
    d.description = description;
    d.inputs = {dataPort("A", "number", 0.0), dataPort("B", "number", defaultB)};
    d.outputs = {dataPort("Result", "number")};
    return d;
}

} // namespace

AddNode::AddNode(std::string id) : LogicNode(std::move(id), describe()) {}

NodeDefinition AddNode::describe()
{
    return binaryOperation("Add", "Add two numbers: A + B", 0.0);
}

void AddNode::process()
{
    setOutput(0, toDouble(getInput(0)) + toDouble(getInput(1)));
}

SubtractNode::SubtractNode(std::string id) : LogicNode(std::move(id), describe()) {}

NodeDefinition SubtractNode::describe()
{
    return binaryOperation("Subtract", "Subtract two numbers: A - B", 0.0);
}

void SubtractNode::process()
{
    setOutput(0, toDouble(getInput(0)) - toDouble(getInput(1)));
}

MultiplyNode::MultiplyNode(std::string id) : LogicNode(std::move(id), describe()) {}

NodeDefinition MultiplyNode::describe()
{
    return binaryOperation("Multiply", "Multiply two numbers: A * B", 1.0);
}

void MultiplyNode::process()
{
    setOutput(0, toDouble(getInput(0)) * toDouble(getInput(1), 1.0));
}

DivideNode::DivideNode(std::string id) : LogicNode(std::move(id), describe()) {}

NodeDefinition DivideNode::describe()
{
    return binaryOperation("Divide", "Divide two numbers: A / B", 1.0);
}

void DivideNode::process()
{
    double b = toDouble(getInput(1), 1.0);
    if (b == 0.0)
    {
        setError("Division by zero");
        setOutput(0, 0.0);
        return;
    }
    setOutput(0, toDouble(getInput(0)) / b);
}

// ═══════════════════════════════════════════════════════════════════
// Ranges
// ═══════════════════════════════════════════════════════════════════

MapRangeNode::MapRangeNode(std::string id) : LogicNode(std::move(id), describe()) {}

NodeDefinition MapRangeNode::describe()
{
    NodeDefinition d;
    d.typeName = "Map Range";
    d.category = NodeCategory::logic;
    d.description = "Map value from input range to output range";
    d.inputs = {dataPort("Value", "number", 0.0), dataPort("In Min", "number", 0.0),
                dataPort("In Max", "number", 1023.0), dataPort("Out Min", "number", 0.0),
                dataPort("Out Max", "number", 255.0)};
    d.outputs = {dataPort("Result", "number")};
    return d;
}

void MapRangeNode::process()
{
    double value = toDouble(getInput(0));
    double inMin = toDouble(getInput(1));
    double inMax = toDouble(getInput(2), 1023.0);
    double outMin = toDouble(getInput(3));
    double outMax = toDouble(getInput(4), 255.0);

    if (inMax == inMin)
    {
        setOutput(0, outMin);
        return;
    }
    setOutput(0, (value - inMin) * (outMax - outMin) / (inMax - inMin) + outMin);
}

ClampNode::ClampNode(std::string id) : LogicNode(std::move(id), describe()) {}

NodeDefinition ClampNode::describe()
{
    NodeDefinition d;
    d.typeName = "Clamp";
    d.category = NodeCategory::logic;
    d.description = "Clamp value between min and max";
    d.inputs = {dataPort("Value", "number", 0.0), dataPort("Min", "number", 0.0),
                dataPort("Max", "number", 100.0)};
    d.outputs = {dataPort("Result", "number")};
    return d;
}

void ClampNode::process()
{
    double value = toDouble(getInput(0));
    double lo = toDouble(getInput(1));
    double hi = toDouble(getInput(2), 100.0);
    setOutput(0, std::max(lo, std::min(hi, value)));
}

ThresholdNode::ThresholdNode(std::string id) : LogicNode(std::move(id), describe()) {}

NodeDefinition ThresholdNode::describe()
{
    NodeDefinition d;
    d.typeName = "Threshold";
    d.category = NodeCategory::logic;
    d.description = "Check if value exceeds threshold with optional hysteresis";
    d.inputs = {dataPort("Value", "number", 0.0), dataPort("Threshold", "number", 50.0),
                dataPort("Hysteresis", "number", 0.0)};
    d.outputs = {dataPort("Above", "bool"), dataPort("Below", "bool")};
    return d;
}

void ThresholdNode::process()
{
    double value = toDouble(getInput(0));
    double threshold = toDouble(getInput(1), 50.0);
    double hysteresis = toDouble(getInput(2));

    above_ = above_ ? value > threshold - hysteresis
                    : value > threshold + hysteresis;
    setOutput(0, above_);
    setOutput(1, !above_);
}

InRangeNode::InRangeNode(std::string id) : LogicNode(std::move(id), describe()) {}

NodeDefinition InRangeNode::describe()
{
    NodeDefinition d;
    d.typeName = "In Range";
    d.category = NodeCategory::logic;
    d.description = "Check if value is within min/max range";
    d.inputs = {dataPort("Value", "number", 0.0), dataPort("Min", "number", 0.0),
                dataPort("Max", "number", 100.0)};
    d.outputs = {dataPort("In Range", "bool"), dataPort("Out of Range", "bool")};
    return d;
}

void InRangeNode::process()
{
    double value = toDouble(getInput(0));
    bool inside = toDouble(getInput(1)) <= value && value <= toDouble(getInput(2), 100.0);
    setOutput(0, inside);
    setOutput(1, !inside);
}

// ═══════════════════════════════════════════════════════════════════
// PID
// ═══════════════════════════════════════════════════════════════════

PIDNode::PIDNode(std::string id) : LogicNode(std::move(id), describe()) {}

NodeDefinition PIDNode::describe()
{
    NodeDefinition d;
    d.typeName = "PID Controller";
    d.category = NodeCategory::logic;
    d.description = "Proportional-Integral-Derivative controller";
    d.inputs = {dataPort("Setpoint", "number", 0.0), dataPort("Process Value", "number", 0.0),
                dataPort("Kp", "number", 1.0), dataPort("Ki", "number", 0.0),
                dataPort("Kd", "number", 0.0)};
    d.outputs = {dataPort("Output", "number"), dataPort("Error", "number")};
    return d;
}

void PIDNode::reset()
{
    integral_ = 0.0;
    lastError_ = 0.0;
    lastTime_ = -1.0;
}

double PIDNode::clockNow() const
{
    if (scheduler())
        return scheduler()->now();
    using namespace std::chrono;
    return duration<double>(steady_clock::now().time_since_epoch()).count();
}

void PIDNode::process()
{
    double setpoint = toDouble(getInput(0));
    double measured = toDouble(getInput(1));
    double kp = toDouble(getInput(2), 1.0);
    double ki = toDouble(getInput(3));
    double kd = toDouble(getInput(4));

    double now = clockNow();
    double dt = lastTime_ < 0.0 ? 0.0 : now - lastTime_;
    if (dt <= 0.0)
        dt = 0.001;
    lastTime_ = now;

    double error = setpoint - measured;
    setOutput(1, error);

    integral_ += error * dt;
    double derivative = (error - lastError_) / dt;
    lastError_ = error;

    double output = kp * error + ki * integral_ + kd * derivative;
    output = std::max(outputMin_, std::min(outputMax_, output));

    // Anti-windup
    if (output >= outputMax_ || output <= outputMin_)
        integral_ -= error * dt;

    syncing_ = true;
    setStateValue("integral", integral_);
    setStateValue("last_error", lastError_);
    syncing_ = false;

    setOutput(0, output);
}

void PIDNode::onStateChanged()
{
    if (syncing_)
        return;
    const Value& state = getState();
    integral_ = stateDouble(state, "integral", 0.0);
    lastError_ = stateDouble(state, "last_error", 0.0);
    outputMin_ = stateDouble(state, "output_min", -255.0);
    outputMax_ = stateDouble(state, "output_max", 255.0);
}

} // namespace labflow
