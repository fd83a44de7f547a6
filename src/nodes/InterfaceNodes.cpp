#include "nodes/InterfaceNodes.h"
#include "core/Logger.h"

#include <algorithm>

namespace labflow {

namespace {

NodeDefinition widgetDefinition(const char* name, const char* description)
{
    NodeDefinition d;
    d.typeName = name;
    d.category = NodeCategory::interface;
    d.description = description;
    return d;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════
// Displays
// ═══════════════════════════════════════════════════════════════════

LabelNode::LabelNode(std::string id) : InterfaceNode(std::move(id), describe()) {}

NodeDefinition LabelNode::describe()
{
    auto d = widgetDefinition("Label", "Display a value as text");
    d.inputs = {dataPort("Value"), dataPort("Format", "string", "{}")};
    return d;
}

void LabelNode::process()
{
    std::string value = toDisplayString(getInput(0));
    std::string format = getInput(1).is_string() ? getInput(1).get<std::string>() : "{}";

    auto pos = format.find("{}");
    text_ = pos == std::string::npos ? format : format.replace(pos, 2, value);
    notifyUpdate("display", text_);
}

GaugeNode::GaugeNode(std::string id) : InterfaceNode(std::move(id), describe()) {}

NodeDefinition GaugeNode::describe()
{
    auto d = widgetDefinition("Gauge", "Display value as a gauge/meter");
    d.inputs = {dataPort("Value", "number", 0.0), dataPort("Min", "number", 0.0),
                dataPort("Max", "number", 100.0)};
    return d;
}

void GaugeNode::process()
{
    double value = toDouble(getInput(0));
    double lo = toDouble(getInput(1));
    double hi = toDouble(getInput(2), 100.0);
    percent_ = hi > lo ? (value - lo) / (hi - lo) * 100.0 : 0.0;

    notifyUpdate("display", Value{
        {"value", value},
        {"percent", percent_},
        {"min", lo},
        {"max", hi},
        {"unit", stateString(getState(), "unit", "")},
        {"label", stateString(getState(), "label", "Value")},
    });
}

ChartNode::ChartNode(std::string id) : InterfaceNode(std::move(id), describe()) {}

NodeDefinition ChartNode::describe()
{
    auto d = widgetDefinition("Chart", "Display real-time chart of values");
    d.inputs = {dataPort("Value", "number", 0.0)};
    return d;
}

void ChartNode::process()
{
    size_t maxPoints = static_cast<size_t>(std::max(1, stateInt(getState(), "max_points", 100)));
    data_.push_back(toDouble(getInput(0)));
    while (data_.size() > maxPoints)
        data_.pop_front();

    notifyUpdate("display", Value{
        {"data", data_},
        {"label", stateString(getState(), "label", "Chart")},
    });
}

LedIndicatorNode::LedIndicatorNode(std::string id) : InterfaceNode(std::move(id), describe()) {}

NodeDefinition LedIndicatorNode::describe()
{
    auto d = widgetDefinition("LED Indicator", "Display an on/off LED indicator");
    d.inputs = {dataPort("State", "bool", false)};
    return d;
}

void LedIndicatorNode::process()
{
    lit_ = toBool(getInput(0));
    std::string color = lit_ ? stateString(getState(), "on_color", "#00ff00")
                             : stateString(getState(), "off_color", "#333333");
    notifyUpdate("display", Value{
        {"state", lit_},
        {"color", color},
        {"label", stateString(getState(), "label", "LED")},
    });
}

// ═══════════════════════════════════════════════════════════════════
// Inputs
// ═══════════════════════════════════════════════════════════════════

ButtonNode::ButtonNode(std::string id) : InterfaceNode(std::move(id), describe()) {}

NodeDefinition ButtonNode::describe()
{
    auto d = widgetDefinition("Button", "Clickable button that triggers execution");
    d.outputs = {execPort("Pressed")};
    return d;
}

void ButtonNode::press()
{
    if (!isEnabled())
        return;
    ++pressCount_;
    LF_DEBUG("Button %s pressed (%d)", getId().c_str(), pressCount_);
    fireExec(0);
}

ToggleSwitchNode::ToggleSwitchNode(std::string id) : InterfaceNode(std::move(id), describe()) {}

NodeDefinition ToggleSwitchNode::describe()
{
    auto d = widgetDefinition("Toggle Switch", "Toggle switch for on/off control");
    d.outputs = {dataPort("State", "bool"), execPort("Changed")};
    return d;
}

void ToggleSwitchNode::onFlowStart()
{
    setOutput(0, on_);
}

void ToggleSwitchNode::toggle()
{
    setOn(!on_);
}

void ToggleSwitchNode::setOn(bool on)
{
    if (!isEnabled() || on == on_)
        return;
    setStateValue("switch_state", on);
    setOutput(0, on_);
    fireExec(1);
}

void ToggleSwitchNode::onStateChanged()
{
    on_ = stateBool(getState(), "switch_state", false);
}

SliderNode::SliderNode(std::string id) : InterfaceNode(std::move(id), describe()) {}

NodeDefinition SliderNode::describe()
{
    auto d = widgetDefinition("Slider", "Slider for continuous value input");
    d.outputs = {dataPort("Value", "number"), execPort("Changed")};
    return d;
}

void SliderNode::onFlowStart()
{
    setOutput(0, value_);
}

void SliderNode::setValue(double value)
{
    if (!isEnabled())
        return;
    value = std::max(min_, std::min(max_, value));
    if (value == value_)
        return;
    setStateValue("slider_value", value);
    setOutput(0, value_);
    fireExec(1);
}

void SliderNode::onStateChanged()
{
    const Value& state = getState();
    min_ = stateDouble(state, "min_value", 0.0);
    max_ = stateDouble(state, "max_value", 100.0);
    value_ = std::max(min_, std::min(max_, stateDouble(state, "slider_value", 0.0)));
}

} // namespace labflow
