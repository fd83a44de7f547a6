#include <catch2/catch_test_macros.hpp>

#include "engine/FlowEngine.h"
#include "nodes/InterfaceNodes.h"
#include "support/TestNodes.h"

#include <deque>
#include <string>
#include <vector>

using namespace labflow;
using namespace labflow::test;

namespace {

struct DisplayCapture {
    std::vector<Value> values;

    explicit DisplayCapture(Node& node)
    {
        node.registerUpdateCallback([this](const std::string& key, const Value& value) {
            if (key == "display")
                values.push_back(value);
        });
    }
};

} // namespace

// --- Displays ---

TEST_CASE("Widgets are visible in the dashboard by default")
{
    LabelNode label("label");
    REQUIRE(label.isVisibleInDashboard());
    REQUIRE(label.getCategory() == NodeCategory::interface);
}

TEST_CASE("Label substitutes the value into its format")
{
    LabelNode label("label");
    DisplayCapture display(label);

    label.setInput(0, 21.5);
    REQUIRE(label.displayText() == "21.5");

    label.setInput(1, "Temp: {} C");
    REQUIRE(label.displayText() == "Temp: 21.5 C");
    REQUIRE(display.values.back() == "Temp: 21.5 C");

    label.setInput(0, "warm");
    REQUIRE(label.displayText() == "Temp: warm C");

    label.setInput(1, "no placeholder");
    REQUIRE(label.displayText() == "no placeholder");
}

TEST_CASE("Gauge reports the value as a percentage of its range")
{
    GaugeNode gauge("gauge");
    DisplayCapture display(gauge);
    gauge.setState({{"unit", "C"}});

    gauge.setInput(0, 25.0);
    REQUIRE(gauge.percent() == 25.0);
    REQUIRE(display.values.back()["unit"] == "C");

    gauge.setInput(1, 20.0);
    gauge.setInput(2, 30.0);
    REQUIRE(gauge.percent() == 50.0);

    gauge.setInput(2, 20.0);
    REQUIRE(gauge.percent() == 0.0);
}

TEST_CASE("Chart keeps at most max_points values")
{
    ChartNode chart("chart");
    chart.setState({{"max_points", 3}});
    DisplayCapture display(chart);

    for (double v : {1.0, 2.0, 3.0, 4.0, 5.0})
        chart.setInput(0, v);

    REQUIRE(chart.data() == std::deque<double>{3.0, 4.0, 5.0});
    REQUIRE(display.values.back()["data"].size() == 3);
}

TEST_CASE("LED Indicator follows its state input")
{
    LedIndicatorNode led("led");
    DisplayCapture display(led);
    led.setState({{"on_color", "#ff0000"}});

    led.setInput(0, true);
    REQUIRE(led.isLit());
    REQUIRE(display.values.back()["color"] == "#ff0000");

    led.setInput(0, false);
    REQUIRE_FALSE(led.isLit());
    REQUIRE(display.values.back()["color"] == "#333333");
}

// --- Inputs ---

namespace {

struct Rig {
    Scheduler scheduler{ClockMode::manual};
    FlowEngine engine{scheduler, makeRegistry()};
    std::string error;
    CounterNode* changed = nullptr;

    Rig() { changed = static_cast<CounterNode*>(engine.createNode("changed", "TestCounter", error)); }

    template <typename T>
    T* make(const std::string& id, const std::string& type, const std::string& execOutput,
            const Value& state = Value::object())
    {
        NodeOptions options;
        options.state = state;
        auto* node = static_cast<T*>(engine.createNode(id, type, options, error));
        engine.connectPorts(id, execOutput, "changed", "in", error);
        return node;
    }
};

} // namespace

TEST_CASE("Button fires Pressed unless disabled")
{
    Rig rig;
    auto* button = rig.make<ButtonNode>("button", "Button", "Pressed");
    REQUIRE(button->isEntryPoint());

    button->press();
    button->press();
    REQUIRE(button->pressCount() == 2);
    REQUIRE(rig.changed->count == 2);

    button->setEnabled(false);
    button->press();
    REQUIRE(rig.changed->count == 2);
}

TEST_CASE("Toggle Switch fires Changed only when flipped")
{
    Rig rig;
    auto* toggle = rig.make<ToggleSwitchNode>("switch", "Toggle Switch", "Changed");

    toggle->setOn(false);
    REQUIRE(rig.changed->count == 0);

    toggle->toggle();
    REQUIRE(toggle->isOn());
    REQUIRE(toggle->getOutput(0) == true);
    REQUIRE(toggle->getState()["switch_state"] == true);
    REQUIRE(rig.changed->count == 1);

    toggle->setOn(true);
    REQUIRE(rig.changed->count == 1);
}

TEST_CASE("Slider clamps to its range and fires Changed on change")
{
    Rig rig;
    auto* slider = rig.make<SliderNode>("slider", "Slider", "Changed",
                                        {{"min_value", 10.0}, {"max_value", 20.0}});
    REQUIRE(slider->value() == 10.0);

    slider->setValue(15.0);
    REQUIRE(slider->getOutput(0) == 15.0);
    REQUIRE(rig.changed->count == 1);

    slider->setValue(99.0);
    REQUIRE(slider->value() == 20.0);
    REQUIRE(rig.changed->count == 2);

    slider->setValue(25.0);
    REQUIRE(rig.changed->count == 2);
}

TEST_CASE("Inputs publish their value when the flow starts")
{
    Rig rig;
    rig.make<SliderNode>("slider", "Slider", "Changed", {{"slider_value", 42.0}});
    auto* label = static_cast<LabelNode*>(rig.engine.createNode("label", "Label", rig.error));
    rig.engine.connectPorts("slider", "Value", "label", "Value", rig.error);
    REQUIRE(label->displayText().empty());

    rig.engine.start();
    REQUIRE(label->displayText() == "42.0");
    REQUIRE(rig.changed->count == 0);
}
