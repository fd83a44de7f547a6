#pragma once

#include "engine/Node.h"

#include <deque>
#include <string>

namespace labflow {

// Display widgets publish what they show as the "display" update key.

/// Text display. Format replaces the first "{}" with the value.
class LabelNode : public InterfaceNode {
public:
    explicit LabelNode(std::string id);
    static NodeDefinition describe();

    const std::string& displayText() const { return text_; }

protected:
    void process() override;

private:
    std::string text_;
};

/// Value with its position between Min and Max, in percent.
class GaugeNode : public InterfaceNode {
public:
    explicit GaugeNode(std::string id);
    static NodeDefinition describe();

    double percent() const { return percent_; }

protected:
    void process() override;

private:
    double percent_ = 0.0;
};

/// Rolling history of the last `max_points` values (default 100).
class ChartNode : public InterfaceNode {
public:
    explicit ChartNode(std::string id);
    static NodeDefinition describe();

    const std::deque<double>& data() const { return data_; }
    void clearData() { data_.clear(); }

protected:
    void process() override;

private:
    std::deque<double> data_;
};

class LedIndicatorNode : public InterfaceNode {
public:
    explicit LedIndicatorNode(std::string id);
    static NodeDefinition describe();

    bool isLit() const { return lit_; }

protected:
    void process() override;

private:
    bool lit_ = false;
};

// --- Dashboard inputs ---

class ButtonNode : public InterfaceNode {
public:
    explicit ButtonNode(std::string id);
    static NodeDefinition describe();

    bool isEntryPoint() const override { return true; }

    void press();
    int pressCount() const { return pressCount_; }

private:
    int pressCount_ = 0;
};

/// On/off switch; fires Changed when flipped.
class ToggleSwitchNode : public InterfaceNode {
public:
    explicit ToggleSwitchNode(std::string id);
    static NodeDefinition describe();

    bool isEntryPoint() const override { return true; }
    void onFlowStart() override;

    void toggle();
    void setOn(bool on);
    bool isOn() const { return on_; }

protected:
    void onStateChanged() override;

private:
    bool on_ = false;
};

/// Value clamped to [min_value, max_value]; fires Changed on every change.
class SliderNode : public InterfaceNode {
public:
    explicit SliderNode(std::string id);
    static NodeDefinition describe();

    bool isEntryPoint() const override { return true; }
    void onFlowStart() override;

    void setValue(double value);
    double value() const { return value_; }

protected:
    void onStateChanged() override;

private:
    double value_ = 0.0;
    double min_ = 0.0;
    double max_ = 100.0;
};

} // namespace labflow
