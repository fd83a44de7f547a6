#include "nodes/ControlNodes.h"
#include "core/Logger.h"

#include <algorithm>

namespace labflow {

ToggleNode::ToggleNode(std::string id)
    : ExecNode(std::move(id), describe())
{
}

NodeDefinition ToggleNode::describe()
{
    NodeDefinition d;
    d.typeName = "Toggle";
    d.category = NodeCategory::logic;
    d.description = "Toggle state on each trigger";
    d.inputs = {execPort("Toggle"), execPort("Set On"), execPort("Set Off")};
    d.outputs = {dataPort("State", "bool"), execPort("On"), execPort("Off")};
    return d;
}

void ToggleNode::onExec(int inputIndex)
{
    bool next = on_;
    switch (inputIndex)
    {
    case 0: next = !on_; break;
    case 1: next = true; break;
    case 2: next = false; break;
    default: return;
    }

    setStateValue("toggle_state", next);
    setOutput(0, on_);
    fireExec(on_ ? 1 : 2);
}

void ToggleNode::onStateChanged()
{
    on_ = stateBool(getState(), "toggle_state", false);
}

// ═══════════════════════════════════════════════════════════════════

SequenceNode::SequenceNode(std::string id)
    : ExecNode(std::move(id), describe())
{
}

NodeDefinition SequenceNode::describe()
{
    NodeDefinition d;
    d.typeName = "Sequence";
    d.category = NodeCategory::logic;
    d.description = "Execute outputs in sequence";
    d.inputs = {execPort("exec")};
    d.outputs = {execPort("Then 0"), execPort("Then 1"), execPort("Then 2"), execPort("Then 3")};
    return d;
}

void SequenceNode::onExec(int)
{
    for (int i = 0; i < outputCount(); ++i)
        fireExec(i);
}

// ═══════════════════════════════════════════════════════════════════

TimerNode::TimerNode(std::string id)
    : ExecNode(std::move(id), describe())
{
}

NodeDefinition TimerNode::describe()
{
    NodeDefinition d;
    d.typeName = "Timer";
    d.category = NodeCategory::logic;
    d.description = "Trigger execution at regular intervals";
    d.inputs = {dataPort("Interval", "number", 1.0, "Interval in seconds"),
                dataPort("Enabled", "bool", true)};
    d.outputs = {execPort("Tick"), dataPort("Count", "int")};
    return d;
}

void TimerNode::onStart()
{
    count_ = 0;
    scheduleTick();
}

void TimerNode::scheduleTick()
{
    double interval = std::max(0.01, toDouble(getInput(0), 1.0));
    tasks().callAfter(interval, [this]() { tick(); });
}

void TimerNode::tick()
{
    if (toBool(getInput(1), true) && !isPaused() && isEnabled())
    {
        ++count_;
        LF_TRACE("Timer %s: tick %d", getId().c_str(), count_);
        setStateValue("count", count_);
        setOutput(1, count_);
        fireExec(0);
    }
    // Firing may have stopped this node.
    if (isRunning())
        scheduleTick();
}

} // namespace labflow
