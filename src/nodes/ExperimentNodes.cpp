#include "nodes/ExperimentNodes.h"
#include "core/Logger.h"
#include "engine/FlowEngine.h"

#include <algorithm>

namespace labflow {

// ═══════════════════════════════════════════════════════════════════
// StartExperiment
// ═══════════════════════════════════════════════════════════════════

StartExperimentNode::StartExperimentNode(std::string id)
    : ExecNode(std::move(id), describe())
{
}

NodeDefinition StartExperimentNode::describe()
{
    NodeDefinition d;
    d.typeName = "StartExperiment";
    d.category = NodeCategory::logic;
    d.description = "Entry point - begins the experiment flow";
    d.outputs = {execPort("next", "Triggers the next node")};
    return d;
}

void StartExperimentNode::onFlowStart()
{
    trigger(0);
}

void StartExperimentNode::onExec(int)
{
    LF_INFO("Experiment started at %s", getId().c_str());
    fireExec(0);
}

// ═══════════════════════════════════════════════════════════════════
// EndExperiment
// ═══════════════════════════════════════════════════════════════════

EndExperimentNode::EndExperimentNode(std::string id)
    : ExecNode(std::move(id), describe())
{
}

NodeDefinition EndExperimentNode::describe()
{
    NodeDefinition d;
    d.typeName = "EndExperiment";
    d.category = NodeCategory::logic;
    d.description = "Exit point - ends the experiment";
    d.inputs = {execPort("exec")};
    return d;
}

void EndExperimentNode::onExec(int)
{
    LF_INFO("Experiment ended at %s", getId().c_str());
    if (getContext().engine)
        getContext().engine->notifyFlowComplete(getId());
}

// ═══════════════════════════════════════════════════════════════════
// Delay
// ═══════════════════════════════════════════════════════════════════

DelayNode::DelayNode(std::string id)
    : ExecNode(std::move(id), describe())
{
}

NodeDefinition DelayNode::describe()
{
    NodeDefinition d;
    d.typeName = "Delay";
    d.category = NodeCategory::logic;
    d.description = "Wait for a specified duration";
    d.inputs = {execPort("exec"), dataPort("seconds", "number", 1.0, "Duration in seconds")};
    d.outputs = {execPort("next", "Triggers after the delay")};
    return d;
}

double DelayNode::currentDuration() const
{
    double seconds = toDouble(getInput(1), 1.0);
    return std::max(0.0, stateNumber("duration", seconds));
}

void DelayNode::onExec(int)
{
    double duration = currentDuration();
    LF_DEBUG("Delay %s: waiting %.3f s", getId().c_str(), duration);
    tasks().callAfter(duration, [this]() { fireExec(0); });
}

// ═══════════════════════════════════════════════════════════════════
// Loop
// ═══════════════════════════════════════════════════════════════════

LoopNode::LoopNode(std::string id)
    : ExecNode(std::move(id), describe())
{
}

NodeDefinition LoopNode::describe()
{
    NodeDefinition d;
    d.typeName = "Loop";
    d.category = NodeCategory::logic;
    d.description = "Repeat actions N times (0 = infinite)";
    d.inputs = {execPort("exec", "Start the loop")};
    d.outputs = {execPort("body", "Executes each iteration"),
                 execPort("done", "Executes when the loop completes")};
    return d;
}

void LoopNode::onExec(int)
{
    tasks().cancelAll();
    iteration_ = 0;
    looping_ = true;
    runIteration();
}

void LoopNode::runIteration()
{
    int count = std::max(0, stateInt(getState(), "count", 0));
    double delay = std::max(0.0, stateNumber("delay", 1.0));

    if (count > 0 && iteration_ >= count)
    {
        looping_ = false;
        LF_DEBUG("Loop %s: done after %d iterations", getId().c_str(), iteration_);
        fireExec(1);
        return;
    }

    ++iteration_;
    fireExec(0);

    // The body may have stopped the flow.
    if (!looping_)
        return;
    // Iterations always go through the scheduler so an endless loop yields.
    tasks().callAfter(delay, [this]() { runIteration(); });
}

void LoopNode::onStop()
{
    looping_ = false;
}

} // namespace labflow
