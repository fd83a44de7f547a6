#pragma once

#include "engine/Node.h"

namespace labflow {

/// Entry point of an experiment. Fires `next` once the engine has started
/// every node.
class StartExperimentNode : public ExecNode {
public:
    explicit StartExperimentNode(std::string id);
    static NodeDefinition describe();

    bool isEntryPoint() const override { return true; }
    void onFlowStart() override;

protected:
    void onExec(int inputIndex) override;
};

/// Reports the end of the experiment to the engine's flow-complete observers.
class EndExperimentNode : public ExecNode {
public:
    explicit EndExperimentNode(std::string id);
    static NodeDefinition describe();

protected:
    void onExec(int inputIndex) override;
};

/// Fires `next` after a delay. State `duration` overrides the `seconds` input.
/// Each trigger schedules its own firing.
class DelayNode : public ExecNode {
public:
    explicit DelayNode(std::string id);
    static NodeDefinition describe();

    double currentDuration() const;

protected:
    void onExec(int inputIndex) override;
};

/// Fires `body` `count` times (0 = until stopped), `delay` seconds apart,
/// then `done`. Re-triggering restarts the loop.
class LoopNode : public ExecNode {
public:
    explicit LoopNode(std::string id);
    static NodeDefinition describe();

    int iteration() const { return iteration_; }
    bool isLooping() const { return looping_; }

protected:
    void onExec(int inputIndex) override;
    void onStop() override;

private:
    void runIteration();

    int iteration_ = 0;
    bool looping_ = false;
};

} // namespace labflow
