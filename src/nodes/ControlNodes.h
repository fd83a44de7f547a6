#pragma once

#include "engine/Node.h"

namespace labflow {

/// On/off latch. Inputs: Toggle, Set On, Set Off. Fires On or Off after
/// every change and mirrors the latch on the State output.
class ToggleNode : public ExecNode {
public:
    explicit ToggleNode(std::string id);
    static NodeDefinition describe();

    bool isOn() const { return on_; }

protected:
    void onExec(int inputIndex) override;
    void onStateChanged() override;

private:
    bool on_ = false;
};

/// Fires Then 0 to Then 3 in order.
class SequenceNode : public ExecNode {
public:
    explicit SequenceNode(std::string id);
    static NodeDefinition describe();

protected:
    void onExec(int inputIndex) override;
};

/// Periodic tick while the flow runs. The interval is re-read after every
/// tick (minimum 10 ms); ticks are skipped while disabled or paused.
class TimerNode : public ExecNode {
public:
    explicit TimerNode(std::string id);
    static NodeDefinition describe();

    bool isEntryPoint() const override { return true; }
    int count() const { return count_; }

protected:
    void onStart() override;

private:
    void scheduleTick();
    void tick();

    int count_ = 0;
};

} // namespace labflow
