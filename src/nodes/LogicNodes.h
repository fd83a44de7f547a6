#pragma once

#include "engine/Node.h"

namespace labflow {

// --- Arithmetic: inputs A, B; output Result ---

class AddNode : public LogicNode {
public:
    explicit AddNode(std::string id);
    static NodeDefinition describe();

protected:
    void process() override;
};

class SubtractNode : public LogicNode {
public:
    explicit SubtractNode(std::string id);
    static NodeDefinition describe();

protected:
    void process() override;
};

class MultiplyNode : public LogicNode {
public:
    explicit MultiplyNode(std::string id);
    static NodeDefinition describe();

protected:
    void process() override;
};

/// Division by zero sets the error "Division by zero" and outputs 0.
class DivideNode : public LogicNode {
public:
    explicit DivideNode(std::string id);
    static NodeDefinition describe();

protected:
    void process() override;
};

/// Linear map from [In Min, In Max] to [Out Min, Out Max]. An empty input
/// range yields Out Min.
class MapRangeNode : public LogicNode {
public:
    explicit MapRangeNode(std::string id);
    static NodeDefinition describe();

protected:
    void process() override;
};

class ClampNode : public LogicNode {
public:
    explicit ClampNode(std::string id);
    static NodeDefinition describe();

protected:
    void process() override;
};

/// Above / Below with a hysteresis band around the threshold: once above,
/// the value must fall to Threshold - Hysteresis before Below is reported.
class ThresholdNode : public LogicNode {
public:
    explicit ThresholdNode(std::string id);
    static NodeDefinition describe();

    bool isAbove() const { return above_; }

protected:
    void process() override;

private:
    bool above_ = false;
};

/// Min <= Value <= Max, inclusive.
class InRangeNode : public LogicNode {
public:
    explicit InRangeNode(std::string id);
    static NodeDefinition describe();

protected:
    void process() override;
};

/// PID controller stepped on every input change. The time step comes from
/// the scheduler clock. The output is clamped to [output_min, output_max]
/// (default +-255) and the integral stops growing while saturated.
class PIDNode : public LogicNode {
public:
    explicit PIDNode(std::string id);
    static NodeDefinition describe();

    void reset();
    double integral() const { return integral_; }

protected:
    void process() override;
    void onStateChanged() override;

private:
    double clockNow() const;

    double integral_ = 0.0;
    double lastError_ = 0.0;
    double lastTime_ = -1.0;
    double outputMin_ = -255.0;
    double outputMax_ = 255.0;
    bool syncing_ = false;
};

} // namespace labflow
