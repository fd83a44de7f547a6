#pragma once

#include "engine/Node.h"
#include "engine/NodeRegistry.h"
#include "nodes/BuiltinNodes.h"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace labflow {
namespace test {

/// Exec-driven producer. Outputs: "out" (number), "next" (exec).
class SourceNode : public ExecNode {
public:
    explicit SourceNode(std::string id) : ExecNode(std::move(id), describe()) {}

    static NodeDefinition describe()
    {
        NodeDefinition d;
        d.typeName = "TestSource";
        d.inputs = {execPort("exec")};
        d.outputs = {dataPort("out", "number"), execPort("next")};
        return d;
    }

    int triggers = 0;

protected:
    void onExec(int) override
    {
        ++triggers;
        fireExec(1);
    }
};

/// Reactive sum of two inputs that records every recompute.
class AdderNode : public LogicNode {
public:
    explicit AdderNode(std::string id) : LogicNode(std::move(id), describe()) {}

    static NodeDefinition describe()
    {
        NodeDefinition d;
        d.typeName = "TestAdder";
        d.inputs = {dataPort("a", "number", 0.0), dataPort("b", "number", 0.0)};
        d.outputs = {dataPort("sum", "number")};
        return d;
    }

    std::vector<std::pair<double, double>> seen;

protected:
    void process() override
    {
        double a = toDouble(getInput(0));
        double b = toDouble(getInput(1));
        seen.emplace_back(a, b);
        setOutput(0, a + b);
    }
};

/// Counts triggers and passes them on.
class CounterNode : public ExecNode {
public:
    explicit CounterNode(std::string id) : ExecNode(std::move(id), describe()) {}

    static NodeDefinition describe()
    {
        NodeDefinition d;
        d.typeName = "TestCounter";
        d.inputs = {execPort("in")};
        d.outputs = {execPort("out")};
        return d;
    }

    int count = 0;
    // When set, each trigger appends the node id.
    std::vector<std::string>* trace = nullptr;

protected:
    void onExec(int) override
    {
        ++count;
        if (trace)
            trace->push_back(getId());
        fireExec(0);
    }
};

class ThrowingNode : public ExecNode {
public:
    explicit ThrowingNode(std::string id) : ExecNode(std::move(id), describe()) {}

    static NodeDefinition describe()
    {
        NodeDefinition d;
        d.typeName = "TestThrowing";
        d.inputs = {execPort("exec")};
        return d;
    }

protected:
    void onExec(int) override { throw std::runtime_error("boom"); }
};

inline NodeRegistry makeRegistry()
{
    NodeRegistry registry;
    registerBuiltinNodes(registry);
    registry.add<SourceNode>();
    registry.add<AdderNode>();
    registry.add<CounterNode>();
    registry.add<ThrowingNode>();
    return registry;
}

} // namespace test
} // namespace labflow
