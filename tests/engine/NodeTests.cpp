#include <catch2/catch_test_macros.hpp>

#include "core/Scheduler.h"
#include "engine/Node.h"
#include "support/TestNodes.h"

#include <string>
#include <vector>

using namespace labflow;
using namespace labflow::test;

namespace {

// Fires "done" one second after being triggered.
class LaterNode : public ExecNode {
public:
    explicit LaterNode(std::string id) : ExecNode(std::move(id), describe()) {}

    static NodeDefinition describe()
    {
        NodeDefinition d;
        d.typeName = "TestLater";
        d.inputs = {execPort("exec")};
        d.outputs = {execPort("done")};
        return d;
    }

protected:
    void onExec(int) override
    {
        tasks().callAfter(1.0, [this] { fireExec(0); });
    }
};

class BareHardwareNode : public HardwareNode {
public:
    explicit BareHardwareNode(std::string id) : HardwareNode(std::move(id), describe()) {}

    static NodeDefinition describe()
    {
        NodeDefinition d;
        d.typeName = "TestHardware";
        d.category = NodeCategory::hardware;
        d.inputs = {execPort("exec")};
        return d;
    }

    int runs = 0;

protected:
    void onDeviceExec(int) override { ++runs; }
};

} // namespace

// --- Values ---

TEST_CASE("Inputs start at their defaults and outputs start unset")
{
    AdderNode adder("a");
    REQUIRE(adder.getInput(0) == 0.0);
    REQUIRE(adder.getOutput(0).is_null());
    REQUIRE(adder.getInput(7).is_null());
    REQUIRE(adder.getOutput(-1).is_null());
}

TEST_CASE("setInput recomputes a reactive node")
{
    AdderNode adder("a");
    adder.setInput(0, 2.0);
    adder.setInput(1, 3.0);
    REQUIRE(adder.seen.size() == 2);
    REQUIRE(adder.getOutput(0) == 5.0);
}

TEST_CASE("setInput out of range is ignored")
{
    AdderNode adder("a");
    adder.setInput(5, 1.0);
    adder.setInput(-1, 1.0);
    REQUIRE(adder.seen.empty());
}

TEST_CASE("A disabled reactive node stores inputs without recomputing")
{
    AdderNode adder("a");
    adder.setEnabled(false);
    adder.setInput(0, 4.0);
    REQUIRE(adder.seen.empty());
    REQUIRE(adder.getInput(0) == 4.0);
}

// --- Propagation ---

TEST_CASE("Diamond recomputes the join once with consistent inputs")
{
    SourceNode source("s");
    AdderNode left("left");
    AdderNode right("right");
    AdderNode join("join");

    source.addDataLink(0, &left, 0);
    source.addDataLink(0, &right, 1);
    left.addDataLink(0, &join, 0);
    right.addDataLink(0, &join, 1);

    source.setOutput(0, 2.0);
    REQUIRE(left.seen.size() == 1);
    REQUIRE(right.seen.size() == 1);
    REQUIRE(join.seen.size() == 1);
    REQUIRE(join.seen[0] == std::make_pair(2.0, 2.0));

    source.setOutput(0, 5.0);
    REQUIRE(join.seen.size() == 2);
    REQUIRE(join.seen[1] == std::make_pair(5.0, 5.0));
    REQUIRE(join.getOutput(0) == 10.0);
}

TEST_CASE("A data cycle recomputes each member once and terminates")
{
    AdderNode x("x");
    AdderNode y("y");
    x.addDataLink(0, &y, 0);
    y.addDataLink(0, &x, 0);

    x.setInput(1, 1.0);

    REQUIRE(x.seen.size() == 1);
    REQUIRE(y.seen.size() == 1);
    REQUIRE(y.getOutput(0) == 1.0);
    REQUIRE(x.getInput(0) == 1.0);
}

TEST_CASE("setInput from an update callback recomputes the other node")
{
    AdderNode first("first");
    AdderNode second("second");
    second.setInput(1, 1.0);
    first.registerUpdateCallback([&](const std::string&, const Value& value) {
        second.setInput(0, value);
    });

    first.setInput(0, 5.0);

    REQUIRE(second.getInput(0) == 5.0);
    REQUIRE(second.getOutput(0) == 6.0);
    REQUIRE(second.seen.back() == std::make_pair(5.0, 1.0));
}

TEST_CASE("An output set from an update callback reaches nodes outside the pass")
{
    AdderNode first("first");
    SourceNode source("s");
    AdderNode downstream("downstream");
    source.addDataLink(0, &downstream, 0);
    first.registerUpdateCallback([&](const std::string&, const Value& value) {
        source.setOutput(0, value);
    });

    first.setInput(0, 3.0);

    REQUIRE(downstream.seen.size() == 1);
    REQUIRE(downstream.getOutput(0) == 3.0);
}

TEST_CASE("Feedback through an update callback stops after bounded passes")
{
    AdderNode node("n");
    node.registerUpdateCallback([&](const std::string&, const Value& value) {
        node.setInput(1, toDouble(value) + 1.0);
    });

    node.setInput(0, 1.0);

    REQUIRE(node.seen.size() == 1 + 256);
}

TEST_CASE("Removed links stop carrying values")
{
    SourceNode source("s");
    AdderNode adder("a");
    uint32_t link = source.addDataLink(0, &adder, 0);

    REQUIRE(source.removeLink(link));
    REQUIRE_FALSE(source.removeLink(link));
    source.setOutput(0, 3.0);
    REQUIRE(adder.seen.empty());

    source.addDataLink(0, &adder, 0);
    source.removeLinksTo(&adder);
    source.setOutput(0, 4.0);
    REQUIRE(adder.seen.empty());
}

// --- Execution ---

TEST_CASE("fireExec triggers linked nodes synchronously")
{
    SourceNode source("s");
    CounterNode first("first");
    CounterNode second("second");
    source.addExecLink(1, &first, 0);
    first.addExecLink(0, &second, 0);

    source.trigger();
    REQUIRE(source.triggers == 1);
    REQUIRE(first.count == 1);
    REQUIRE(second.count == 1);
}

TEST_CASE("An exec loop is cut at the depth limit")
{
    CounterNode loop("loop");
    loop.addExecLink(0, &loop, 0);

    loop.trigger();
    REQUIRE(loop.count == Node::kMaxExecDepth);
    REQUIRE(loop.getError() == "Execution depth limit exceeded");

    // The depth counter unwinds, so a fresh trigger runs again.
    loop.count = 0;
    loop.trigger();
    REQUIRE(loop.count == Node::kMaxExecDepth);
}

TEST_CASE("A disabled node ignores triggers")
{
    CounterNode counter("c");
    counter.setEnabled(false);
    counter.trigger();
    REQUIRE(counter.count == 0);
}

TEST_CASE("An exception in onExec becomes the node error")
{
    ThrowingNode node("t");
    std::vector<std::string> keys;
    std::string reported;
    node.registerUpdateCallback([&](const std::string& key, const Value& value) {
        keys.push_back(key);
        if (value.is_string())
            reported = value.get<std::string>();
    });

    REQUIRE_NOTHROW(node.trigger());
    REQUIRE(node.getError() == "boom");
    REQUIRE(keys == std::vector<std::string>{"error"});
    REQUIRE(reported == "boom");

    node.clearError();
    REQUIRE_FALSE(node.hasError());
    REQUIRE(keys.size() == 2);
}

TEST_CASE("Update callbacks receive output names and can be removed")
{
    AdderNode adder("a");
    std::vector<std::string> keys;
    uint32_t id = adder.registerUpdateCallback([&](const std::string& key, const Value&) {
        keys.push_back(key);
    });

    adder.setInput(0, 1.0);
    REQUIRE(keys == std::vector<std::string>{"sum"});

    REQUIRE(adder.unregisterUpdateCallback(id));
    adder.setInput(0, 2.0);
    REQUIRE(keys.size() == 1);
}

// --- State ---

TEST_CASE("setState merges keys into the current state")
{
    CounterNode node("c");
    node.setState({{"a", 1}});
    node.setState({{"b", 2}});
    node.setStateValue("a", 3);

    REQUIRE(node.getState()["a"] == 3);
    REQUIRE(node.getState()["b"] == 2);

    node.setState(Value::array());
    REQUIRE(node.getState().size() == 2);
}

// --- Lifecycle ---

TEST_CASE("stop cancels pending timers of the node")
{
    Scheduler scheduler(ClockMode::manual);
    NodeContext context;
    context.scheduler = &scheduler;

    LaterNode later("later");
    CounterNode counter("c");
    later.attach(context);
    later.addExecLink(0, &counter, 0);

    later.start();
    later.trigger();
    later.stop();
    scheduler.advance(2.0);
    REQUIRE(counter.count == 0);

    later.start();
    later.trigger();
    scheduler.advance(2.0);
    REQUIRE(counter.count == 1);
}

TEST_CASE("Lifecycle calls are idempotent")
{
    CounterNode node("c");
    REQUIRE_NOTHROW(node.stop());

    node.pause();
    REQUIRE_FALSE(node.isPaused());

    node.start();
    node.start();
    REQUIRE(node.isRunning());
    node.pause();
    REQUIRE(node.isPaused());
    node.resume();
    REQUIRE_FALSE(node.isPaused());

    node.stop();
    node.stop();
    REQUIRE_FALSE(node.isRunning());
}

// --- Hardware nodes ---

TEST_CASE("A hardware node without a device reports No device bound")
{
    BareHardwareNode node("hw");
    REQUIRE(node.requiresDevice());
    REQUIRE_NOTHROW(node.trigger());
    REQUIRE(node.getError() == "No device bound");
    REQUIRE(node.runs == 0);
}
