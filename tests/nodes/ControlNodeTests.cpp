#include <catch2/catch_test_macros.hpp>

#include "engine/FlowEngine.h"
#include "nodes/ControlNodes.h"
#include "support/TestNodes.h"

#include <string>
#include <vector>

using namespace labflow;
using namespace labflow::test;

namespace {

struct Rig {
    Scheduler scheduler{ClockMode::manual};
    FlowEngine engine{scheduler, makeRegistry()};
    std::string error;

    template <typename T>
    T* make(const std::string& id, const std::string& type)
    {
        return static_cast<T*>(engine.createNode(id, type, error));
    }
};

} // namespace

// --- Toggle ---

TEST_CASE("Toggle flips on each trigger and fires On or Off")
{
    Rig rig;
    auto* toggle = rig.make<ToggleNode>("toggle", "Toggle");
    auto* on = rig.make<CounterNode>("on", "TestCounter");
    auto* off = rig.make<CounterNode>("off", "TestCounter");
    rig.engine.connectPorts("toggle", "On", "on", "in", rig.error);
    rig.engine.connectPorts("toggle", "Off", "off", "in", rig.error);

    rig.engine.triggerExec("toggle", 0);
    REQUIRE(toggle->isOn());
    REQUIRE(toggle->getOutput(0) == true);
    REQUIRE(on->count == 1);

    rig.engine.triggerExec("toggle", 0);
    REQUIRE_FALSE(toggle->isOn());
    REQUIRE(off->count == 1);

    rig.engine.triggerExec("toggle", 2);
    REQUIRE_FALSE(toggle->isOn());
    REQUIRE(off->count == 2);

    rig.engine.triggerExec("toggle", 1);
    REQUIRE(toggle->isOn());
    REQUIRE(toggle->getState()["toggle_state"] == true);
}

TEST_CASE("Toggle restores its state from the layout")
{
    Rig rig;
    NodeOptions options;
    options.state = {{"toggle_state", true}};
    auto* toggle = static_cast<ToggleNode*>(rig.engine.createNode("toggle", "Toggle", options, rig.error));
    REQUIRE(toggle->isOn());
    rig.engine.triggerExec("toggle", 0);
    REQUIRE_FALSE(toggle->isOn());
}

// --- Sequence ---

TEST_CASE("Sequence fires its outputs in order")
{
    Rig rig;
    rig.make<Node>("seq", "Sequence");
    std::vector<std::string> trace;
    for (int i = 3; i >= 0; --i)
    {
        std::string id = "then" + std::to_string(i);
        rig.make<CounterNode>(id, "TestCounter")->trace = &trace;
        rig.engine.connect("seq", i, id, 0, rig.error);
    }

    rig.engine.triggerExec("seq");
    REQUIRE(trace == std::vector<std::string>{"then0", "then1", "then2", "then3"});
}

// --- Timer ---

TEST_CASE("Timers tick at their own intervals")
{
    Rig rig;
    auto* fast = rig.make<TimerNode>("fast", "Timer");
    auto* slow = rig.make<TimerNode>("slow", "Timer");
    auto* fastTicks = rig.make<CounterNode>("fast_ticks", "TestCounter");
    auto* slowTicks = rig.make<CounterNode>("slow_ticks", "TestCounter");
    fast->setInput(0, 0.1);
    slow->setInput(0, 0.2);
    rig.engine.connectPorts("fast", "Tick", "fast_ticks", "in", rig.error);
    rig.engine.connectPorts("slow", "Tick", "slow_ticks", "in", rig.error);

    rig.engine.start();
    rig.scheduler.advance(1.0);

    REQUIRE(fastTicks->count >= 9);
    REQUIRE(fastTicks->count <= 10);
    REQUIRE(slowTicks->count >= 4);
    REQUIRE(slowTicks->count <= 5);
    REQUIRE(fast->count() == fastTicks->count);
    REQUIRE(fast->getOutput(1) == fast->count());
}

TEST_CASE("Stopping one timer leaves the other running")
{
    Rig rig;
    auto* a = rig.make<TimerNode>("a", "Timer");
    auto* b = rig.make<TimerNode>("b", "Timer");
    a->setInput(0, 0.1);
    b->setInput(0, 0.1);

    rig.engine.start();
    rig.scheduler.advance(0.55);
    int stoppedAt = a->count();
    a->stop();
    rig.scheduler.advance(1.0);

    REQUIRE(a->count() == stoppedAt);
    REQUIRE(b->count() > stoppedAt);
}

TEST_CASE("Paused and disabled timers skip ticks")
{
    Rig rig;
    auto* timer = rig.make<TimerNode>("t", "Timer");
    timer->setInput(0, 0.1);
    rig.engine.start();

    rig.engine.pause();
    rig.scheduler.advance(1.0);
    REQUIRE(timer->count() == 0);

    rig.engine.resume();
    rig.scheduler.advance(0.35);
    REQUIRE(timer->count() >= 3);

    int before = timer->count();
    timer->setInput(1, false);
    rig.scheduler.advance(1.0);
    REQUIRE(timer->count() == before);
}

TEST_CASE("The timer interval has a floor of 10 ms")
{
    Rig rig;
    auto* timer = rig.make<TimerNode>("t", "Timer");
    timer->setInput(0, 0.0);
    rig.engine.start();
    rig.scheduler.advance(0.1);
    REQUIRE(timer->count() >= 9);
    REQUIRE(timer->count() <= 10);
}
