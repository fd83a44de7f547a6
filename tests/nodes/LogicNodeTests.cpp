#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "core/Scheduler.h"
#include "nodes/LogicNodes.h"

using namespace labflow;
using Catch::Approx;

// --- Arithmetic ---

TEST_CASE("Arithmetic nodes recompute on every input change")
{
    AddNode add("add");
    add.setInput(0, 2.0);
    add.setInput(1, 3.5);
    REQUIRE(add.getOutput(0) == 5.5);

    SubtractNode sub("sub");
    sub.setInput(0, 2.0);
    sub.setInput(1, 3.5);
    REQUIRE(sub.getOutput(0) == -1.5);

    MultiplyNode mul("mul");
    mul.setInput(0, 3.0);
    REQUIRE(mul.getOutput(0) == 3.0);
    mul.setInput(1, 4.0);
    REQUIRE(mul.getOutput(0) == 12.0);
}

TEST_CASE("Booleans and integers feed arithmetic as numbers")
{
    AddNode add("add");
    add.setInput(0, true);
    add.setInput(1, 2);
    REQUIRE(add.getOutput(0) == 3.0);
}

TEST_CASE("Divide by zero sets an error and outputs zero")
{
    DivideNode div("div");
    div.setInput(0, 9.0);
    REQUIRE(div.getOutput(0) == 9.0);

    div.setInput(1, 0.0);
    REQUIRE(div.getError() == "Division by zero");
    REQUIRE(div.getOutput(0) == 0.0);

    div.setInput(1, 3.0);
    REQUIRE_FALSE(div.hasError());
    REQUIRE(div.getOutput(0) == 3.0);
}

// --- Ranges ---

TEST_CASE("Map Range maps a 10-bit reading to 0-255 by default")
{
    MapRangeNode map("map");
    map.setInput(0, 1023.0);
    REQUIRE(map.getOutput(0) == Approx(255.0));
    map.setInput(0, 511.5);
    REQUIRE(map.getOutput(0) == Approx(127.5));
}

TEST_CASE("Map Range with an empty input range outputs Out Min")
{
    MapRangeNode map("map");
    map.setInput(3, 10.0);
    map.setInput(2, 0.0);
    map.setInput(0, 42.0);
    REQUIRE(map.getOutput(0) == 10.0);
    REQUIRE_FALSE(map.hasError());
}

TEST_CASE("Clamp limits to the default 0-100 range")
{
    ClampNode clamp("clamp");
    clamp.setInput(0, 150.0);
    REQUIRE(clamp.getOutput(0) == 100.0);
    clamp.setInput(0, -3.0);
    REQUIRE(clamp.getOutput(0) == 0.0);
    clamp.setInput(0, 42.0);
    REQUIRE(clamp.getOutput(0) == 42.0);
}

TEST_CASE("Threshold applies hysteresis around the threshold")
{
    ThresholdNode threshold("t");
    threshold.setInput(2, 5.0);

    threshold.setInput(0, 54.0);
    REQUIRE(threshold.getOutput(0) == false);
    REQUIRE(threshold.getOutput(1) == true);

    threshold.setInput(0, 56.0);
    REQUIRE(threshold.getOutput(0) == true);

    threshold.setInput(0, 48.0);
    REQUIRE(threshold.getOutput(0) == true);

    threshold.setInput(0, 44.0);
    REQUIRE(threshold.getOutput(0) == false);
    REQUIRE(threshold.getOutput(1) == true);
}

TEST_CASE("In Range is inclusive at both ends")
{
    InRangeNode range("r");
    range.setInput(1, 10.0);
    range.setInput(2, 20.0);

    range.setInput(0, 10.0);
    REQUIRE(range.getOutput(0) == true);
    range.setInput(0, 20.0);
    REQUIRE(range.getOutput(0) == true);
    range.setInput(0, 20.5);
    REQUIRE(range.getOutput(0) == false);
    REQUIRE(range.getOutput(1) == true);
}

// --- PID ---

TEST_CASE("PID with only Kp is proportional")
{
    PIDNode pid("pid");
    pid.setInput(2, 2.0);
    pid.setInput(0, 10.0);
    pid.setInput(1, 4.0);

    REQUIRE(pid.getOutput(1) == 6.0);
    REQUIRE(pid.getOutput(0) == Approx(12.0));
}

TEST_CASE("PID clamps its output and stops integrating while saturated")
{
    Scheduler scheduler(ClockMode::manual);
    NodeContext context;
    context.scheduler = &scheduler;

    PIDNode pid("pid");
    pid.attach(context);
    pid.setInput(3, 1.0);
    pid.setInput(0, 1000.0);

    REQUIRE(pid.getOutput(0) == 255.0);
    REQUIRE(pid.integral() == Approx(0.0).margin(1e-12));
    REQUIRE(pid.getState()["integral"].get<double>() == Approx(0.0).margin(1e-12));

    pid.setState({{"output_max", 2000.0}});
    pid.setInput(1, 1.0);
    REQUIRE(pid.getOutput(0).get<double>() > 255.0);
}

TEST_CASE("PID integrates over scheduler time")
{
    Scheduler scheduler(ClockMode::manual);
    NodeContext context;
    context.scheduler = &scheduler;

    PIDNode pid("pid");
    pid.attach(context);
    pid.setInput(2, 0.0);
    pid.setInput(3, 1.0);
    pid.setInput(0, 10.0);

    scheduler.advance(2.0);
    pid.setInput(1, 0.0);
    // 10 for 0.001 s, then 10 for 2 s
    REQUIRE(pid.integral() == Approx(20.01));
    REQUIRE(pid.getOutput(0) == Approx(20.01));
}

TEST_CASE("PID state can seed or reset the integral")
{
    PIDNode pid("pid");
    pid.setState({{"integral", 5.0}});
    REQUIRE(pid.integral() == 5.0);

    pid.reset();
    REQUIRE(pid.integral() == 0.0);
}
