#include <catch2/catch_test_macros.hpp>

#include "core/TaskGroup.h"

#include <functional>
#include <stdexcept>

using namespace labflow;

TEST_CASE("TaskGroup without a scheduler throws on callAfter")
{
    TaskGroup group;
    REQUIRE_THROWS_AS(group.callAfter(0.1, [] {}), std::logic_error);
}

TEST_CASE("TaskGroup tracks timers until they fire")
{
    Scheduler s(ClockMode::manual);
    TaskGroup group(&s);
    int fired = 0;

    auto id = group.callAfter(0.1, [&] { ++fired; });
    REQUIRE(group.isActive(id));
    REQUIRE(group.activeCount() == 1);

    s.advance(0.2);
    REQUIRE(fired == 1);
    REQUIRE_FALSE(group.isActive(id));
    REQUIRE(group.activeCount() == 0);
}

TEST_CASE("cancelAll cancels every pending timer")
{
    Scheduler s(ClockMode::manual);
    TaskGroup group(&s);
    int fired = 0;
    group.callAfter(0.1, [&] { ++fired; });
    group.callAfter(0.2, [&] { ++fired; });

    group.cancelAll();
    REQUIRE(group.activeCount() == 0);
    REQUIRE(s.pendingTimerCount() == 0);

    s.advance(1.0);
    REQUIRE(fired == 0);
}

TEST_CASE("cancelAll is safe to repeat and after timers have fired")
{
    Scheduler s(ClockMode::manual);
    TaskGroup group(&s);
    group.callAfter(0.1, [] {});
    s.advance(1.0);

    REQUIRE_NOTHROW(group.cancelAll());
    REQUIRE_NOTHROW(group.cancelAll());
}

TEST_CASE("cancel only affects the group's own timers")
{
    Scheduler s(ClockMode::manual);
    TaskGroup group(&s);
    auto foreign = s.callAfter(0.1, [] {});

    REQUIRE_FALSE(group.cancel(foreign));
    REQUIRE(s.isPending(foreign));
}

TEST_CASE("Wrapped callbacks are dropped after cancelAll")
{
    Scheduler s(ClockMode::manual);
    TaskGroup group(&s);
    int delivered = 0;

    auto before = group.wrap(std::function<void(int)>([&](int v) { delivered += v; }));
    before(1);
    REQUIRE(delivered == 1);

    group.cancelAll();
    before(10);
    REQUIRE(delivered == 1);

    auto after = group.wrap(std::function<void(int)>([&](int v) { delivered += v; }));
    after(100);
    REQUIRE(delivered == 101);
}

TEST_CASE("Wrapped callbacks outliving the group are dropped")
{
    Scheduler s(ClockMode::manual);
    bool delivered = false;
    std::function<void()> late;
    {
        TaskGroup group(&s);
        late = group.wrap(std::function<void()>([&] { delivered = true; }));
    }
    late();
    REQUIRE_FALSE(delivered);
}

TEST_CASE("aliveToken reports cancellation")
{
    Scheduler s(ClockMode::manual);
    TaskGroup group(&s);
    auto alive = group.aliveToken();
    REQUIRE(alive());
    group.cancelAll();
    REQUIRE_FALSE(alive());
}

TEST_CASE("Destroying a group cancels its timers")
{
    Scheduler s(ClockMode::manual);
    bool fired = false;
    {
        TaskGroup group(&s);
        group.callAfter(0.5, [&] { fired = true; });
    }
    s.advance(1.0);
    REQUIRE_FALSE(fired);
}
