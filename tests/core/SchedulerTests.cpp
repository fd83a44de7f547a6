#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/Scheduler.h"

#include <stdexcept>
#include <thread>
#include <vector>

using namespace labflow;
using Catch::Matchers::WithinAbs;

// ═══════════════════════════════════════════════════════════════════
// Manual clock
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Manual scheduler starts at time zero and only moves on advance")
{
    Scheduler s(ClockMode::manual);
    REQUIRE(s.getClockMode() == ClockMode::manual);
    REQUIRE(s.now() == 0.0);

    s.advance(1.5);
    REQUIRE_THAT(s.now(), WithinAbs(1.5, 1e-12));
}

TEST_CASE("Timers fire in due order, ties in creation order")
{
    Scheduler s(ClockMode::manual);
    std::vector<int> order;

    s.callAfter(0.3, [&] { order.push_back(3); });
    s.callAfter(0.1, [&] { order.push_back(1); });
    s.callAfter(0.2, [&] { order.push_back(2); });
    s.callAfter(0.2, [&] { order.push_back(22); });

    s.advance(1.0);
    REQUIRE(order == std::vector<int>{1, 2, 22, 3});
    REQUIRE(s.pendingTimerCount() == 0);
}

TEST_CASE("A timer sees the clock at its due time")
{
    Scheduler s(ClockMode::manual);
    double seen = -1.0;
    s.callAfter(0.25, [&] { seen = s.now(); });

    s.advance(10.0);
    REQUIRE_THAT(seen, WithinAbs(0.25, 1e-12));
    REQUIRE_THAT(s.now(), WithinAbs(10.0, 1e-12));
}

TEST_CASE("Timers scheduled from a timer fire within the same advance when due")
{
    Scheduler s(ClockMode::manual);
    int ticks = 0;
    std::function<void()> tick = [&] {
        ++ticks;
        s.callAfter(0.1, tick);
    };
    s.callAfter(0.1, tick);

    s.advance(1.0);
    REQUIRE(ticks >= 9);
    REQUIRE(ticks <= 10);
}

TEST_CASE("Timers due after the advance window stay pending")
{
    Scheduler s(ClockMode::manual);
    bool fired = false;
    auto id = s.callAfter(2.0, [&] { fired = true; });

    s.advance(1.0);
    REQUIRE_FALSE(fired);
    REQUIRE(s.isPending(id));

    s.advance(1.0);
    REQUIRE(fired);
    REQUIRE_FALSE(s.isPending(id));
}

TEST_CASE("cancel removes a pending timer once")
{
    Scheduler s(ClockMode::manual);
    bool fired = false;
    auto id = s.callAfter(0.5, [&] { fired = true; });

    REQUIRE(s.cancel(id));
    REQUIRE_FALSE(s.cancel(id));
    s.advance(1.0);
    REQUIRE_FALSE(fired);
}

TEST_CASE("Negative delays are treated as zero")
{
    Scheduler s(ClockMode::manual);
    bool fired = false;
    s.callAfter(-3.0, [&] { fired = true; });
    s.runPending();
    REQUIRE(fired);
}

TEST_CASE("Empty tasks are rejected")
{
    Scheduler s(ClockMode::manual);
    REQUIRE(s.callAfter(0.1, Scheduler::Task()) == 0);
    REQUIRE(s.pendingTimerCount() == 0);
}

TEST_CASE("A throwing task does not stop the loop")
{
    Scheduler s(ClockMode::manual);
    bool after = false;
    s.callAfter(0.1, [] { throw std::runtime_error("boom"); });
    s.callAfter(0.2, [&] { after = true; });

    REQUIRE_NOTHROW(s.advance(1.0));
    REQUIRE(after);
}

TEST_CASE("Manual run jumps through every timer until none remain")
{
    Scheduler s(ClockMode::manual);
    int count = 0;
    s.callAfter(5.0, [&] { ++count; });
    s.callAfter(60.0, [&] { ++count; });

    s.run();
    REQUIRE(count == 2);
    REQUIRE_THAT(s.now(), WithinAbs(60.0, 1e-9));
}

TEST_CASE("stop from a timer ends a manual run")
{
    Scheduler s(ClockMode::manual);
    bool late = false;
    s.callAfter(1.0, [&] { s.stop(); });
    s.callAfter(2.0, [&] { late = true; });

    s.run();
    REQUIRE_FALSE(late);
    REQUIRE(s.isStopRequested());
}

// ═══════════════════════════════════════════════════════════════════
// Cross-thread hand-over
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Posted tasks run on the next runPending")
{
    Scheduler s(ClockMode::manual);
    int value = 0;
    s.post([&] { value = 7; });
    REQUIRE(value == 0);
    REQUIRE(s.runPending() == 1);
    REQUIRE(value == 7);
}

TEST_CASE("Tasks posted from another thread wake a realtime run")
{
    Scheduler s(ClockMode::realtime);
    bool ran = false;

    std::thread other([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        s.post([&] {
            ran = true;
            s.stop();
        });
    });

    s.run();
    other.join();
    REQUIRE(ran);
}

TEST_CASE("Realtime runFor returns after roughly the requested time")
{
    Scheduler s(ClockMode::realtime);
    bool fired = false;
    s.callAfter(0.01, [&] { fired = true; });

    double before = s.now();
    s.runFor(0.05);
    REQUIRE(fired);
    REQUIRE(s.now() - before >= 0.045);
}
