#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace labflow {

enum class ClockMode { realtime, manual };

/// Cooperative single-threaded event loop.
///
/// Every engine, node, device and board callback runs on the thread that
/// drives the scheduler. Other threads hand work over with post(), which is
/// the only thread-safe member. In manual mode the clock only moves when
/// advance() is called, which makes timer-driven behaviour deterministic.
class Scheduler {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;

    explicit Scheduler(ClockMode mode = ClockMode::realtime);
    ~Scheduler() = default;

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    ClockMode getClockMode() const { return mode_; }

    // Seconds since construction (virtual seconds in manual mode)
    double now() const;

    // --- Timers (scheduler thread) ---
    TimerId callAfter(double delaySeconds, Task task);
    bool cancel(TimerId id);
    bool isPending(TimerId id) const;
    int pendingTimerCount() const;

    // --- Cross-thread hand-over ---
    void post(Task task);

    // --- Driving the loop (scheduler thread) ---

    // Runs posted tasks and timers that are already due. Returns tasks run.
    int runPending();

    // Manual mode: moves virtual time forward, firing timers in due order.
    // Realtime mode: same as runFor().
    void advance(double seconds);

    // Runs the loop for the given wall-clock (or virtual) duration.
    void runFor(double seconds);

    // Runs until stop() is called.
    void run();

    // Thread-safe
    void stop();
    bool isStopRequested() const { return stopRequested_.load(std::memory_order_acquire); }

private:
    using TimerKey = std::pair<double, TimerId>;

    int drainPosted();
    bool popDueTimer(double limit, Task& task);
    void runTask(Task& task);
    void loopUntil(double deadline);

    const ClockMode mode_;
    const std::chrono::steady_clock::time_point start_;
    double virtualNow_ = 0.0;

    std::map<TimerKey, Task> timers_;
    std::unordered_map<TimerId, double> dueById_;
    TimerId nextTimerId_ = 1;

    mutable std::mutex postMutex_;
    std::condition_variable postCv_;
    std::deque<Task> posted_;
    std::atomic<bool> stopRequested_{false};
};

} // namespace labflow
