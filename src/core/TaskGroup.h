#pragma once

#include "core/Scheduler.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <set>

namespace labflow {

/// Timers and completions belonging to one owner (a node, a device).
///
/// cancelAll() cancels every pending timer and invalidates every callback
/// produced by wrap() before the call, so completions that arrive after a
/// stop are dropped. Safe to call repeatedly and after timers have fired.
class TaskGroup {
public:
    TaskGroup() = default;
    explicit TaskGroup(Scheduler* scheduler) : scheduler_(scheduler) {}
    ~TaskGroup() { cancelAll(); }

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    void setScheduler(Scheduler* scheduler);
    Scheduler* getScheduler() const { return scheduler_; }

    // Throws std::logic_error when no scheduler is attached.
    Scheduler::TimerId callAfter(double delaySeconds, Scheduler::Task task);
    bool cancel(Scheduler::TimerId id);
    void cancelAll();

    int activeCount() const { return static_cast<int>(timers_.size()); }
    bool isActive(Scheduler::TimerId id) const { return timers_.count(id) > 0; }

    template <typename... Args>
    std::function<void(Args...)> wrap(std::function<void(Args...)> fn) const
    {
        std::weak_ptr<uint64_t> weak = generation_;
        uint64_t expected = *generation_;
        return [weak, expected, fn](Args... args) {
            auto generation = weak.lock();
            if (!generation || *generation != expected)
                return;
            fn(args...);
        };
    }

    // True while callbacks wrapped now would still be delivered.
    std::function<bool()> aliveToken() const;

private:
    Scheduler* scheduler_ = nullptr;
    std::set<Scheduler::TimerId> timers_;
    std::shared_ptr<uint64_t> generation_ = std::make_shared<uint64_t>(0);
};

} // namespace labflow
