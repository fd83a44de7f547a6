#include "core/Scheduler.h"
#include "core/Logger.h"

#include <algorithm>
#include <exception>
#include <limits>

namespace labflow {

Scheduler::Scheduler(ClockMode mode)
    : mode_(mode)
    , start_(std::chrono::steady_clock::now())
{
    LF_DEBUG("Scheduler: created (%s clock)", mode == ClockMode::manual ? "manual" : "realtime");
}

double Scheduler::now() const
{
    if (mode_ == ClockMode::manual)
        return virtualNow_;
    auto elapsed = std::chrono::steady_clock::now() - start_;
    return std::chrono::duration<double>(elapsed).count();
}

// ═══════════════════════════════════════════════════════════════════
// Timers
// ═══════════════════════════════════════════════════════════════════

Scheduler::TimerId Scheduler::callAfter(double delaySeconds, Task task)
{
    if (!task)
    {
        LF_WARN("Scheduler::callAfter: empty task");
        return 0;
    }
    double due = now() + std::max(0.0, delaySeconds);
    TimerId id = nextTimerId_++;
    timers_.emplace(TimerKey{due, id}, std::move(task));
    dueById_[id] = due;
    LF_TRACE("Scheduler::callAfter: id=%llu due=%.4f",
             static_cast<unsigned long long>(id), due);
    return id;
}

bool Scheduler::cancel(TimerId id)
{
    auto it = dueById_.find(id);
    if (it == dueById_.end())
        return false;
    timers_.erase(TimerKey{it->second, id});
    dueById_.erase(it);
    LF_TRACE("Scheduler::cancel: id=%llu", static_cast<unsigned long long>(id));
    return true;
}

bool Scheduler::isPending(TimerId id) const
{
    return dueById_.count(id) > 0;
}

int Scheduler::pendingTimerCount() const
{
    return static_cast<int>(timers_.size());
}

// ═══════════════════════════════════════════════════════════════════
// Cross-thread hand-over
// ═══════════════════════════════════════════════════════════════════

void Scheduler::post(Task task)
{
    if (!task)
        return;
    {
        std::lock_guard<std::mutex> lock(postMutex_);
        posted_.push_back(std::move(task));
    }
    postCv_.notify_one();
}

void Scheduler::stop()
{
    stopRequested_.store(true, std::memory_order_release);
    std::lock_guard<std::mutex> lock(postMutex_);
    postCv_.notify_all();
}

// ═══════════════════════════════════════════════════════════════════
// Loop internals
// ═══════════════════════════════════════════════════════════════════

void Scheduler::runTask(Task& task)
{
    try
    {
        task();
    }
    catch (const std::exception& e)
    {
        LF_WARN("Scheduler: task threw: %s", e.what());
    }
    catch (...)
    {
        LF_WARN("Scheduler: task threw a non-standard exception");
    }
}

int Scheduler::drainPosted()
{
    std::deque<Task> batch;
    {
        std::lock_guard<std::mutex> lock(postMutex_);
        batch.swap(posted_);
    }
    for (auto& task : batch)
        runTask(task);
    return static_cast<int>(batch.size());
}

bool Scheduler::popDueTimer(double limit, Task& task)
{
    if (timers_.empty())
        return false;
    auto it = timers_.begin();
    if (it->first.first > limit)
        return false;
    if (mode_ == ClockMode::manual)
        virtualNow_ = std::max(virtualNow_, it->first.first);
    task = std::move(it->second);
    dueById_.erase(it->first.second);
    timers_.erase(it);
    return true;
}

int Scheduler::runPending()
{
    int count = drainPosted();
    Task task;
    double limit = now();
    while (popDueTimer(limit, task))
    {
        runTask(task);
        ++count;
        count += drainPosted();
    }
    return count;
}

void Scheduler::advance(double seconds)
{
    if (mode_ == ClockMode::realtime)
    {
        runFor(seconds);
        return;
    }

    const double target = virtualNow_ + std::max(0.0, seconds);
    Task task;
    drainPosted();
    while (popDueTimer(target, task))
    {
        runTask(task);
        drainPosted();
    }
    virtualNow_ = std::max(virtualNow_, target);
}

void Scheduler::loopUntil(double deadline)
{
    while (!stopRequested_.load(std::memory_order_acquire))
    {
        runPending();

        double current = now();
        if (current >= deadline)
            break;

        double wake = deadline;
        if (!timers_.empty())
            wake = std::min(wake, timers_.begin()->first.first);

        std::unique_lock<std::mutex> lock(postMutex_);
        if (!posted_.empty() || stopRequested_.load(std::memory_order_acquire))
            continue;
        if (wake == std::numeric_limits<double>::infinity())
            postCv_.wait(lock);
        else if (wake > current)
            postCv_.wait_for(lock, std::chrono::duration<double>(wake - current));
    }
}

void Scheduler::runFor(double seconds)
{
    if (mode_ == ClockMode::manual)
    {
        advance(seconds);
        return;
    }
    stopRequested_.store(false, std::memory_order_release);
    loopUntil(now() + std::max(0.0, seconds));
}

void Scheduler::run()
{
    stopRequested_.store(false, std::memory_order_release);
    if (mode_ == ClockMode::manual)
    {
        // Virtual time jumps straight to each timer until none remain.
        while (!stopRequested_.load(std::memory_order_acquire))
        {
            drainPosted();
            if (timers_.empty())
                break;
            advance(timers_.begin()->first.first - virtualNow_);
        }
        return;
    }
    loopUntil(std::numeric_limits<double>::infinity());
}

} // namespace labflow
