#include "core/TaskGroup.h"
#include "core/Logger.h"

#include <stdexcept>

namespace labflow {

void TaskGroup::setScheduler(Scheduler* scheduler)
{
    if (scheduler_ && scheduler_ != scheduler)
        cancelAll();
    scheduler_ = scheduler;
}

Scheduler::TimerId TaskGroup::callAfter(double delaySeconds, Scheduler::Task task)
{
    if (!scheduler_)
        throw std::logic_error("no scheduler attached");

    auto holder = std::make_shared<Scheduler::TimerId>(0);
    Scheduler::TimerId id = scheduler_->callAfter(delaySeconds,
        [this, holder, task = std::move(task)]() {
            timers_.erase(*holder);
            task();
        });
    *holder = id;
    if (id != 0)
        timers_.insert(id);
    return id;
}

bool TaskGroup::cancel(Scheduler::TimerId id)
{
    if (timers_.erase(id) == 0)
        return false;
    if (scheduler_)
        scheduler_->cancel(id);
    return true;
}

void TaskGroup::cancelAll()
{
    if (scheduler_)
    {
        for (auto id : timers_)
            scheduler_->cancel(id);
    }
    if (!timers_.empty())
        LF_TRACE("TaskGroup::cancelAll: cancelled %d timers", static_cast<int>(timers_.size()));
    timers_.clear();
    ++*generation_;
}

std::function<bool()> TaskGroup::aliveToken() const
{
    std::weak_ptr<uint64_t> weak = generation_;
    uint64_t expected = *generation_;
    return [weak, expected]() {
        auto generation = weak.lock();
        return generation && *generation == expected;
    };
}

} // namespace labflow
