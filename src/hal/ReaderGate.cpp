#include "hal/ReaderGate.h"

namespace labflow {

ReaderGate::ReaderGate(std::function<void()> wake)
    : wake_(std::move(wake))
{
}

bool ReaderGate::enterPoll(std::unique_lock<std::mutex>& lock)
{
    cv_.wait(lock, [this] { return waiting_ == 0 || stopped_; });
    if (stopped_)
        return false;
    polling_ = true;
    return true;
}

void ReaderGate::leavePoll()
{
    polling_ = false;
    cv_.notify_all();
}

void ReaderGate::waitForReader(std::unique_lock<std::mutex>& lock)
{
    ++waiting_;
    if (polling_ && wake_)
        wake_();
    cv_.wait(lock, [this] { return !polling_; });
}

void ReaderGate::closed()
{
    --waiting_;
    cv_.notify_all();
}

void ReaderGate::stop()
{
    stopped_ = true;
    cv_.notify_all();
}

void ReaderGate::reset()
{
    stopped_ = false;
    polling_ = false;
    waiting_ = 0;
}

} // namespace labflow
