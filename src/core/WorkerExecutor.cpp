#include "core/WorkerExecutor.h"
#include "core/Logger.h"

#include <exception>

namespace labflow {

WorkerExecutor::WorkerExecutor(std::string name)
    : name_(std::move(name))
{
    thread_ = std::thread([this] { workerLoop(); });
    LF_DEBUG("WorkerExecutor[%s]: started", name_.c_str());
}

WorkerExecutor::~WorkerExecutor()
{
    shutdown();
}

bool WorkerExecutor::submit(std::function<void()> job)
{
    if (!job)
        return false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_)
        {
            LF_WARN("WorkerExecutor[%s]: submit after shutdown, job dropped", name_.c_str());
            return false;
        }
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
    return true;
}

int WorkerExecutor::pendingJobs() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(jobs_.size());
}

void WorkerExecutor::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable())
    {
        thread_.join();
        LF_DEBUG("WorkerExecutor[%s]: stopped", name_.c_str());
    }
}

void WorkerExecutor::workerLoop()
{
    while (true)
    {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !jobs_.empty() || !running_; });
            if (jobs_.empty())
                break;
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        try
        {
            job();
        }
        catch (const std::exception& e)
        {
            LF_WARN_WK("WorkerExecutor[%s]: job threw: %s", name_.c_str(), e.what());
        }
        catch (...)
        {
            LF_WARN_WK("WorkerExecutor[%s]: job threw a non-standard exception", name_.c_str());
        }
    }
}

} // namespace labflow
