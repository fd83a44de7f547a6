#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace labflow {

/// Background thread for blocking platform calls (GPIO ioctls, serial writes).
/// Jobs run in submission order. Results go back to the scheduler through
/// Scheduler::post; a job never touches engine state directly.
class WorkerExecutor {
public:
    explicit WorkerExecutor(std::string name);
    ~WorkerExecutor();

    WorkerExecutor(const WorkerExecutor&) = delete;
    WorkerExecutor& operator=(const WorkerExecutor&) = delete;

    // Returns false once shutdown has begun.
    bool submit(std::function<void()> job);
    int pendingJobs() const;

    // Waits for queued jobs to finish, then joins. Idempotent.
    void shutdown();

private:
    void workerLoop();

    const std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> jobs_;
    bool running_ = true;
    std::thread thread_;
};

} // namespace labflow
