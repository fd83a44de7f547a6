#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>

namespace labflow {

/// Keeps a reader thread that polls a snapshot of descriptors apart from
/// threads that close them. A descriptor is only closed while the reader is
/// outside its poll, so a reused fd number is never read by mistake.
///
/// Every call expects the owner's mutex (the one guarding the descriptor
/// table) to be held through lock.
class ReaderGate {
public:
    // wake interrupts the reader's poll (an eventfd write, for example).
    explicit ReaderGate(std::function<void()> wake);

    // Reader: waits out pending closes, then marks the reader as polling.
    // Returns false once stop() has been called.
    bool enterPoll(std::unique_lock<std::mutex>& lock);
    // Reader: call after re-acquiring the lock.
    void leavePoll();

    // Closer: wakes the reader and returns once it is outside its poll.
    // Pair with closed() once the descriptor is gone.
    void waitForReader(std::unique_lock<std::mutex>& lock);
    void closed();

    void stop();
    void reset();

    bool isPolling() const { return polling_; }

private:
    std::function<void()> wake_;
    std::condition_variable cv_;
    bool polling_ = false;
    bool stopped_ = false;
    int waiting_ = 0;
};

} // namespace labflow
