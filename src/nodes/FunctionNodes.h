#pragma once

#include "core/ObserverList.h"
#include "engine/Node.h"

#include <memory>
#include <string>
#include <vector>

namespace labflow {

/// Entry marker of a reusable sub-flow. The function body is everything
/// reachable from `next` over exec edges. It runs only when called.
class StartFunctionNode : public ExecNode {
public:
    explicit StartFunctionNode(std::string id);
    static NodeDefinition describe();

    bool isEntryPoint() const override { return true; }
    std::string functionName() const;

protected:
    void onExec(int inputIndex) override;
};

/// Exit marker of a sub-flow. Reaching it notifies every completion observer.
class EndFunctionNode : public ExecNode {
public:
    explicit EndFunctionNode(std::string id);
    static NodeDefinition describe();

    uint32_t addCompletionObserver(std::function<void()> callback);
    bool removeCompletionObserver(uint32_t id);
    int completionObserverCount() const { return completionObservers_.size(); }

protected:
    void onExec(int inputIndex) override;

private:
    ObserverList<> completionObservers_;
};

/// Call site of a sub-flow.
///
/// The function is named by state `function_id` (the StartFunction node id)
/// or `function_name`. A call subscribes once to every EndFunction reachable
/// from the entry marker, fires the entry, and fires `next` exactly once:
/// when any exit is reached or after `timeout` seconds (default from the
/// config, 60 s), whichever comes first. Exit markers are resolved by a
/// breadth-first walk that is cached until the graph changes.
class FunctionCallNode : public ExecNode {
public:
    explicit FunctionCallNode(std::string id);
    static NodeDefinition describe();

    int pendingCalls() const { return static_cast<int>(pending_.size()); }
    // Ids of the exit markers found by the last resolution.
    const std::vector<std::string>& resolvedExits() const { return exitIds_; }

protected:
    void onExec(int inputIndex) override;
    void onStop() override;

private:
    struct PendingCall {
        bool finished = false;
        Scheduler::TimerId timer = 0;
        std::vector<std::pair<std::string, uint32_t>> subscriptions;  // exit node id, subscription
    };

    StartFunctionNode* resolveStart() const;
    void resolveExits(const StartFunctionNode& start);
    double timeoutSeconds() const;
    void release(PendingCall& call);
    void finish(const std::shared_ptr<PendingCall>& call, bool timedOut);

    std::vector<std::shared_ptr<PendingCall>> pending_;
    std::vector<std::string> exitIds_;
    std::string cachedStartId_;
    uint64_t cachedRevision_ = 0;
    bool cacheValid_ = false;
};

} // namespace labflow
