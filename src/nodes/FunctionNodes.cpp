#include "nodes/FunctionNodes.h"
#include "core/Config.h"
#include "core/Logger.h"
#include "engine/FlowEngine.h"

#include <algorithm>
#include <deque>
#include <set>

namespace labflow {

// ═══════════════════════════════════════════════════════════════════
// Markers
// ═══════════════════════════════════════════════════════════════════

StartFunctionNode::StartFunctionNode(std::string id)
    : ExecNode(std::move(id), describe())
{
}

NodeDefinition StartFunctionNode::describe()
{
    NodeDefinition d;
    d.typeName = "StartFunction";
    d.category = NodeCategory::logic;
    d.description = "Entry point for a user-defined function";
    d.outputs = {execPort("next", "Triggers the function body")};
    return d;
}

std::string StartFunctionNode::functionName() const
{
    return stateString(getState(), "function_name", "MyFunction");
}

void StartFunctionNode::onExec(int)
{
    LF_DEBUG("Function '%s' entered at %s", functionName().c_str(), getId().c_str());
    fireExec(0);
}

EndFunctionNode::EndFunctionNode(std::string id)
    : ExecNode(std::move(id), describe())
{
}

NodeDefinition EndFunctionNode::describe()
{
    NodeDefinition d;
    d.typeName = "EndFunction";
    d.category = NodeCategory::logic;
    d.description = "Exit point for a user-defined function";
    d.inputs = {execPort("exec")};
    return d;
}

uint32_t EndFunctionNode::addCompletionObserver(std::function<void()> callback)
{
    return completionObservers_.add(std::move(callback));
}

bool EndFunctionNode::removeCompletionObserver(uint32_t id)
{
    return completionObservers_.remove(id);
}

void EndFunctionNode::onExec(int)
{
    LF_DEBUG("Function exit %s reached (%d waiting)", getId().c_str(), completionObservers_.size());
    completionObservers_.notify();
}

// ═══════════════════════════════════════════════════════════════════
// FunctionCall
// ═══════════════════════════════════════════════════════════════════

FunctionCallNode::FunctionCallNode(std::string id)
    : ExecNode(std::move(id), describe())
{
}

NodeDefinition FunctionCallNode::describe()
{
    NodeDefinition d;
    d.typeName = "FunctionCall";
    d.category = NodeCategory::logic;
    d.description = "Call a user-defined function";
    d.inputs = {execPort("exec")};
    d.outputs = {execPort("next", "Triggers after the function completes")};
    return d;
}

StartFunctionNode* FunctionCallNode::resolveStart() const
{
    FlowEngine* engine = getContext().engine;
    if (!engine)
        return nullptr;

    for (const char* key : {"function_id", "function_start_id", "start_node_id"})
    {
        std::string id = stateString(getState(), key, "");
        if (!id.empty())
            return dynamic_cast<StartFunctionNode*>(engine->getNode(id));
    }

    std::string name = stateString(getState(), "function_name", "");
    if (name.empty())
        return nullptr;
    for (Node* node : engine->getNodes())
    {
        auto* start = dynamic_cast<StartFunctionNode*>(node);
        if (start && start->functionName() == name)
            return start;
    }
    return nullptr;
}

void FunctionCallNode::resolveExits(const StartFunctionNode& start)
{
    FlowEngine& engine = *getContext().engine;
    if (cacheValid_ && cachedStartId_ == start.getId() && cachedRevision_ == engine.getRevision())
        return;

    exitIds_.clear();
    std::set<std::string> visited{start.getId()};
    std::deque<std::string> queue{start.getId()};
    auto connections = engine.getConnections();

    while (!queue.empty())
    {
        std::string current = queue.front();
        queue.pop_front();
        if (dynamic_cast<EndFunctionNode*>(engine.getNode(current)))
            exitIds_.push_back(current);

        for (const auto& c : connections)
        {
            if (c.kind == PortKind::exec && c.fromNode == current && visited.insert(c.toNode).second)
                queue.push_back(c.toNode);
        }
    }

    cachedStartId_ = start.getId();
    cachedRevision_ = engine.getRevision();
    cacheValid_ = true;
    LF_DEBUG("FunctionCall %s: %d exit(s) reachable from %s", getId().c_str(),
             static_cast<int>(exitIds_.size()), start.getId().c_str());
}

double FunctionCallNode::timeoutSeconds() const
{
    double fallback = config() ? config()->timing.functionExecutionTimeout : 60.0;
    return std::max(0.0, stateNumber("timeout", fallback));
}

void FunctionCallNode::onExec(int)
{
    StartFunctionNode* start = resolveStart();
    if (!start)
    {
        setError("Function not found");
        return;
    }
    clearError();
    resolveExits(*start);

    if (exitIds_.empty())
    {
        LF_INFO("FunctionCall %s: '%s' has no reachable EndFunction, completing immediately",
                getId().c_str(), start->functionName().c_str());
        start->trigger(0);
        fireExec(0);
        return;
    }

    auto call = std::make_shared<PendingCall>();
    std::weak_ptr<PendingCall> weak = call;
    FlowEngine& engine = *getContext().engine;

    for (const auto& exitId : exitIds_)
    {
        auto* exit = dynamic_cast<EndFunctionNode*>(engine.getNode(exitId));
        if (!exit)
            continue;
        uint32_t sub = exit->addCompletionObserver([this, weak]() {
            if (auto c = weak.lock())
                finish(c, false);
        });
        call->subscriptions.emplace_back(exitId, sub);
    }

    double timeout = timeoutSeconds();
    call->timer = tasks().callAfter(timeout, [this, weak]() {
        if (auto c = weak.lock())
            finish(c, true);
    });
    pending_.push_back(call);

    LF_DEBUG("FunctionCall %s: calling '%s' (timeout %.1f s)", getId().c_str(),
             start->functionName().c_str(), timeout);
    start->trigger(0);
}

void FunctionCallNode::release(PendingCall& call)
{
    call.finished = true;
    FlowEngine* engine = getContext().engine;
    for (const auto& sub : call.subscriptions)
    {
        auto* exit = engine ? dynamic_cast<EndFunctionNode*>(engine->getNode(sub.first)) : nullptr;
        if (exit)
            exit->removeCompletionObserver(sub.second);
    }
    call.subscriptions.clear();
    if (call.timer)
        tasks().cancel(call.timer);
    call.timer = 0;
}

void FunctionCallNode::finish(const std::shared_ptr<PendingCall>& call, bool timedOut)
{
    if (call->finished)
        return;
    release(*call);
    pending_.erase(std::remove(pending_.begin(), pending_.end(), call), pending_.end());

    if (timedOut)
        LF_WARN("FunctionCall %s: timed out after %.1f s, continuing", getId().c_str(), timeoutSeconds());
    fireExec(0);
}

void FunctionCallNode::onStop()
{
    auto calls = std::move(pending_);
    pending_.clear();
    for (auto& call : calls)
        release(*call);
}

} // namespace labflow
