#include "engine/Node.h"
#include "core/Logger.h"
#include "hal/Device.h"

#include <algorithm>
#include <set>

namespace labflow {

namespace {

const Value kNullValue;

thread_local int execDepth = 0;
thread_local bool passActive = false;
thread_local std::vector<Node*> deferredRoots;
thread_local std::set<const Node*> passMembers;

// Follow-up passes allowed for roots set from inside a pass.
constexpr int kMaxFollowUpPasses = 256;

struct DepthGuard {
    DepthGuard() { ++execDepth; }
    ~DepthGuard() { --execDepth; }
};

} // namespace

// ═══════════════════════════════════════════════════════════════════
// Propagation pass
// ═══════════════════════════════════════════════════════════════════

// Recomputes every reactive node reachable from the roots exactly once,
// upstream before downstream. Back edges of a data cycle are ignored, so a
// cycle recomputes each member once per pass and then stops. Roots set
// while a pass is running (from an update callback) get their own pass
// once the current one ends.
class PropagationPass {
public:
    static void run(const std::vector<Node*>& roots)
    {
        if (roots.empty())
            return;
        if (passActive)
        {
            deferredRoots.insert(deferredRoots.end(), roots.begin(), roots.end());
            return;
        }

        passActive = true;
        struct Reset {
            ~Reset()
            {
                passActive = false;
                deferredRoots.clear();
                passMembers.clear();
            }
        } reset;

        recomputeAll(order(roots));

        for (int pass = 0; !deferredRoots.empty(); ++pass)
        {
            if (pass == kMaxFollowUpPasses)
            {
                LF_WARN("Propagation: input feedback did not settle after %d passes", pass);
                break;
            }
            std::vector<Node*> next;
            next.swap(deferredRoots);
            recomputeAll(order(next));
        }
    }

    // Targets of an output set during a pass. Members of the running pass
    // already see the value; anything else needs a pass of its own.
    static void deliver(const std::vector<Node*>& targets)
    {
        if (!passActive)
        {
            run(targets);
            return;
        }
        for (Node* target : targets)
        {
            if (passMembers.count(target) == 0)
                deferredRoots.push_back(target);
        }
    }

private:
    static void recomputeAll(const std::vector<Node*>& nodes)
    {
        passMembers.clear();
        passMembers.insert(nodes.begin(), nodes.end());
        for (Node* node : nodes)
            node->recompute();
    }

    struct Frame {
        Node* node;
        std::vector<Node*> children;
        size_t next;
    };

    static std::vector<Node*> order(const std::vector<Node*>& roots)
    {
        std::set<Node*> visited;
        std::vector<Node*> postorder;
        std::vector<Frame> stack;

        for (Node* root : roots)
        {
            if (!visited.insert(root).second)
                continue;
            stack.push_back({root, children(root), 0});

            while (!stack.empty())
            {
                Frame& top = stack.back();
                if (top.next < top.children.size())
                {
                    Node* child = top.children[top.next++];
                    if (visited.insert(child).second)
                        stack.push_back({child, children(child), 0});
                }
                else
                {
                    postorder.push_back(top.node);
                    stack.pop_back();
                }
            }
        }

        std::reverse(postorder.begin(), postorder.end());
        return postorder;
    }

    static std::vector<Node*> children(const Node* node)
    {
        std::vector<Node*> result;
        node->appendReactiveTargets(result);
        return result;
    }
};

// ═══════════════════════════════════════════════════════════════════
// Node
// ═══════════════════════════════════════════════════════════════════

Node::Node(std::string id, NodeDefinition definition)
    : id_(std::move(id))
    , definition_(std::move(definition))
{
    inputs_.reserve(definition_.inputs.size());
    for (const auto& port : definition_.inputs)
        inputs_.push_back(port.defaultValue);
    outputs_.resize(definition_.outputs.size());
}

Node::~Node() = default;

void Node::attach(const NodeContext& context)
{
    context_ = context;
    tasks_.setScheduler(context.scheduler);
}

const Value& Node::getInput(int index) const
{
    if (index < 0 || index >= inputCount())
        return kNullValue;
    return inputs_[static_cast<size_t>(index)];
}

const Value& Node::getOutput(int index) const
{
    if (index < 0 || index >= outputCount())
        return kNullValue;
    return outputs_[static_cast<size_t>(index)];
}

void Node::storeInput(int index, const Value& value)
{
    if (index < 0 || index >= inputCount())
        return;
    inputs_[static_cast<size_t>(index)] = value;
}

void Node::setInput(int index, const Value& value)
{
    if (index < 0 || index >= inputCount())
    {
        LF_WARN("Node %s: input index %d out of range", id_.c_str(), index);
        return;
    }
    storeInput(index, value);
    if (isReactive() && enabled_)
        PropagationPass::run({this});
}

void Node::setOutput(int index, const Value& value)
{
    if (index < 0 || index >= outputCount())
    {
        LF_WARN("Node %s: output index %d out of range", id_.c_str(), index);
        return;
    }
    outputs_[static_cast<size_t>(index)] = value;

    std::vector<Node*> reactive;
    auto snapshot = links_;
    for (const auto& link : snapshot)
    {
        if (link.kind != PortKind::data || link.output != index)
            continue;
        link.target->storeInput(link.input, value);
        if (link.target->isReactive() && link.target->enabled_)
            reactive.push_back(link.target);
    }

    updateObservers_.notify(definition_.outputs[static_cast<size_t>(index)].name, value);

    PropagationPass::deliver(reactive);
}

void Node::appendReactiveTargets(std::vector<Node*>& targets) const
{
    for (const auto& link : links_)
    {
        if (link.kind == PortKind::data && link.target->isReactive() && link.target->enabled_)
            targets.push_back(link.target);
    }
}

// ═══════════════════════════════════════════════════════════════════
// Execution
// ═══════════════════════════════════════════════════════════════════

void Node::trigger(int inputIndex)
{
    if (!enabled_)
    {
        LF_DEBUG("Node %s: disabled, trigger ignored", id_.c_str());
        return;
    }
    if (execDepth >= kMaxExecDepth)
    {
        setError("Execution depth limit exceeded");
        return;
    }

    DepthGuard depth;
    LF_TRACE("Node %s (%s): trigger %d", id_.c_str(), definition_.typeName.c_str(), inputIndex);
    try
    {
        onExec(inputIndex);
    }
    catch (const std::exception& e)
    {
        setError(e.what());
    }
}

void Node::fireExec(int outputIndex)
{
    auto snapshot = links_;
    for (const auto& link : snapshot)
    {
        if (link.kind == PortKind::exec && link.output == outputIndex)
            link.target->trigger(link.input);
    }
}

// ═══════════════════════════════════════════════════════════════════
// Links
// ═══════════════════════════════════════════════════════════════════

uint32_t Node::addDataLink(int output, Node* target, int input)
{
    return addLink(PortKind::data, output, target, input);
}

uint32_t Node::addExecLink(int output, Node* target, int input)
{
    return addLink(PortKind::exec, output, target, input);
}

uint32_t Node::addLink(PortKind kind, int output, Node* target, int input)
{
    if (!target)
        return 0;
    uint32_t id = nextLinkId_++;
    links_.push_back({id, kind, output, target, input});
    return id;
}

bool Node::removeLink(uint32_t linkId)
{
    auto it = std::find_if(links_.begin(), links_.end(),
                           [linkId](const Link& l) { return l.id == linkId; });
    if (it == links_.end())
        return false;
    links_.erase(it);
    return true;
}

void Node::removeLinksTo(const Node* target)
{
    links_.erase(std::remove_if(links_.begin(), links_.end(),
                                [target](const Link& l) { return l.target == target; }),
                 links_.end());
}

// ═══════════════════════════════════════════════════════════════════
// State, device, flags
// ═══════════════════════════════════════════════════════════════════

void Node::setState(const Value& state)
{
    if (!state.is_object())
        return;
    for (auto it = state.begin(); it != state.end(); ++it)
        state_[it.key()] = it.value();
    onStateChanged();
}

void Node::setStateValue(const std::string& key, const Value& value)
{
    state_[key] = value;
    onStateChanged();
}

void Node::bindDevice(Device* device)
{
    device_ = device;
    if (device_)
    {
        LF_DEBUG("Node %s: bound to device %s", id_.c_str(), device_->getId().c_str());
        if (error_ == "No device bound")
            clearError();
        onDeviceBound();
    }
}

void Node::unbindDevice()
{
    device_ = nullptr;
}

void Node::setError(const std::string& message)
{
    error_ = message;
    LF_WARN("Node %s (%s): %s", id_.c_str(), definition_.typeName.c_str(), message.c_str());
    updateObservers_.notify("error", Value(message));
}

void Node::clearError()
{
    if (error_.empty())
        return;
    error_.clear();
    updateObservers_.notify("error", Value());
}

uint32_t Node::registerUpdateCallback(UpdateCallback callback)
{
    return updateObservers_.add(std::move(callback));
}

bool Node::unregisterUpdateCallback(uint32_t id)
{
    return updateObservers_.remove(id);
}

// ═══════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════

void Node::start()
{
    if (running_)
        return;
    running_ = true;
    paused_ = false;
    try
    {
        onStart();
    }
    catch (const std::exception& e)
    {
        setError(e.what());
    }
}

void Node::stop()
{
    tasks_.cancelAll();
    running_ = false;
    paused_ = false;
    try
    {
        onStop();
    }
    catch (const std::exception& e)
    {
        setError(e.what());
    }
}

void Node::pause()
{
    if (!running_ || paused_)
        return;
    paused_ = true;
    onPause();
}

void Node::resume()
{
    if (!running_ || !paused_)
        return;
    paused_ = false;
    onResume();
}

// ═══════════════════════════════════════════════════════════════════
// Node families
// ═══════════════════════════════════════════════════════════════════

void LogicNode::recompute()
{
    clearError();
    try
    {
        process();
    }
    catch (const std::exception& e)
    {
        setError(e.what());
    }
}

void HardwareNode::onExec(int inputIndex)
{
    if (!getDevice())
    {
        setError("No device bound");
        return;
    }
    onDeviceExec(inputIndex);
}

void HardwareNode::runAction(const std::string& action, const Value& argument,
                             std::function<void(const Value&)> onSuccess)
{
    Device* device = getDevice();
    if (!device)
    {
        setError("No device bound");
        return;
    }

    std::function<void(const IoResult&)> completion = [this, action, onSuccess](const IoResult& result) {
        if (!result.ok)
        {
            setError(action + " failed: " + result.error);
            return;
        }
        clearError();
        if (!onSuccess)
            return;
        try
        {
            onSuccess(result.value);
        }
        catch (const std::exception& e)
        {
            setError(e.what());
        }
    };
    device->executeAction(action, argument, tasks().wrap(completion));
}

InterfaceNode::InterfaceNode(std::string id, NodeDefinition definition)
    : Node(std::move(id), std::move(definition))
{
    setVisibleInDashboard(true);
}

void InterfaceNode::recompute()
{
    try
    {
        process();
    }
    catch (const std::exception& e)
    {
        setError(e.what());
    }
}

} // namespace labflow
