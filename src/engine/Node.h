#pragma once

#include "core/ObserverList.h"
#include "core/TaskGroup.h"
#include "engine/Port.h"
#include "hal/HalTypes.h"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace labflow {

class Device;
class FlowEngine;
struct Config;

/// What a node may reach outside itself. Any member may be null when the
/// node lives outside an engine (tests).
struct NodeContext {
    Scheduler* scheduler = nullptr;
    FlowEngine* engine = nullptr;
    const Config* config = nullptr;
};

/// A typed unit of the experiment graph.
///
/// Inputs start at their declared defaults, outputs start unset (null).
/// Data travels along links installed by the FlowEngine: setOutput() copies
/// the value into every linked input, then every reactive node downstream
/// recomputes once, in topological order, within a single propagation pass.
/// Exec links make fireExec() call the linked node's trigger() directly, so
/// everything downstream of one firing has run when fireExec() returns.
///
/// All members are called on the scheduler thread.
class Node {
public:
    using UpdateCallback = std::function<void(const std::string& key, const Value& value)>;

    // Synchronous trigger chains deeper than this are cut with an error.
    static constexpr int kMaxExecDepth = 256;

    Node(std::string id, NodeDefinition definition);
    virtual ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    const std::string& getId() const { return id_; }
    const NodeDefinition& getDefinition() const { return definition_; }
    const std::string& getTypeName() const { return definition_.typeName; }
    NodeCategory getCategory() const { return definition_.category; }

    void attach(const NodeContext& context);
    const NodeContext& getContext() const { return context_; }

    // --- Values ---
    int inputCount() const { return static_cast<int>(inputs_.size()); }
    int outputCount() const { return static_cast<int>(outputs_.size()); }
    int findInput(const std::string& name) const { return definition_.findInput(name); }
    int findOutput(const std::string& name) const { return definition_.findOutput(name); }

    // Out-of-range indices read as null.
    const Value& getInput(int index) const;
    const Value& getOutput(int index) const;

    // Reactive nodes recompute before this returns.
    void setInput(int index, const Value& value);
    void setOutput(int index, const Value& value);

    // --- Execution ---

    // Runs the node's action for an exec input. Exceptions are stored in the
    // node error and never reach the caller. Disabled nodes ignore triggers.
    void trigger(int inputIndex = 0);
    void fireExec(int outputIndex = 0);

    // --- Links (installed by the FlowEngine) ---
    uint32_t addDataLink(int output, Node* target, int input);
    uint32_t addExecLink(int output, Node* target, int input);
    bool removeLink(uint32_t linkId);
    // Drops every link pointing at target.
    void removeLinksTo(const Node* target);

    // --- State ---
    const Value& getState() const { return state_; }
    // Merges the keys of state into the current state.
    void setState(const Value& state);
    void setStateValue(const std::string& key, const Value& value);

    const Value& getPosition() const { return position_; }
    void setPosition(const Value& position) { position_ = position; }

    // --- Device ---
    // Rebinding replaces the previous binding.
    void bindDevice(Device* device);
    void unbindDevice();
    Device* getDevice() const { return device_; }

    // --- Flags ---
    bool isEnabled() const { return enabled_; }
    void setEnabled(bool enabled) { enabled_ = enabled; }
    const std::string& getError() const { return error_; }
    bool hasError() const { return !error_.empty(); }
    void clearError();
    bool isVisibleInDashboard() const { return visibleInDashboard_; }
    void setVisibleInDashboard(bool visible) { visibleInDashboard_ = visible; }

    // Called with (output name, value) on every output change and with
    // ("error", message or null) when the error changes.
    uint32_t registerUpdateCallback(UpdateCallback callback);
    bool unregisterUpdateCallback(uint32_t id);

    // --- Lifecycle ---
    void start();
    // Cancels every timer and pending completion of this node, then calls
    // onStop(). Idempotent, and valid on a node that was never started.
    void stop();
    void pause();
    void resume();
    bool isRunning() const { return running_; }
    bool isPaused() const { return paused_; }

    // Nodes that fire without an upstream trigger.
    virtual bool isEntryPoint() const { return false; }
    // Recomputes on input changes.
    virtual bool isReactive() const { return false; }
    virtual bool requiresDevice() const { return false; }

    // Called by the engine once every node has been started.
    virtual void onFlowStart() {}

protected:
    virtual void onExec(int inputIndex) { (void)inputIndex; }
    virtual void recompute() {}
    virtual void onStart() {}
    virtual void onStop() {}
    virtual void onPause() {}
    virtual void onResume() {}
    virtual void onStateChanged() {}
    virtual void onDeviceBound() {}

    void setError(const std::string& message);
    void notifyUpdate(const std::string& key, const Value& value) { updateObservers_.notify(key, value); }

    Scheduler* scheduler() const { return context_.scheduler; }
    const Config* config() const { return context_.config; }
    TaskGroup& tasks() { return tasks_; }

    double stateNumber(const char* key, double fallback) const { return stateDouble(state_, key, fallback); }

private:
    struct Link {
        uint32_t id;
        PortKind kind;
        int output;
        Node* target;
        int input;
    };

    friend class PropagationPass;

    uint32_t addLink(PortKind kind, int output, Node* target, int input);
    void storeInput(int index, const Value& value);
    void appendReactiveTargets(std::vector<Node*>& targets) const;

    std::string id_;
    NodeDefinition definition_;
    NodeContext context_;

    std::vector<Value> inputs_;
    std::vector<Value> outputs_;
    Value state_ = Value::object();
    Value position_ = Value::object();

    std::vector<Link> links_;
    uint32_t nextLinkId_ = 1;

    Device* device_ = nullptr;
    bool enabled_ = true;
    bool visibleInDashboard_ = false;
    bool running_ = false;
    bool paused_ = false;
    std::string error_;

    ObserverList<const std::string&, const Value&> updateObservers_;
    TaskGroup tasks_;
};

/// Pure computation. process() runs whenever an input changes; a thrown
/// exception becomes the node error, a clean run clears it.
class LogicNode : public Node {
public:
    using Node::Node;

    bool isReactive() const override { return true; }

protected:
    virtual void process() = 0;
    void recompute() override;
};

/// Control flow. Acts only when triggered through an exec input.
class ExecNode : public Node {
public:
    using Node::Node;
};

/// Exec node that drives a bound device. Triggering it without a device sets
/// the error "No device bound" instead of running the action.
class HardwareNode : public ExecNode {
public:
    using ExecNode::ExecNode;

    bool requiresDevice() const override { return true; }

protected:
    void onExec(int inputIndex) final;
    virtual void onDeviceExec(int inputIndex) = 0;

    // Runs an action on the bound device. Failures become the node error;
    // onSuccess runs only when the action succeeded and the node is still
    // running the same generation of work.
    void runAction(const std::string& action, const Value& argument,
                   std::function<void(const Value&)> onSuccess);
};

/// Dashboard widget. Reactive like a logic node and visible by default.
class InterfaceNode : public Node {
public:
    InterfaceNode(std::string id, NodeDefinition definition);

    bool isReactive() const override { return true; }

protected:
    virtual void process() {}
    void recompute() override;
};

} // namespace labflow
