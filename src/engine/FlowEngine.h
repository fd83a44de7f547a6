#pragma once

#include "core/Config.h"
#include "core/ObserverList.h"
#include "core/Scheduler.h"
#include "engine/Node.h"
#include "engine/NodeRegistry.h"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace labflow {

class HardwareManager;

enum class FlowState { stopped, running };

const char* toString(FlowState state);

struct Connection {
    std::string id;
    std::string fromNode;
    int fromPort = 0;
    std::string toNode;
    int toPort = 0;
    PortKind kind = PortKind::data;
};

enum class IssueSeverity { error, warning };

const char* toString(IssueSeverity severity);

struct ValidationIssue {
    IssueSeverity severity = IssueSeverity::error;
    std::string message;
    std::string nodeId;        // empty when not tied to a node
    std::string connectionId;  // empty when not tied to a connection
};

// Optional arguments of createNode.
struct NodeOptions {
    Value position;       // opaque, kept for the editor
    Value state;          // merged into the node state
    std::string deviceId; // bound through the attached HardwareManager
};

/// Owns the experiment graph and drives its lifecycle.
///
/// Connections are wired into the nodes when they are made: firing an exec
/// output calls the linked trigger directly and setting an output copies the
/// value along every data link. The engine itself never dispatches.
///
/// The HardwareManager, when attached, must outlive the engine.
/// All members are called on the scheduler thread.
class FlowEngine {
public:
    using StateCallback = std::function<void(FlowState state)>;
    using CompleteCallback = std::function<void(const std::string& nodeId)>;
    using NodeUpdateCallback = std::function<void(const std::string& nodeId,
                                                  const std::string& key, const Value& value)>;

    explicit FlowEngine(Scheduler& scheduler, NodeRegistry registry = NodeRegistry(),
                        Config config = Config());
    ~FlowEngine();

    FlowEngine(const FlowEngine&) = delete;
    FlowEngine& operator=(const FlowEngine&) = delete;

    Scheduler& getScheduler() const { return scheduler_; }
    const Config& getConfig() const { return config_; }
    NodeRegistry& getRegistry() { return registry_; }
    const NodeRegistry& getRegistry() const { return registry_; }

    void setHardwareManager(HardwareManager* hardware);
    HardwareManager* getHardwareManager() const { return hardware_; }

    // --- Nodes ---
    Node* createNode(const std::string& id, const std::string& type, std::string& error);
    Node* createNode(const std::string& id, const std::string& type,
                     const NodeOptions& options, std::string& error);
    // Removes the node's connections, stops it and releases its device binding.
    bool deleteNode(const std::string& id);
    Node* getNode(const std::string& id) const;
    // Insertion order.
    std::vector<Node*> getNodes() const;
    int nodeCount() const { return static_cast<int>(nodes_.size()); }

    // --- Connections ---

    // Returns the connection id, or an empty string with error filled in.
    std::string connect(const std::string& fromNode, int fromPort,
                        const std::string& toNode, int toPort,
                        std::string& error, const std::string& connectionId = {});
    std::string connectPorts(const std::string& fromNode, const std::string& outputName,
                             const std::string& toNode, const std::string& inputName,
                             std::string& error);
    bool disconnect(const std::string& connectionId);
    std::vector<Connection> getConnections() const;
    const Connection* findConnection(const std::string& connectionId) const;
    int connectionCount() const { return static_cast<int>(connections_.size()); }

    // Bumped on every node or connection change.
    uint64_t getRevision() const { return revision_; }

    // --- Validation ---
    std::vector<ValidationIssue> validate() const;

    // --- Lifecycle ---
    void start();
    // Stops every node. Safe to call when already stopped.
    void stop();
    void pause();
    void resume();
    bool isRunning() const { return state_ == FlowState::running; }
    bool isPaused() const { return paused_; }
    FlowState getState() const { return state_; }

    // Triggers an exec input of a node as if an upstream node had fired.
    bool triggerExec(const std::string& nodeId, int inputIndex = 0);

    // Reported by end-of-flow nodes.
    void notifyFlowComplete(const std::string& nodeId);

    // Stops and removes every node and connection.
    void clear();

    // --- Observers ---
    uint32_t addStateObserver(StateCallback callback);
    bool removeStateObserver(uint32_t id);
    uint32_t addFlowCompleteObserver(CompleteCallback callback);
    bool removeFlowCompleteObserver(uint32_t id);
    uint32_t addNodeUpdateObserver(NodeUpdateCallback callback);
    bool removeNodeUpdateObserver(uint32_t id);

    // --- Layout ---
    nlohmann::json saveLayout() const;
    // Replaces the graph (and the hardware, when a HardwareManager is attached
    // and the layout has a "hardware" section). On failure the graph is left
    // empty.
    bool loadLayout(const nlohmann::json& layout, std::string& error);

private:
    struct ConnectionEntry {
        Connection connection;
        uint32_t linkId = 0;
    };

    bool loadNodes(const nlohmann::json& layout, std::string& error);
    bool loadConnections(const nlohmann::json& layout, std::string& error);
    void removeConnectionAt(size_t index);
    void bindDeviceById(Node& node, const std::string& deviceId);
    void setState(FlowState state);
    std::string nextConnectionId();

    Scheduler& scheduler_;
    NodeRegistry registry_;
    Config config_;
    HardwareManager* hardware_ = nullptr;
    uint32_t deviceRemovedSubscription_ = 0;

    std::vector<std::unique_ptr<Node>> nodes_;
    std::unordered_map<std::string, Node*> nodeIndex_;
    std::unordered_map<std::string, std::string> deviceBindings_;  // node id -> device id
    std::vector<ConnectionEntry> connections_;
    int nextConnectionNumber_ = 1;
    uint64_t revision_ = 0;

    FlowState state_ = FlowState::stopped;
    bool paused_ = false;

    ObserverList<FlowState> stateObservers_;
    ObserverList<const std::string&> completeObservers_;
    ObserverList<const std::string&, const std::string&, const Value&> nodeUpdateObservers_;
};

} // namespace labflow
