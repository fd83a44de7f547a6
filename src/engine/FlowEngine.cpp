#include "engine/FlowEngine.h"
#include "core/Logger.h"
#include "hal/HardwareManager.h"

#include <algorithm>
#include <deque>
#include <map>
#include <set>

namespace labflow {

const char* toString(FlowState state)
{
    switch (state)
    {
    case FlowState::stopped: return "STOPPED";
    case FlowState::running: return "RUNNING";
    }
    return "UNKNOWN";
}

const char* toString(IssueSeverity severity)
{
    switch (severity)
    {
    case IssueSeverity::error:   return "error";
    case IssueSeverity::warning: return "warning";
    }
    return "unknown";
}

FlowEngine::FlowEngine(Scheduler& scheduler, NodeRegistry registry, Config config)
    : scheduler_(scheduler)
    , registry_(std::move(registry))
    , config_(std::move(config))
{
}

FlowEngine::~FlowEngine()
{
    clear();
    setHardwareManager(nullptr);
}

void FlowEngine::setHardwareManager(HardwareManager* hardware)
{
    if (hardware_ && deviceRemovedSubscription_)
        hardware_->removeDeviceRemovedObserver(deviceRemovedSubscription_);
    deviceRemovedSubscription_ = 0;
    hardware_ = hardware;
    if (!hardware_)
        return;

    deviceRemovedSubscription_ = hardware_->addDeviceRemovedObserver([this](const std::string& deviceId) {
        for (const auto& binding : deviceBindings_)
        {
            if (binding.second != deviceId)
                continue;
            if (Node* node = getNode(binding.first))
            {
                LF_INFO("Device %s removed, unbinding node %s", deviceId.c_str(), binding.first.c_str());
                node->unbindDevice();
            }
        }
    });
}

// ═══════════════════════════════════════════════════════════════════
// Nodes
// ═══════════════════════════════════════════════════════════════════

Node* FlowEngine::createNode(const std::string& id, const std::string& type, std::string& error)
{
    return createNode(id, type, NodeOptions(), error);
}

Node* FlowEngine::createNode(const std::string& id, const std::string& type,
                             const NodeOptions& options, std::string& error)
{
    // 1. Id present and unique
    if (id.empty())
    {
        error = "node id must not be empty";
        LF_WARN("createNode failed: %s", error.c_str());
        return nullptr;
    }
    if (nodeIndex_.count(id))
    {
        error = "node '" + id + "' already exists";
        LF_WARN("createNode failed: %s", error.c_str());
        return nullptr;
    }

    // 2. Registered type
    auto node = registry_.create(type, id);
    if (!node)
    {
        error = "Unknown node type: " + type;
        LF_WARN("createNode failed: %s", error.c_str());
        return nullptr;
    }

    NodeContext context;
    context.scheduler = &scheduler_;
    context.engine = this;
    context.config = &config_;
    node->attach(context);

    if (!options.position.is_null())
        node->setPosition(options.position);
    if (options.state.is_object())
        node->setState(options.state);

    Node* raw = node.get();
    raw->registerUpdateCallback([this, id](const std::string& key, const Value& value) {
        nodeUpdateObservers_.notify(id, key, value);
    });

    nodes_.push_back(std::move(node));
    nodeIndex_[id] = raw;
    ++revision_;

    if (!options.deviceId.empty())
        bindDeviceById(*raw, options.deviceId);

    LF_DEBUG("Created node %s (%s)", id.c_str(), type.c_str());

    if (state_ == FlowState::running)
        raw->start();
    return raw;
}

void FlowEngine::bindDeviceById(Node& node, const std::string& deviceId)
{
    deviceBindings_[node.getId()] = deviceId;
    Device* device = hardware_ ? hardware_->getDevice(deviceId) : nullptr;
    if (!device)
    {
        LF_WARN("Could not bind device '%s' to node %s", deviceId.c_str(), node.getId().c_str());
        return;
    }
    node.bindDevice(device);
}

bool FlowEngine::deleteNode(const std::string& id)
{
    auto indexIt = nodeIndex_.find(id);
    if (indexIt == nodeIndex_.end())
        return false;
    Node* node = indexIt->second;

    for (size_t i = connections_.size(); i-- > 0;)
    {
        const auto& c = connections_[i].connection;
        if (c.fromNode == id || c.toNode == id)
            removeConnectionAt(i);
    }
    for (auto& other : nodes_)
        other->removeLinksTo(node);

    node->stop();
    node->unbindDevice();
    deviceBindings_.erase(id);
    nodeIndex_.erase(indexIt);
    nodes_.erase(std::remove_if(nodes_.begin(), nodes_.end(),
                                [node](const std::unique_ptr<Node>& n) { return n.get() == node; }),
                 nodes_.end());
    ++revision_;
    LF_DEBUG("Deleted node %s", id.c_str());
    return true;
}

Node* FlowEngine::getNode(const std::string& id) const
{
    auto it = nodeIndex_.find(id);
    return it == nodeIndex_.end() ? nullptr : it->second;
}

std::vector<Node*> FlowEngine::getNodes() const
{
    std::vector<Node*> result;
    result.reserve(nodes_.size());
    for (const auto& node : nodes_)
        result.push_back(node.get());
    return result;
}

// ═══════════════════════════════════════════════════════════════════
// Connections
// ═══════════════════════════════════════════════════════════════════

std::string FlowEngine::nextConnectionId()
{
    std::string id;
    do
    {
        id = "conn_" + std::to_string(nextConnectionNumber_++);
    } while (findConnection(id));
    return id;
}

std::string FlowEngine::connect(const std::string& fromNode, int fromPort,
                                const std::string& toNode, int toPort,
                                std::string& error, const std::string& connectionId)
{
    LF_DEBUG("connect: %s:%d -> %s:%d", fromNode.c_str(), fromPort, toNode.c_str(), toPort);

    // 1. Source node exists
    Node* src = getNode(fromNode);
    if (!src)
    {
        error = "source node '" + fromNode + "' not found";
        LF_WARN("connect failed: %s", error.c_str());
        return {};
    }

    // 2. Destination node exists
    Node* dst = getNode(toNode);
    if (!dst)
    {
        error = "destination node '" + toNode + "' not found";
        LF_WARN("connect failed: %s", error.c_str());
        return {};
    }

    // 3. Ports exist
    if (fromPort < 0 || fromPort >= src->outputCount())
    {
        error = "output " + std::to_string(fromPort) + " not found on node '" + fromNode + "'";
        LF_WARN("connect failed: %s", error.c_str());
        return {};
    }
    if (toPort < 0 || toPort >= dst->inputCount())
    {
        error = "input " + std::to_string(toPort) + " not found on node '" + toNode + "'";
        LF_WARN("connect failed: %s", error.c_str());
        return {};
    }

    // 4. Kinds and value types match
    const auto& srcPort = src->getDefinition().outputs[static_cast<size_t>(fromPort)];
    const auto& dstPort = dst->getDefinition().inputs[static_cast<size_t>(toPort)];
    if (!canConnect(srcPort, dstPort))
    {
        error = "incompatible ports: cannot connect '" + srcPort.name + "' (" +
                toString(srcPort.kind) + ", " + srcPort.valueType + ") to '" + dstPort.name +
                "' (" + toString(dstPort.kind) + ", " + dstPort.valueType + ")";
        LF_WARN("connect failed: %s", error.c_str());
        return {};
    }

    // 5. One producer per data input, no duplicate exec edges
    for (const auto& entry : connections_)
    {
        const auto& c = entry.connection;
        if (c.toNode != toNode || c.toPort != toPort)
            continue;
        if (srcPort.kind == PortKind::data)
        {
            error = "input '" + dstPort.name + "' of node '" + toNode + "' is already connected";
            LF_WARN("connect failed: %s", error.c_str());
            return {};
        }
        if (c.fromNode == fromNode && c.fromPort == fromPort)
        {
            error = "connection already exists";
            LF_WARN("connect failed: %s", error.c_str());
            return {};
        }
    }

    // 6. Connection id free
    if (!connectionId.empty() && findConnection(connectionId))
    {
        error = "connection '" + connectionId + "' already exists";
        LF_WARN("connect failed: %s", error.c_str());
        return {};
    }

    ConnectionEntry entry;
    entry.connection.id = connectionId.empty() ? nextConnectionId() : connectionId;
    entry.connection.fromNode = fromNode;
    entry.connection.fromPort = fromPort;
    entry.connection.toNode = toNode;
    entry.connection.toPort = toPort;
    entry.connection.kind = srcPort.kind;
    entry.linkId = srcPort.kind == PortKind::data ? src->addDataLink(fromPort, dst, toPort)
                                                  : src->addExecLink(fromPort, dst, toPort);
    connections_.push_back(entry);
    ++revision_;

    LF_DEBUG("connect: created %s", entry.connection.id.c_str());

    // A producer that already has a value feeds the new consumer right away.
    if (srcPort.kind == PortKind::data && !src->getOutput(fromPort).is_null())
        dst->setInput(toPort, src->getOutput(fromPort));

    return entry.connection.id;
}

std::string FlowEngine::connectPorts(const std::string& fromNode, const std::string& outputName,
                                     const std::string& toNode, const std::string& inputName,
                                     std::string& error)
{
    Node* src = getNode(fromNode);
    Node* dst = getNode(toNode);
    int fromPort = src ? src->findOutput(outputName) : -1;
    int toPort = dst ? dst->findInput(inputName) : -1;
    if (src && fromPort < 0)
    {
        error = "output '" + outputName + "' not found on node '" + fromNode + "'";
        LF_WARN("connect failed: %s", error.c_str());
        return {};
    }
    if (dst && toPort < 0)
    {
        error = "input '" + inputName + "' not found on node '" + toNode + "'";
        LF_WARN("connect failed: %s", error.c_str());
        return {};
    }
    return connect(fromNode, fromPort, toNode, toPort, error);
}

void FlowEngine::removeConnectionAt(size_t index)
{
    const auto& entry = connections_[index];
    if (Node* src = getNode(entry.connection.fromNode))
        src->removeLink(entry.linkId);
    connections_.erase(connections_.begin() + static_cast<std::ptrdiff_t>(index));
    ++revision_;
}

bool FlowEngine::disconnect(const std::string& connectionId)
{
    for (size_t i = 0; i < connections_.size(); ++i)
    {
        if (connections_[i].connection.id == connectionId)
        {
            removeConnectionAt(i);
            LF_DEBUG("disconnect: removed %s", connectionId.c_str());
            return true;
        }
    }
    return false;
}

std::vector<Connection> FlowEngine::getConnections() const
{
    std::vector<Connection> result;
    result.reserve(connections_.size());
    for (const auto& entry : connections_)
        result.push_back(entry.connection);
    return result;
}

const Connection* FlowEngine::findConnection(const std::string& connectionId) const
{
    for (const auto& entry : connections_)
        if (entry.connection.id == connectionId)
            return &entry.connection;
    return nullptr;
}

// ═══════════════════════════════════════════════════════════════════
// Validation
// ═══════════════════════════════════════════════════════════════════

std::vector<ValidationIssue> FlowEngine::validate() const
{
    std::vector<ValidationIssue> issues;
    auto add = [&issues](IssueSeverity severity, std::string message,
                         std::string nodeId, std::string connectionId) {
        issues.push_back({severity, std::move(message), std::move(nodeId), std::move(connectionId)});
    };

    // Dangling endpoints and inputs fed by more than one data edge
    std::map<std::pair<std::string, int>, int> feeds;
    std::vector<const Connection*> live;
    for (const auto& entry : connections_)
    {
        const auto& c = entry.connection;
        Node* src = getNode(c.fromNode);
        Node* dst = getNode(c.toNode);
        if (!src || !dst || c.fromPort >= src->outputCount() || c.toPort >= dst->inputCount())
        {
            add(IssueSeverity::error, "Connection '" + c.id + "' has a missing endpoint",
                src ? c.toNode : c.fromNode, c.id);
            continue;
        }
        live.push_back(&c);
        if (c.kind == PortKind::data && ++feeds[{c.toNode, c.toPort}] == 2)
            add(IssueSeverity::error,
                "Input " + std::to_string(c.toPort) + " of node '" + c.toNode +
                "' has more than one incoming data connection",
                c.toNode, c.id);
    }

    if (nodes_.empty())
        return issues;

    // Reachability from entry points: exec edges forward, data edges both ways
    std::unordered_map<std::string, std::vector<std::string>> neighbours;
    for (const Connection* c : live)
    {
        neighbours[c->fromNode].push_back(c->toNode);
        if (c->kind == PortKind::data)
            neighbours[c->toNode].push_back(c->fromNode);
    }

    std::set<std::string> reached;
    std::deque<std::string> queue;
    for (const auto& node : nodes_)
    {
        if (node->isEntryPoint() && reached.insert(node->getId()).second)
            queue.push_back(node->getId());
    }

    if (queue.empty())
    {
        add(IssueSeverity::warning, "Missing StartExperiment node (no entry point)", {}, {});
    }
    else
    {
        while (!queue.empty())
        {
            std::string current = queue.front();
            queue.pop_front();
            for (const auto& next : neighbours[current])
                if (reached.insert(next).second)
                    queue.push_back(next);
        }
        for (const auto& node : nodes_)
        {
            if (!reached.count(node->getId()))
                add(IssueSeverity::warning,
                    "Node '" + node->getId() + "' is not reachable from any entry point",
                    node->getId(), {});
        }
    }

    // Data cycles: iterative DFS, a back edge closes a cycle
    std::unordered_map<std::string, std::vector<const Connection*>> dataOut;
    for (const Connection* c : live)
        if (c->kind == PortKind::data)
            dataOut[c->fromNode].push_back(c);

    enum class Mark { none, open, done };
    std::unordered_map<std::string, Mark> marks;
    struct Frame {
        std::string node;
        size_t next;
    };
    for (const auto& root : nodes_)
    {
        if (marks[root->getId()] != Mark::none)
            continue;
        std::vector<Frame> stack{{root->getId(), 0}};
        marks[root->getId()] = Mark::open;
        while (!stack.empty())
        {
            Frame& top = stack.back();
            const auto& edges = dataOut[top.node];
            if (top.next < edges.size())
            {
                const Connection* c = edges[top.next++];
                Mark& mark = marks[c->toNode];
                if (mark == Mark::open)
                {
                    add(IssueSeverity::warning,
                        "Data cycle through node '" + c->toNode + "'", c->toNode, c->id);
                }
                else if (mark == Mark::none)
                {
                    mark = Mark::open;
                    stack.push_back({c->toNode, 0});
                }
            }
            else
            {
                marks[top.node] = Mark::done;
                stack.pop_back();
            }
        }
    }

    return issues;
}

// ═══════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════

void FlowEngine::setState(FlowState state)
{
    if (state_ == state)
        return;
    state_ = state;
    LF_INFO("Flow state: %s", toString(state));
    stateObservers_.notify(state);
}

void FlowEngine::start()
{
    if (state_ == FlowState::running)
        return;

    LF_INFO("Starting flow (%d nodes, %d connections)", nodeCount(), connectionCount());
    paused_ = false;
    setState(FlowState::running);

    auto snapshot = getNodes();
    for (Node* node : snapshot)
        node->start();

    for (Node* node : snapshot)
    {
        if (state_ != FlowState::running)
            break;
        if (!nodeIndex_.count(node->getId()) || !node->isEnabled())
            continue;
        try
        {
            node->onFlowStart();
        }
        catch (const std::exception& e)
        {
            LF_WARN("Node %s failed to start the flow: %s", node->getId().c_str(), e.what());
        }
    }
}

void FlowEngine::stop()
{
    if (state_ == FlowState::stopped)
        return;

    LF_INFO("Stopping flow");
    for (Node* node : getNodes())
        node->stop();
    paused_ = false;
    setState(FlowState::stopped);
}

void FlowEngine::pause()
{
    if (state_ != FlowState::running || paused_)
        return;
    paused_ = true;
    for (Node* node : getNodes())
        node->pause();
}

void FlowEngine::resume()
{
    if (state_ != FlowState::running || !paused_)
        return;
    paused_ = false;
    for (Node* node : getNodes())
        node->resume();
}

bool FlowEngine::triggerExec(const std::string& nodeId, int inputIndex)
{
    Node* node = getNode(nodeId);
    if (!node)
    {
        LF_WARN("triggerExec: node '%s' not found", nodeId.c_str());
        return false;
    }
    node->trigger(inputIndex);
    return true;
}

void FlowEngine::notifyFlowComplete(const std::string& nodeId)
{
    LF_INFO("Flow completed at node %s", nodeId.c_str());
    completeObservers_.notify(nodeId);
}

void FlowEngine::clear()
{
    stop();
    // Stopped nodes hold no timers or subscriptions into other nodes.
    for (Node* node : getNodes())
        node->stop();
    connections_.clear();
    nodeIndex_.clear();
    deviceBindings_.clear();
    nodes_.clear();
    ++revision_;
    LF_INFO("Flow cleared");
}

// ═══════════════════════════════════════════════════════════════════
// Observers
// ═══════════════════════════════════════════════════════════════════

uint32_t FlowEngine::addStateObserver(StateCallback callback)
{
    return stateObservers_.add(std::move(callback));
}

bool FlowEngine::removeStateObserver(uint32_t id)
{
    return stateObservers_.remove(id);
}

uint32_t FlowEngine::addFlowCompleteObserver(CompleteCallback callback)
{
    return completeObservers_.add(std::move(callback));
}

bool FlowEngine::removeFlowCompleteObserver(uint32_t id)
{
    return completeObservers_.remove(id);
}

uint32_t FlowEngine::addNodeUpdateObserver(NodeUpdateCallback callback)
{
    return nodeUpdateObservers_.add(std::move(callback));
}

bool FlowEngine::removeNodeUpdateObserver(uint32_t id)
{
    return nodeUpdateObservers_.remove(id);
}

// ═══════════════════════════════════════════════════════════════════
// Layout
// ═══════════════════════════════════════════════════════════════════

nlohmann::json FlowEngine::saveLayout() const
{
    nlohmann::json nodes = nlohmann::json::array();
    for (const auto& node : nodes_)
    {
        nlohmann::json properties;
        properties["state"] = node->getState();
        properties["enabled"] = node->isEnabled();
        properties["visible_in_dashboard"] = node->isVisibleInDashboard();
        auto binding = deviceBindings_.find(node->getId());
        if (binding != deviceBindings_.end())
            properties["device_id"] = binding->second;

        nodes.push_back({
            {"id", node->getId()},
            {"type", node->getTypeName()},
            {"position", node->getPosition()},
            {"properties", properties},
        });
    }

    nlohmann::json connections = nlohmann::json::array();
    for (const auto& entry : connections_)
    {
        const auto& c = entry.connection;
        Node* src = getNode(c.fromNode);
        Node* dst = getNode(c.toNode);
        connections.push_back({
            {"id", c.id},
            {"from_node", c.fromNode},
            {"from_port", src ? Value(src->getDefinition().outputs[static_cast<size_t>(c.fromPort)].name)
                              : Value(c.fromPort)},
            {"to_node", c.toNode},
            {"to_port", dst ? Value(dst->getDefinition().inputs[static_cast<size_t>(c.toPort)].name)
                            : Value(c.toPort)},
            {"kind", toString(c.kind)},
        });
    }

    nlohmann::json layout;
    layout["nodes"] = nodes;
    layout["connections"] = connections;
    layout["hardware"] = hardware_ ? hardware_->toJson()
                                   : nlohmann::json{{"boards", nlohmann::json::array()},
                                                    {"devices", nlohmann::json::array()}};
    return layout;
}

bool FlowEngine::loadLayout(const nlohmann::json& layout, std::string& error)
{
    clear();
    if (!layout.is_object())
    {
        error = "layout must be a JSON object";
        LF_WARN("loadLayout failed: %s", error.c_str());
        return false;
    }

    bool ok = false;
    try
    {
        ok = true;
        if (hardware_ && layout.contains("hardware"))
        {
            hardware_->clear();
            ok = hardware_->loadJson(layout["hardware"], error);
        }
        ok = ok && loadNodes(layout, error) && loadConnections(layout, error);
    }
    catch (const nlohmann::json::exception& e)
    {
        error = std::string("malformed layout: ") + e.what();
        ok = false;
    }

    if (!ok)
    {
        LF_WARN("loadLayout failed: %s", error.c_str());
        clear();
        return false;
    }
    LF_INFO("Loaded layout: %d nodes, %d connections", nodeCount(), connectionCount());
    return true;
}

bool FlowEngine::loadNodes(const nlohmann::json& layout, std::string& error)
{
    for (const auto& entry : layout.value("nodes", nlohmann::json::array()))
    {
        if (!entry.is_object() || !entry.contains("id") || !entry.contains("type"))
        {
            error = "node entry needs 'id' and 'type'";
            return false;
        }

        const nlohmann::json properties = entry.value("properties", nlohmann::json::object());
        NodeOptions options;
        options.position = entry.value("position", nlohmann::json());
        options.state = properties.value("state", nlohmann::json::object());
        options.deviceId = properties.value("device_id", std::string());

        Node* node = createNode(entry["id"].get<std::string>(), entry["type"].get<std::string>(),
                                options, error);
        if (!node)
            return false;
        node->setEnabled(properties.value("enabled", true));
        if (properties.contains("visible_in_dashboard"))
            node->setVisibleInDashboard(properties["visible_in_dashboard"].get<bool>());
    }
    return true;
}

bool FlowEngine::loadConnections(const nlohmann::json& layout, std::string& error)
{
    // Ports are stored by name; plain indices are accepted as well.
    auto resolve = [this](const nlohmann::json& port, const std::string& nodeId, bool output) {
        if (port.is_number_integer())
            return port.get<int>();
        Node* node = getNode(nodeId);
        if (!node || !port.is_string())
            return -1;
        return output ? node->findOutput(port.get<std::string>())
                      : node->findInput(port.get<std::string>());
    };

    for (const auto& entry : layout.value("connections", nlohmann::json::array()))
    {
        if (!entry.is_object() || !entry.contains("from_node") || !entry.contains("to_node") ||
            !entry.contains("from_port") || !entry.contains("to_port"))
        {
            error = "connection entry needs 'from_node', 'from_port', 'to_node' and 'to_port'";
            return false;
        }

        std::string fromNode = entry["from_node"].get<std::string>();
        std::string toNode = entry["to_node"].get<std::string>();
        int fromPort = resolve(entry["from_port"], fromNode, true);
        int toPort = resolve(entry["to_port"], toNode, false);

        if (connect(fromNode, fromPort, toNode, toPort, error, entry.value("id", std::string())).empty())
            return false;

        if (entry.contains("kind"))
        {
            PortKind kind;
            const Connection* made = findConnection(connections_.back().connection.id);
            if (!parsePortKind(entry["kind"].get<std::string>(), kind) || kind != made->kind)
            {
                error = "connection '" + made->id + "' does not match its declared kind";
                return false;
            }
        }
    }
    return true;
}

} // namespace labflow
