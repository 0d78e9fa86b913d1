// VirtualNode.hpp
//
// Runtime instance of a declared node. Every kind implements the same small
// capability surface (parameter updates, audio ports, disposal); behavior that
// needs the rest of the graph is reached through the EdgeRouter handed in via
// NodeContext, never through the graph manager directly.
#pragma once
#include "AudioEngine.hpp"
#include "EventBus.hpp"
#include "GraphTypes.hpp"
#include "Scheduler.hpp"
#include <functional>
#include <optional>
#include <unordered_set>
#include <utility>
#include <vector>

namespace SignalFlow {

// A parameter reached by one of a node's outgoing edges
struct ParamTarget {
    NodeId nodeId;
    std::string handle;     // edge target handle
    PrimitiveHandle owner;  // primitive that owns the parameter
    std::string param;      // engine parameter name
    double base;            // declared (not live) value of the parameter
};

// Control-plane routing services provided by the graph manager
class EdgeRouter {
public:
    virtual ~EdgeRouter() = default;

    // Plain fan-out over every outgoing edge (filtered by payload.sourceHandle when set)
    virtual void emitEventsForConnectedEdges(const NodeId& source, const Payload& payload, EventKind kind) = 0;
    // Only edges leaving "output-<index>"
    virtual void emitEventsFromOutput(const NodeId& source, int index, const Payload& payload, EventKind kind) = 0;
    // Only edges leaving the named source handle
    virtual void emitEventsForHandle(const NodeId& source, const std::string& sourceHandle, const Payload& payload, EventKind kind) = 0;
    // Only edges leaving "output-<payload.activeOutput>"
    virtual void handleSendNodeEventSwitch(const NodeId& source, const Payload& payload, EventKind kind) = 0;
    virtual void handleConnectedEdges(const NodeId& source, const Payload& payload, EventKind kind, std::optional<int> index) = 0;
    // Visits resolved parameter targets of source in edge order (reset handles first)
    virtual void forEachParamTarget(const NodeId& source, const std::function<void(const ParamTarget&)>& visit) = 0;
    // Re-resolve every connection touching nodeId (its primitive was replaced)
    virtual void resetConnectionsOfNode(const NodeId& nodeId) = 0;
};

class GraphManager;

struct NodeContext {
    EventBus& bus;
    AudioEngine& engine;
    Scheduler& scheduler;
    EdgeRouter& router;
};

class VirtualNode {
public:
    VirtualNode(NodeContext context, NodeSpec spec, NodeKind kind);
    virtual ~VirtualNode();
    VirtualNode(const VirtualNode&) = delete;
    VirtualNode& operator=(const VirtualNode&) = delete;

    // Create primitives and subscribe to topics. Called once after registration.
    virtual void render();

    const NodeId& id() const { return spec.id; }
    const std::string& type() const { return spec.type; }
    const NodeId& parentId() const { return spec.parentId; }
    NodeKind kind() const { return nodeKind; }
    const nlohmann::json& data() const { return spec.data; }
    double dataNumber(const std::string& key, double fallback) const;
    bool dataBool(const std::string& key, bool fallback) const;
    std::string dataString(const std::string& key, const std::string& fallback) const;

    // Merge an attribute bag into the data mirror and apply it
    virtual void applyParameterUpdate(const nlohmann::json& update);

    virtual PrimitiveHandle outputPort() const { return primitive; }
    virtual PrimitiveHandle inputPort() const { return primitive; }
    bool hasPrimitive() const { return primitive != kNoPrimitive; }
    // Owner of the node's automatable parameters
    PrimitiveHandle primitiveHandle() const { return primitive; }
    // Input index for a named multi-input handle
    virtual std::optional<int> namedInputIndex(const std::string& handle) const;
    // Engine parameter name when handle is a real automatable parameter
    virtual std::optional<std::string> automatableParam(const std::string& handle) const;
    // Declared value of a parameter, used as an envelope base
    virtual double declaredBase(const std::string& param) const;

    bool isDisposed() const { return disposed; }
    size_t pendingTimers() const { return timers.size(); }

protected:
    // Teardown goes through GraphManager so its wiring records go with the node
    friend class GraphManager;

    // Idempotent teardown: timers, subscriptions, primitive
    void dispose();
    virtual void onDispose() {}

    SubscriptionId subscribe(const std::string& handle, EventKind kind, EventHandler handler);
    // Any topic, including other nodes' (released with the node)
    SubscriptionId subscribeTopic(const Topic& topic, EventHandler handler);
    TimerId scheduleTimer(double delayMs, std::function<void()> callback, TimerPrecision precision = TimerPrecision::Coarse);
    void cancelTimer(TimerId& id);
    void cancelAllTimers();
    Payload makeOwnPayload(Value value) const;
    void emitOwn(const std::string& handle, EventKind kind, const Payload& payload);

    NodeContext ctx;
    NodeSpec spec;
    NodeKind nodeKind;
    PrimitiveHandle primitive = kNoPrimitive;

private:
    std::vector<std::pair<Topic, SubscriptionId>> subscriptions;
    std::unordered_set<TimerId> timers;
    bool disposed = false;
};

} // namespace SignalFlow
