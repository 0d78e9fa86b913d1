// GraphManager.hpp
//
// Owns every node instance of a running graph and the wiring between them.
// Declared edges are resolved across template boundaries (output-N sources
// are replaced by what feeds the template's Output marker, input-N targets fan
// out to what the Input marker feeds), wired onto the audio engine at most
// once per (source, target key), and indexed by resolved source for control
// routing. Node instances reach back into the manager only through the
// EdgeRouter interface.
#pragma once
#include "ConnectionTracker.hpp"
#include "SubgraphNodes.hpp"
#include "TemplateStore.hpp"
#include "VirtualNode.hpp"
#include <map>
#include <memory>
#include <vector>

namespace SignalFlow {

// Introspection record, one per node instance
struct NodeDesc {
    NodeId id;
    std::string type;
    NodeId parentId;
    bool hasPrimitive;
    std::vector<Edge> fanOut; // resolved outgoing edges
};

class GraphManager : public EdgeRouter {
public:
    // Nested templates deeper than this are rejected
    static constexpr int kMaxTemplateDepth = 16;

    GraphManager(EventBus& bus, AudioEngine& engine, Scheduler& scheduler, TemplateStore& templates);
    ~GraphManager() override;
    GraphManager(const GraphManager&) = delete;
    GraphManager& operator=(const GraphManager&) = delete;

    // Create nodes then wire edges. Throws nlohmann::json::exception on a malformed document.
    void loadFromJson(const nlohmann::json& json);
    void load(const GraphDocument& doc);

    // Namespaces ids as "<parentId>.<id>" when parentId is set
    void createVirtualNodes(const std::vector<NodeSpec>& specs, const NodeId& parentId = {});
    // Returns the registered instance, or nullptr on a topology error
    VirtualNode* addVirtualNode(const NodeSpec& spec, const NodeId& parentId = {});
    void deleteVirtualNode(const NodeId& id);

    void addConnection(const Edge& edge);
    void deleteEdge(const Edge& edge);
    // Clear the edge index and re-resolve every declared edge
    void updateEdges();
    // Resolved form of a declared edge (remapped across template boundaries)
    std::vector<Edge> resolveEdge(const Edge& declared) const;

    // Send a parameter update to a node through the bus
    void updateParams(const NodeId& id, const nlohmann::json& data);
    // Emit "<id>.main-input.<kind>" as an external trigger would
    void trigger(const NodeId& id, EventKind kind = EventKind::ReceiveNodeOn);

    void dispose();
    bool isDisposed() const { return disposed; }

    // EdgeRouter
    void emitEventsForConnectedEdges(const NodeId& source, const Payload& payload, EventKind kind) override;
    void emitEventsFromOutput(const NodeId& source, int index, const Payload& payload, EventKind kind) override;
    void emitEventsForHandle(const NodeId& source, const std::string& sourceHandle, const Payload& payload, EventKind kind) override;
    void handleSendNodeEventSwitch(const NodeId& source, const Payload& payload, EventKind kind) override;
    void handleConnectedEdges(const NodeId& source, const Payload& payload, EventKind kind, std::optional<int> index) override;
    void forEachParamTarget(const NodeId& source, const std::function<void(const ParamTarget&)>& visit) override;
    void resetConnectionsOfNode(const NodeId& nodeId) override;

    VirtualNode* findNode(const NodeId& id) const;
    template <typename T>
    T* findNodeAs(const NodeId& id) const { return dynamic_cast<T*>(findNode(id)); }
    size_t nodeCount() const { return nodes.size(); }
    const ConnectionTracker& connections() const { return tracker; }
    const EdgeIndex& edgeIndex() const { return index; }
    const std::vector<Edge>& edges() const { return declared; }
    std::vector<NodeDesc> getNodeDescs() const;
    nlohmann::json describe() const;

    struct RouterStats {
        unsigned long long eventsRouted = 0;
        unsigned long long paramUpdates = 0;
        unsigned long long connectionsMade = 0;
        unsigned long long deduplicated = 0;
        unsigned long long wiringFailures = 0;
        unsigned long long lazyResolves = 0; // declared edges resolved on first emission
    };
    RouterStats getAndResetStats() {
        RouterStats out = stats;
        stats = RouterStats{};
        return out;
    }

private:
    enum class WiringKind { None, NamedInput, MainInput, Sink, Param };
    struct Wiring {
        WiringKind kind = WiringKind::None;
        TargetKey key;
        PrimitiveHandle from = kNoPrimitive;
        PrimitiveHandle to = kNoPrimitive;
        int inputIndex = 0;
        std::string param;
    };

    std::unique_ptr<VirtualNode> makeNode(NodeKind kind, const NodeSpec& spec);
    std::unique_ptr<VirtualNode> expandTemplate(const NodeSpec& spec);
    void resolveAndWire(const Edge& edge);
    void connectResolved(const Edge& edge);
    Wiring classify(const VirtualNode& source, const VirtualNode& target, const std::string& handle) const;
    void armEnvelopeTarget(const VirtualNode& source, const VirtualNode& target, const std::string& handle);
    void disconnectResolved(const Edge& edge);
    void forgetDeclared(const NodeId& id);

    void resolveSources(const NodeId& source, const std::string& handle, int depth,
                        std::vector<std::pair<NodeId, std::string>>& out) const;
    void resolveTargets(const NodeId& target, const std::string& handle, int depth,
                        std::vector<std::pair<NodeId, std::string>>& out) const;

    const std::vector<Edge>& fanOut(const NodeId& source);
    void route(const Edge& edge, const Payload& payload, EventKind kind);

    NodeContext context();

    EventBus& bus;
    AudioEngine& engine;
    Scheduler& scheduler;
    TemplateStore& templates;

    std::map<NodeId, std::unique_ptr<VirtualNode>> nodes;
    std::vector<Edge> declared;
    ConnectionTracker tracker;
    EdgeIndex index;
    std::vector<std::string> expanding; // template names currently being expanded
    RouterStats stats;
    bool disposed = false;
};

} // namespace SignalFlow
