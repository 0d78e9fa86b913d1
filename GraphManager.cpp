// GraphManager.cpp
//
// Instantiation, edge resolution and control routing for a running graph.
#include "GraphManager.hpp"
#include "ControlNodes.hpp"
#include "Log.hpp"
#include "PrimitiveNodes.hpp"
#include "SchedulingNodes.hpp"
#include <algorithm>
#include <exception>
#include <fmt/core.h>

namespace SignalFlow {

namespace {
std::string edgeLabel(const Edge& e) {
    return fmt::format("{}.{} -> {}.{}", e.source, e.sourceHandle.empty() ? "*" : e.sourceHandle, e.target,
                       e.targetHandle.empty() ? "*" : e.targetHandle);
}
}

GraphManager::GraphManager(EventBus& bus, AudioEngine& engine, Scheduler& scheduler, TemplateStore& templates)
    : bus(bus), engine(engine), scheduler(scheduler), templates(templates) {}

GraphManager::~GraphManager() { dispose(); }

NodeContext GraphManager::context() { return NodeContext{bus, engine, scheduler, *this}; }

void GraphManager::loadFromJson(const nlohmann::json& json) {
    GraphDocument doc = parseGraphDocument(json);
    load(doc);
}

void GraphManager::load(const GraphDocument& doc) {
    createVirtualNodes(doc.nodes);
    for (const auto& e : doc.edges) addConnection(e);
    logInfo("graph loaded: {} nodes ({} declared edges, {} engine connections)", nodes.size(), declared.size(), tracker.size());
}

void GraphManager::createVirtualNodes(const std::vector<NodeSpec>& specs, const NodeId& parentId) {
    for (const auto& spec : specs) {
        NodeSpec s = spec;
        if (!parentId.empty()) s.id = parentId + "." + spec.id;
        addVirtualNode(s, parentId);
    }
}

std::unique_ptr<VirtualNode> GraphManager::makeNode(NodeKind kind, const NodeSpec& spec) {
    NodeContext ctx = context();
    switch (kind) {
    case NodeKind::Oscillator: return std::make_unique<OscillatorNode>(ctx, spec);
    case NodeKind::Gain: return std::make_unique<GainNode>(ctx, spec);
    case NodeKind::BiquadFilter: return std::make_unique<BiquadFilterNode>(ctx, spec);
    case NodeKind::Delay: return std::make_unique<DelayNode>(ctx, spec);
    case NodeKind::Compressor: return std::make_unique<CompressorNode>(ctx, spec);
    case NodeKind::Distortion: return std::make_unique<DistortionNode>(ctx, spec);
    case NodeKind::Reverb: return std::make_unique<ReverbNode>(ctx, spec);
    case NodeKind::Worklet: return std::make_unique<WorkletNode>(ctx, spec);
    case NodeKind::Noise: return std::make_unique<NoiseNode>(ctx, spec);
    case NodeKind::IirFilter: return std::make_unique<IirFilterNode>(ctx, spec);
    case NodeKind::Equalizer: return std::make_unique<EqualizerNode>(ctx, spec);
    case NodeKind::MasterOut: return std::make_unique<MasterOutNode>(ctx, spec);
    case NodeKind::OnOffGate: return std::make_unique<OnOffGateNode>(ctx, spec);
    case NodeKind::Button: return std::make_unique<ButtonNode>(ctx, spec);
    case NodeKind::MouseTriggerButton: return std::make_unique<ButtonNode>(ctx, spec, NodeKind::MouseTriggerButton);
    case NodeKind::Constant: return std::make_unique<ConstantNode>(ctx, spec);
    case NodeKind::Frequency: return std::make_unique<FrequencyNode>(ctx, spec);
    case NodeKind::Function: return std::make_unique<FunctionNode>(ctx, spec);
    case NodeKind::EventTransform: return std::make_unique<EventTransformNode>(ctx, spec);
    case NodeKind::Log: return std::make_unique<LogNode>(ctx, spec);
    case NodeKind::Switch: return std::make_unique<SwitchNode>(ctx, spec);
    case NodeKind::BlockingSwitch: return std::make_unique<BlockingSwitchNode>(ctx, spec);
    case NodeKind::SpeedDivider: return std::make_unique<SpeedDividerNode>(ctx, spec);
    case NodeKind::Adsr: return std::make_unique<AdsrNode>(ctx, spec);
    case NodeKind::Automation: return std::make_unique<AutomationNode>(ctx, spec);
    case NodeKind::Clock: return std::make_unique<ClockNode>(ctx, spec);
    case NodeKind::Sequencer: return std::make_unique<SequencerNode>(ctx, spec);
    case NodeKind::SequencerFrequency: return std::make_unique<SequencerFrequencyNode>(ctx, spec);
    case NodeKind::InputMarker: return std::make_unique<InputMarkerNode>(ctx, spec);
    case NodeKind::OutputMarker: return std::make_unique<OutputMarkerNode>(ctx, spec);
    case NodeKind::Template: return expandTemplate(spec);
    }
    return nullptr;
}

VirtualNode* GraphManager::addVirtualNode(const NodeSpec& spec, const NodeId& parentId) {
    if (disposed) return nullptr;
    NodeSpec s = spec;
    if (!parentId.empty()) s.parentId = parentId;
    if (s.id.empty()) {
        logWarn("node of type '{}' has no id, skipped", s.type);
        return nullptr;
    }
    if (VirtualNode* existing = findNode(s.id)) {
        logDebug("{}: already registered", s.id);
        return existing;
    }
    auto kind = nodeKindFromType(s.type);
    if (!kind) {
        logWarn("{}: unknown node type '{}'", s.id, s.type);
        return nullptr;
    }
    std::unique_ptr<VirtualNode> node = makeNode(*kind, s);
    if (!node) return nullptr;
    VirtualNode* raw = node.get();
    nodes.emplace(s.id, std::move(node));
    try {
        raw->render();
    } catch (const std::exception& e) {
        logWarn("{}: render failed: {}", s.id, e.what());
    }
    return raw;
}

std::unique_ptr<VirtualNode> GraphManager::expandTemplate(const NodeSpec& spec) {
    std::string name = spec.data.contains("selectedNode") && spec.data["selectedNode"].is_string()
        ? spec.data["selectedNode"].get<std::string>() : std::string();
    if (name.empty()) {
        logWarn("{}: template node without selectedNode", spec.id);
        return nullptr;
    }
    if (std::find(expanding.begin(), expanding.end(), name) != expanding.end()) {
        logWarn("{}: template '{}' includes itself", spec.id, name);
        return nullptr;
    }
    if (static_cast<int>(expanding.size()) >= kMaxTemplateDepth) {
        logWarn("{}: templates nested deeper than {}", spec.id, kMaxTemplateDepth);
        return nullptr;
    }
    std::optional<GraphDocument> doc = templates.load(name);
    if (!doc) {
        logWarn("{}: template '{}' not available", spec.id, name);
        return nullptr;
    }

    expanding.push_back(name);
    TemplateExpansion expansion;
    expansion.templateName = name;
    createVirtualNodes(doc->nodes, spec.id);
    for (const auto& n : doc->nodes) {
        NodeId nsId = spec.id + "." + n.id;
        VirtualNode* v = findNode(nsId);
        if (!v || v->parentId() != spec.id) continue;
        expansion.nodeIds.push_back(nsId);
        if (auto* in = dynamic_cast<InputMarkerNode*>(v)) expansion.inputMarkers.emplace(in->index(), nsId);
        if (auto* out = dynamic_cast<OutputMarkerNode*>(v)) expansion.outputMarkers.emplace(out->index(), nsId);
    }
    for (const auto& e : doc->edges) {
        Edge ns{spec.id + "." + e.source, e.sourceHandle, spec.id + "." + e.target, e.targetHandle};
        expansion.edges.push_back(ns);
        addConnection(ns);
    }
    expanding.pop_back();

    logDebug("{}: expanded template '{}' ({} nodes, {} edges)", spec.id, name, expansion.nodeIds.size(), expansion.edges.size());
    return std::make_unique<TemplateInstanceNode>(context(), spec, std::move(expansion));
}

void GraphManager::deleteVirtualNode(const NodeId& id) {
    VirtualNode* node = findNode(id);
    if (!node) {
        logWarn("delete: no node '{}'", id);
        return;
    }
    if (auto* instance = dynamic_cast<TemplateInstanceNode*>(node)) {
        std::vector<NodeId> inner = instance->expansion().nodeIds;
        for (auto it = inner.rbegin(); it != inner.rend(); ++it) {
            if (findNode(*it)) deleteVirtualNode(*it);
        }
    }

    std::vector<Edge> touching;
    for (const auto& e : declared) {
        if (e.source == id || e.target == id) touching.push_back(e);
    }
    for (const auto& e : touching) {
        for (const auto& r : resolveEdge(e)) {
            try {
                disconnectResolved(r);
            } catch (const std::exception& ex) {
                logWarn("{}: disconnecting {} failed: {}", id, edgeLabel(r), ex.what());
            }
        }
    }
    try {
        node->dispose();
    } catch (const std::exception& e) {
        logWarn("{}: dispose failed: {}", id, e.what());
    }
    tracker.removeNode(id);
    index.eraseNode(id);
    forgetDeclared(id);
    bus.unsubscribeAllByNodeId(id);
    nodes.erase(id);
    logDebug("{}: deleted", id);
}

void GraphManager::forgetDeclared(const NodeId& id) {
    declared.erase(std::remove_if(declared.begin(), declared.end(),
                                  [&id](const Edge& e) { return e.source == id || e.target == id; }),
                   declared.end());
}

void GraphManager::addConnection(const Edge& edge) {
    if (disposed) return;
    if (std::find(declared.begin(), declared.end(), edge) == declared.end()) declared.push_back(edge);
    resolveAndWire(edge);
}

void GraphManager::resolveAndWire(const Edge& edge) {
    std::vector<Edge> resolved = resolveEdge(edge);
    bool remapped = !(resolved.size() == 1 && resolved.front() == edge);
    // A remapped edge routes from its resolved source; the declared entry is stale
    if (remapped) index.erase(edge);
    if (resolved.empty()) {
        logDebug("{} resolves to no connections", edgeLabel(edge));
        return;
    }
    for (const auto& r : resolved) connectResolved(r);
}

void GraphManager::resolveSources(const NodeId& source, const std::string& handle, int depth,
                                  std::vector<std::pair<NodeId, std::string>>& out) const {
    if (depth >= kMaxTemplateDepth) {
        logWarn("{}.{}: output remap nested too deep", source, handle);
        return;
    }
    auto* instance = findNodeAs<TemplateInstanceNode>(source);
    auto n = handleIndex(handle, "output-");
    if (instance && n) {
        if (auto marker = instance->findOutputMarker(*n)) {
            bool fed = false;
            for (const auto& e : declared) {
                if (e.target != *marker) continue;
                resolveSources(e.source, e.sourceHandle, depth + 1, out);
                fed = true;
            }
            if (fed) return;
        }
    }
    std::pair<NodeId, std::string> self{source, handle};
    if (std::find(out.begin(), out.end(), self) == out.end()) out.push_back(self);
    // An Input marker stays a source for triggers sent to its instance, and
    // also stands for whatever feeds the instance's matching input
    auto* input = findNodeAs<InputMarkerNode>(source);
    if (!input || input->parentId().empty()) return;
    for (const auto& e : declared) {
        if (e.target == input->parentId() && handleIndex(e.targetHandle, "input-") == input->index()) {
            resolveSources(e.source, e.sourceHandle, depth + 1, out);
        }
    }
}

void GraphManager::resolveTargets(const NodeId& target, const std::string& handle, int depth,
                                  std::vector<std::pair<NodeId, std::string>>& out) const {
    if (depth >= kMaxTemplateDepth) {
        logWarn("{}.{}: input remap nested too deep", target, handle);
        return;
    }
    // An Output marker fed from inside stands for whatever its instance's output feeds
    auto* output = findNodeAs<OutputMarkerNode>(target);
    if (output && !output->parentId().empty()) {
        std::string outHandle = fmt::format("output-{}", output->index());
        bool consumed = false;
        for (const auto& e : declared) {
            if (e.source != output->parentId() || e.sourceHandle != outHandle) continue;
            resolveTargets(e.target, e.targetHandle, depth + 1, out);
            consumed = true;
        }
        if (consumed) return;
    }
    auto* instance = findNodeAs<TemplateInstanceNode>(target);
    auto n = handleIndex(handle, "input-");
    if (!instance || !n) {
        std::pair<NodeId, std::string> self{target, handle};
        if (std::find(out.begin(), out.end(), self) == out.end()) out.push_back(self);
        return;
    }
    auto marker = instance->findInputMarker(*n);
    if (!marker) {
        logWarn("{}: template '{}' has no input {}", target, instance->templateName(), *n);
        return;
    }
    for (const auto& e : declared) {
        if (e.source == *marker) resolveTargets(e.target, e.targetHandle, depth + 1, out);
    }
}

std::vector<Edge> GraphManager::resolveEdge(const Edge& edge) const {
    std::vector<std::pair<NodeId, std::string>> sources;
    resolveSources(edge.source, edge.sourceHandle, 0, sources);
    std::vector<std::pair<NodeId, std::string>> targets;
    resolveTargets(edge.target, edge.targetHandle, 0, targets);
    std::vector<Edge> out;
    for (const auto& s : sources) {
        for (const auto& t : targets) {
            Edge r{s.first, s.second, t.first, t.second};
            if (std::find(out.begin(), out.end(), r) == out.end()) out.push_back(r);
        }
    }
    return out;
}

GraphManager::Wiring GraphManager::classify(const VirtualNode& source, const VirtualNode& target, const std::string& handle) const {
    Wiring w;
    w.from = source.outputPort();
    if (w.from == kNoPrimitive) return w;
    if (auto named = target.namedInputIndex(handle)) {
        w.to = target.inputPort();
        if (w.to == kNoPrimitive) return w;
        w.kind = WiringKind::NamedInput;
        w.key = ConnectionTracker::targetKey(target.id(), handle);
        w.inputIndex = *named;
        return w;
    }
    if ((handle.empty() || handle == "main-input" || handle == "input") && target.inputPort() != kNoPrimitive) {
        w.kind = WiringKind::MainInput;
        w.to = target.inputPort();
        w.key = ConnectionTracker::targetKey(target.id());
        return w;
    }
    if (handle == "destination-input" || target.kind() == NodeKind::MasterOut) {
        w.kind = WiringKind::Sink;
        w.to = engine.destination();
        w.key = ConnectionTracker::targetKey(target.id());
        return w;
    }
    if (auto param = target.automatableParam(handle)) {
        w.kind = WiringKind::Param;
        w.to = target.primitiveHandle();
        w.key = ConnectionTracker::targetKey(target.id(), handle);
        w.param = *param;
    }
    return w;
}

void GraphManager::armEnvelopeTarget(const VirtualNode& source, const VirtualNode& target, const std::string& handle) {
    if (source.kind() != NodeKind::Adsr || !target.hasPrimitive()) return;
    auto param = target.automatableParam(handle);
    if (!param) return;
    double resting = target.declaredBase(*param) * source.dataNumber("minPercent", 0.0) / 100.0;
    try {
        engine.setParamValue(target.primitiveHandle(), *param, resting);
    } catch (const std::exception& e) {
        logWarn("{}: arming {}.{} failed: {}", source.id(), target.id(), *param, e.what());
    }
}

void GraphManager::connectResolved(const Edge& edge) {
    VirtualNode* src = findNode(edge.source);
    VirtualNode* tgt = findNode(edge.target);
    if (!src || !tgt) {
        logWarn("{}: missing {} node", edgeLabel(edge), src ? "target" : "source");
        return;
    }
    index.insert(edge);
    armEnvelopeTarget(*src, *tgt, edge.targetHandle);

    Wiring w = classify(*src, *tgt, edge.targetHandle);
    if (w.kind == WiringKind::None) return;
    if (tracker.contains(edge.source, w.key)) {
        ++stats.deduplicated;
        return;
    }
    try {
        if (w.kind == WiringKind::Param) engine.connectParam(w.from, w.to, w.param);
        else engine.connect(w.from, w.to, w.inputIndex);
    } catch (const std::exception& e) {
        ++stats.wiringFailures;
        logWarn("{}: connect failed: {}", edgeLabel(edge), e.what());
        return;
    }
    tracker.add(edge.source, w.key);
    ++stats.connectionsMade;
}

void GraphManager::disconnectResolved(const Edge& edge) {
    index.erase(edge);
    VirtualNode* src = findNode(edge.source);
    VirtualNode* tgt = findNode(edge.target);
    if (!src || !tgt) return;
    Wiring w = classify(*src, *tgt, edge.targetHandle);
    if (w.kind == WiringKind::None || !tracker.contains(edge.source, w.key)) return;
    tracker.remove(edge.source, w.key);
    if (w.kind == WiringKind::Param) engine.disconnectParam(w.from, w.to, w.param);
    else engine.disconnect(w.from, w.to);
}

void GraphManager::deleteEdge(const Edge& edge) {
    for (const auto& r : resolveEdge(edge)) {
        try {
            disconnectResolved(r);
        } catch (const std::exception& e) {
            logWarn("{}: disconnect failed: {}", edgeLabel(r), e.what());
        }
    }
    index.erase(edge);
    declared.erase(std::remove(declared.begin(), declared.end(), edge), declared.end());
}

void GraphManager::updateEdges() {
    index.clear();
    std::vector<Edge> all = declared;
    for (const auto& e : all) resolveAndWire(e);
}

void GraphManager::resetConnectionsOfNode(const NodeId& nodeId) {
    // The node's previous primitive is gone, and with it every engine connection it had
    size_t dropped = tracker.removeNode(nodeId);
    logDebug("{}: re-resolving connections ({} dropped)", nodeId, dropped);
    std::vector<Edge> all = declared;
    for (const auto& e : all) resolveAndWire(e);
}

void GraphManager::updateParams(const NodeId& id, const nlohmann::json& data) {
    Payload p = makePayload(Value{});
    p.nodeId = id;
    p.data = data;
    bus.emit(Topic::params(id), p);
}

void GraphManager::trigger(const NodeId& id, EventKind kind) {
    Payload p = makePayload(Value{});
    p.nodeId = id;
    bus.emit(Topic{id, "main-input", kind}, p);
}

const std::vector<Edge>& GraphManager::fanOut(const NodeId& source) {
    const auto& edges = index.edgesFrom(source);
    if (!edges.empty()) return edges;
    // An instance's outputs are wired when declared and route from their resolved sources
    if (findNodeAs<TemplateInstanceNode>(source)) return edges;
    // Declared edges are resolved lazily for sources that have not been wired yet
    std::vector<Edge> pending;
    for (const auto& e : declared) {
        if (e.source == source) pending.push_back(e);
    }
    for (const auto& e : pending) {
        ++stats.lazyResolves;
        resolveAndWire(e);
    }
    return index.edgesFrom(source);
}

void GraphManager::route(const Edge& edge, const Payload& payload, EventKind kind) {
    VirtualNode* target = findNode(edge.target);
    if (!target) {
        logDebug("{}: target is gone", edgeLabel(edge));
        return;
    }
    ++stats.eventsRouted;
    if (target->hasPrimitive()) {
        if (auto param = target->automatableParam(edge.targetHandle)) {
            auto number = toNumber(payload.value);
            if (kind == EventKind::ReceiveNodeOff || !number) return;
            nlohmann::json data = nlohmann::json::object();
            data[*param] = *number;
            ++stats.paramUpdates;
            updateParams(target->id(), data);
            return;
        }
    }
    Payload out = payload;
    out.nodeId = edge.target;
    bus.emit(Topic{edge.target, edge.targetHandle.empty() ? std::string("main-input") : edge.targetHandle, kind}, out);
}

void GraphManager::emitEventsForConnectedEdges(const NodeId& source, const Payload& payload, EventKind kind) {
    std::vector<Edge> edges = fanOut(source);
    if (edges.empty()) {
        logDebug("{}: no fan-out edges for {}", source, eventKindName(kind));
        return;
    }
    for (const auto& e : edges) {
        if (!payload.sourceHandle.empty() && !e.sourceHandle.empty() && e.sourceHandle != payload.sourceHandle) continue;
        route(e, payload, kind);
    }
}

void GraphManager::emitEventsForHandle(const NodeId& source, const std::string& sourceHandle, const Payload& payload, EventKind kind) {
    std::vector<Edge> edges = fanOut(source);
    for (const auto& e : edges) {
        if (e.sourceHandle == sourceHandle) route(e, payload, kind);
    }
}

void GraphManager::emitEventsFromOutput(const NodeId& source, int outputIndex, const Payload& payload, EventKind kind) {
    emitEventsForHandle(source, fmt::format("output-{}", outputIndex), payload, kind);
}

void GraphManager::handleSendNodeEventSwitch(const NodeId& source, const Payload& payload, EventKind kind) {
    if (!payload.activeOutput) {
        logDebug("{}: switch event without an active output", source);
        return;
    }
    emitEventsFromOutput(source, *payload.activeOutput, payload, kind);
}

void GraphManager::handleConnectedEdges(const NodeId& source, const Payload& payload, EventKind kind, std::optional<int> outputIndex) {
    if (outputIndex) emitEventsFromOutput(source, *outputIndex, payload, kind);
    else emitEventsForConnectedEdges(source, payload, kind);
}

void GraphManager::forEachParamTarget(const NodeId& source, const std::function<void(const ParamTarget&)>& visit) {
    std::vector<Edge> edges = fanOut(source);
    for (const auto& e : edges) {
        VirtualNode* target = findNode(e.target);
        if (!target || !target->hasPrimitive()) continue;
        auto param = target->automatableParam(e.targetHandle);
        if (!param) continue;
        visit(ParamTarget{e.target, e.targetHandle, target->primitiveHandle(), *param, target->declaredBase(*param)});
    }
}

VirtualNode* GraphManager::findNode(const NodeId& id) const {
    auto it = nodes.find(id);
    return it == nodes.end() ? nullptr : it->second.get();
}

std::vector<NodeDesc> GraphManager::getNodeDescs() const {
    std::vector<NodeDesc> out;
    out.reserve(nodes.size());
    for (const auto& kv : nodes) {
        const VirtualNode& n = *kv.second;
        out.push_back(NodeDesc{n.id(), n.type(), n.parentId(), n.hasPrimitive(), index.edgesFrom(n.id())});
    }
    return out;
}

nlohmann::json GraphManager::describe() const {
    nlohmann::json j;
    j["nodes"] = nlohmann::json::array();
    for (const auto& d : getNodeDescs()) {
        nlohmann::json n;
        n["id"] = d.id;
        n["type"] = d.type;
        if (!d.parentId.empty()) n["parentId"] = d.parentId;
        n["hasPrimitive"] = d.hasPrimitive;
        n["fanOut"] = d.fanOut;
        j["nodes"].push_back(n);
    }
    j["edges"] = declared;
    j["connections"] = nlohmann::json::array();
    for (const auto& kv : nodes) {
        for (const auto& key : tracker.targetsOf(kv.first)) {
            j["connections"].push_back({{"source", kv.first}, {"target", key}});
        }
    }
    return j;
}

void GraphManager::dispose() {
    if (disposed) return;
    disposed = true;
    for (auto& kv : nodes) {
        try {
            kv.second->dispose();
        } catch (const std::exception& e) {
            logWarn("{}: dispose failed: {}", kv.first, e.what());
        }
    }
    nodes.clear();
    tracker.clear();
    index.clear();
    declared.clear();
}

} // namespace SignalFlow
