// GraphTypes.cpp
#include "GraphTypes.hpp"
#include <cmath>
#include <cstdlib>
#include <fmt/core.h>
#include <functional>
#include <unordered_map>

namespace SignalFlow {

std::optional<double> toNumber(const Value& v) {
    if (std::holds_alternative<double>(v)) return std::get<double>(v);
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v) ? 1.0 : 0.0;
    if (std::holds_alternative<std::string>(v)) {
        const auto& s = std::get<std::string>(v);
        if (s.empty()) return std::nullopt;
        char* end = nullptr;
        double d = std::strtod(s.c_str(), &end);
        if (end && *end == '\0' && std::isfinite(d)) return d;
    }
    return std::nullopt;
}

std::string toString(const Value& v) {
    if (std::holds_alternative<double>(v)) return fmt::format("{}", std::get<double>(v));
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v) ? "true" : "false";
    if (std::holds_alternative<std::string>(v)) return std::get<std::string>(v);
    return {};
}

bool hasValue(const Value& v) { return !std::holds_alternative<std::monostate>(v); }

Value valueFromJson(const nlohmann::json& j) {
    if (j.is_number()) return j.get<double>();
    if (j.is_boolean()) return j.get<bool>();
    if (j.is_string()) return j.get<std::string>();
    return std::monostate{};
}

nlohmann::json valueToJson(const Value& v) {
    if (std::holds_alternative<double>(v)) return std::get<double>(v);
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v);
    if (std::holds_alternative<std::string>(v)) return std::get<std::string>(v);
    return nullptr;
}

void from_json(const nlohmann::json& j, NodeSpec& n) {
    n.id = j.at("id").get<std::string>();
    n.type = j.at("type").get<std::string>();
    n.data = j.contains("data") && j["data"].is_object() ? j["data"] : nlohmann::json::object();
    n.parentId = j.contains("parentId") && j["parentId"].is_string() ? j["parentId"].get<std::string>() : std::string();
}

void to_json(nlohmann::json& j, const NodeSpec& n) {
    j = nlohmann::json{{"id", n.id}, {"type", n.type}, {"data", n.data}};
    if (!n.parentId.empty()) j["parentId"] = n.parentId;
}

void from_json(const nlohmann::json& j, Edge& e) {
    e.source = j.at("source").get<std::string>();
    e.target = j.at("target").get<std::string>();
    // React-Flow style documents may carry null handles
    auto handle = [&](const char* key) {
        return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : std::string();
    };
    e.sourceHandle = handle("sourceHandle");
    e.targetHandle = handle("targetHandle");
}

void to_json(nlohmann::json& j, const Edge& e) {
    j = nlohmann::json{{"source", e.source}, {"sourceHandle", e.sourceHandle}, {"target", e.target}, {"targetHandle", e.targetHandle}};
}

GraphDocument parseGraphDocument(const nlohmann::json& j) {
    GraphDocument doc;
    if (j.contains("nodes")) doc.nodes = j.at("nodes").get<std::vector<NodeSpec>>();
    if (j.contains("edges")) doc.edges = j.at("edges").get<std::vector<Edge>>();
    return doc;
}

namespace {
const std::unordered_map<std::string, NodeKind>& kindTable() {
    static const std::unordered_map<std::string, NodeKind> table = {
        {"OscillatorFlowNode", NodeKind::Oscillator},
        {"GainFlowNode", NodeKind::Gain},
        {"BiquadFilterFlowNode", NodeKind::BiquadFilter},
        {"DelayFlowNode", NodeKind::Delay},
        {"DynamicCompressorFlowNode", NodeKind::Compressor},
        {"DistortionFlowNode", NodeKind::Distortion},
        {"ReverbFlowNode", NodeKind::Reverb},
        {"AudioWorkletFlowNode", NodeKind::Worklet},
        {"NoiseFlowNode", NodeKind::Noise},
        {"IIRFilterFlowNode", NodeKind::IirFilter},
        {"EqualizerFlowNode", NodeKind::Equalizer},
        {"MasterOutFlowNode", NodeKind::MasterOut},
        {"OnOffButtonFlowNode", NodeKind::OnOffGate},
        {"ButtonFlowNode", NodeKind::Button},
        {"MouseTriggerButton", NodeKind::MouseTriggerButton},
        {"ConstantFlowNode", NodeKind::Constant},
        {"FrequencyFlowNode", NodeKind::Frequency},
        {"FunctionFlowNode", NodeKind::Function},
        {"EventFlowNode", NodeKind::EventTransform},
        {"LogFlowNode", NodeKind::Log},
        {"SwitchFlowNode", NodeKind::Switch},
        {"BlockingSwitchFlowNode", NodeKind::BlockingSwitch},
        {"SpeedDividerFlowNode", NodeKind::SpeedDivider},
        {"ADSRFlowNode", NodeKind::Adsr},
        {"AutomationFlowNode", NodeKind::Automation},
        {"ClockFlowNode", NodeKind::Clock},
        {"SequencerFlowNode", NodeKind::Sequencer},
        {"SequencerFrequencyFlowNode", NodeKind::SequencerFrequency},
        {"FlowNode", NodeKind::Template},
        {"InputNode", NodeKind::InputMarker},
        {"OutputNode", NodeKind::OutputMarker},
    };
    return table;
}
}

std::optional<NodeKind> nodeKindFromType(const std::string& type) {
    const auto& table = kindTable();
    auto it = table.find(type);
    if (it == table.end()) return std::nullopt;
    return it->second;
}

const char* nodeKindName(NodeKind kind) {
    for (const auto& kv : kindTable()) {
        if (kv.second == kind) return kv.first.c_str();
    }
    return "Unknown";
}

const char* eventKindName(EventKind kind) {
    switch (kind) {
        case EventKind::ReceiveNodeOn: return "receiveNodeOn";
        case EventKind::ReceiveNodeOff: return "receiveNodeOff";
        case EventKind::SendNodeOn: return "sendNodeOn";
        case EventKind::SendNodeOff: return "sendNodeOff";
        case EventKind::UpdateParams: return "updateParams";
    }
    return "";
}

std::optional<EventKind> eventKindFromName(const std::string& name) {
    if (name == "receiveNodeOn") return EventKind::ReceiveNodeOn;
    if (name == "receiveNodeOff") return EventKind::ReceiveNodeOff;
    if (name == "sendNodeOn") return EventKind::SendNodeOn;
    if (name == "sendNodeOff") return EventKind::SendNodeOff;
    if (name == "updateParams") return EventKind::UpdateParams;
    return std::nullopt;
}

std::string Topic::str() const {
    return nodeId + "." + handle + "." + eventKindName(kind);
}

std::optional<Topic> Topic::parse(const std::string& text) {
    auto lastDot = text.rfind('.');
    if (lastDot == std::string::npos || lastDot == 0) return std::nullopt;
    auto kind = eventKindFromName(text.substr(lastDot + 1));
    if (!kind) return std::nullopt;
    auto handleDot = text.rfind('.', lastDot - 1);
    if (handleDot == std::string::npos || handleDot == 0) return std::nullopt;
    Topic t;
    t.nodeId = text.substr(0, handleDot);
    t.handle = text.substr(handleDot + 1, lastDot - handleDot - 1);
    t.kind = *kind;
    if (t.handle.empty()) return std::nullopt;
    return t;
}

std::size_t TopicHash::operator()(const Topic& t) const {
    std::size_t h = std::hash<std::string>{}(t.nodeId);
    h ^= std::hash<std::string>{}(t.handle) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    h ^= static_cast<std::size_t>(t.kind) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    return h;
}

Payload makePayload(Value value, const NodeId& source) {
    Payload p;
    p.value = std::move(value);
    p.source = source;
    return p;
}

std::optional<int> handleIndex(const std::string& handle, const std::string& prefix) {
    if (handle.size() <= prefix.size() || handle.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    int idx = 0;
    for (size_t i = prefix.size(); i < handle.size(); ++i) {
        char c = handle[i];
        if (c < '0' || c > '9') return std::nullopt;
        idx = idx * 10 + (c - '0');
        if (idx > 1000000) return std::nullopt;
    }
    return idx;
}

} // namespace SignalFlow
