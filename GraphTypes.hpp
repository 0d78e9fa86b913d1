// GraphTypes.hpp
//
// Shared vocabulary of the graph runtime: declarative nodes and edges as they
// arrive from JSON, the closed set of node kinds, control-event payloads and
// structured topics. Everything here is plain data; behavior lives in the
// event bus, the node instances and the graph manager.
#pragma once
#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace SignalFlow {

using NodeId = std::string;
// Scalar value carried by a control event. monostate means "no value" (a bare trigger).
using Value = std::variant<std::monostate, bool, double, std::string>;

std::optional<double> toNumber(const Value& v);
std::string toString(const Value& v);
bool hasValue(const Value& v);
Value valueFromJson(const nlohmann::json& j);
nlohmann::json valueToJson(const Value& v);

// Declarative node as loaded from a graph or template document
struct NodeSpec {
    NodeId id;
    std::string type;
    nlohmann::json data = nlohmann::json::object();
    NodeId parentId; // empty at top level
};

// Declarative edge. Identity is the full 4-tuple.
struct Edge {
    NodeId source;
    std::string sourceHandle;
    NodeId target;
    std::string targetHandle;

    bool operator==(const Edge& o) const {
        return source == o.source && sourceHandle == o.sourceHandle && target == o.target && targetHandle == o.targetHandle;
    }
    bool operator!=(const Edge& o) const { return !(*this == o); }
};

struct GraphDocument {
    std::vector<NodeSpec> nodes;
    std::vector<Edge> edges;
};

void from_json(const nlohmann::json& j, NodeSpec& n);
void to_json(nlohmann::json& j, const NodeSpec& n);
void from_json(const nlohmann::json& j, Edge& e);
void to_json(nlohmann::json& j, const Edge& e);
// Accepts {"nodes":[...], "edges":[...]}; throws nlohmann::json::exception on malformed input
GraphDocument parseGraphDocument(const nlohmann::json& j);

// Closed set of node kinds; the type string is resolved once at creation
enum class NodeKind {
    Oscillator,
    Gain,
    BiquadFilter,
    Delay,
    Compressor,
    Distortion,
    Reverb,
    Worklet,
    Noise,
    IirFilter,
    Equalizer,
    MasterOut,
    OnOffGate,
    Button,
    MouseTriggerButton,
    Constant,
    Frequency,
    Function,
    EventTransform,
    Log,
    Switch,
    BlockingSwitch,
    SpeedDivider,
    Adsr,
    Automation,
    Clock,
    Sequencer,
    SequencerFrequency,
    Template,
    InputMarker,
    OutputMarker,
};

std::optional<NodeKind> nodeKindFromType(const std::string& type);
const char* nodeKindName(NodeKind kind);

// Event kinds of the topic protocol
enum class EventKind { ReceiveNodeOn, ReceiveNodeOff, SendNodeOn, SendNodeOff, UpdateParams };

const char* eventKindName(EventKind kind);
std::optional<EventKind> eventKindFromName(const std::string& name);
inline bool isOffEvent(EventKind k) { return k == EventKind::ReceiveNodeOff || k == EventKind::SendNodeOff; }

// Structured topic "<nodeId>.<handle>.<kind>". Node ids may contain dots, so
// parsing reads kind and handle from the right.
struct Topic {
    NodeId nodeId;
    std::string handle;
    EventKind kind = EventKind::ReceiveNodeOn;

    std::string str() const;
    static std::optional<Topic> parse(const std::string& text);
    static Topic params(const NodeId& id) { return Topic{id, "params", EventKind::UpdateParams}; }

    bool operator==(const Topic& o) const { return kind == o.kind && nodeId == o.nodeId && handle == o.handle; }
    bool operator!=(const Topic& o) const { return !(*this == o); }
};

struct TopicHash {
    std::size_t operator()(const Topic& t) const;
};

// Payload delivered to event handlers
struct Payload {
    Value value;
    NodeId nodeId;              // addressed node
    NodeId source;              // node that produced the event
    std::string sourceHandle;   // optional output filter for routing
    std::optional<int> activeOutput;
    nlohmann::json data = nlohmann::json::object(); // attribute bag for updateParams
};

Payload makePayload(Value value, const NodeId& source = {});

// "output-3" -> 3; nullopt when the handle does not carry that prefix and a number
std::optional<int> handleIndex(const std::string& handle, const std::string& prefix);

} // namespace SignalFlow
