// GraphManagerTests.cpp
//
// Instantiation, wiring dedup, template remapping and teardown.
#include "Log.hpp"
#include "TestGraph.hpp"
#include <catch2/catch.hpp>

using namespace SignalFlow;
using namespace SignalFlow::testing;

namespace {

// Oscillator inside a template, exposed on output-0
GraphDocument sourceTemplate() {
    return GraphDocument{
        {node("osc", "OscillatorFlowNode", {{"frequency", 330}}), node("out", "OutputNode", {{"index", 0}})},
        {edge("osc", "output", "out", "input")}};
}

// Input-0 feeding `consumers` gain nodes
GraphDocument fanTemplate(int consumers) {
    GraphDocument doc;
    doc.nodes.push_back(node("in", "InputNode", {{"index", 0}}));
    for (int i = 1; i <= consumers; ++i) {
        std::string id = "g" + std::to_string(i);
        doc.nodes.push_back(node(id, "GainFlowNode", {{"gain", 0.5}}));
        doc.edges.push_back(edge("in", "output", id, "main-input"));
    }
    return doc;
}

struct WarningCapture {
    std::vector<std::string> messages;
    WarningCapture() {
        setLogSink([this](LogLevel level, const std::string& msg) {
            if (level == LogLevel::Warn) messages.push_back(msg);
        });
    }
    ~WarningCapture() { setLogSink({}); }
};

} // namespace

TEST_CASE("Nodes are created from their type strings", "[graph]") {
    TestGraph t;
    WarningCapture warnings;
    t.load({node("osc", "OscillatorFlowNode"), node("clock", "ClockFlowNode", {{"isEmitting", false}}),
            node("bad", "ThereminFlowNode"), node("master", "MasterOutFlowNode")},
           {});
    CHECK(t.graph.nodeCount() == 3);
    CHECK(t.graph.findNode("osc")->kind() == NodeKind::Oscillator);
    CHECK(t.graph.findNode("osc")->hasPrimitive());
    CHECK_FALSE(t.graph.findNode("clock")->hasPrimitive());
    CHECK(t.graph.findNode("bad") == nullptr);
    REQUIRE(warnings.messages.size() == 1);
    CHECK(warnings.messages[0].find("ThereminFlowNode") != std::string::npos);

    // Re-adding an existing id is a no-op
    VirtualNode* before = t.graph.findNode("osc");
    CHECK(t.graph.addVirtualNode(node("osc", "GainFlowNode")) == before);
    CHECK(t.graph.findNode("osc")->kind() == NodeKind::Oscillator);
}

TEST_CASE("Parameter modulation is wired once however often edges re-resolve", "[graph][dedup]") {
    TestGraph t;
    Edge mod = edge("lfo", "output", "osc", "frequency");
    t.load({node("lfo", "OscillatorFlowNode", {{"frequency", 2}}), node("osc", "OscillatorFlowNode")}, {mod});
    REQUIRE(t.graph.connections().size() == 1);
    CHECK(t.engine.countConnections(t.primitiveOf("lfo"), t.primitiveOf("osc"), "frequency") == 1);

    for (int i = 0; i < 5; ++i) t.graph.updateEdges();
    t.graph.addConnection(mod);
    CHECK(t.graph.connections().size() == 1);
    CHECK(t.engine.countConnections(t.primitiveOf("lfo"), t.primitiveOf("osc"), "frequency") == 1);
    CHECK(t.graph.edges().size() == 1);

    SECTION("after the target's primitive is rebuilt") {
        PrimitiveHandle old = t.primitiveOf("osc");
        t.graph.updateParams("osc", {{"type", "square"}});
        PrimitiveHandle rebuilt = t.primitiveOf("osc");
        REQUIRE(rebuilt != old);
        CHECK_FALSE(t.engine.isAlive(old));
        CHECK(t.engine.countConnections(t.primitiveOf("lfo"), rebuilt, "frequency") == 1);
        CHECK(t.graph.connections().size() == 1);
        t.graph.updateParams("osc", {{"type", "triangle"}});
        t.graph.updateEdges();
        CHECK(t.engine.countConnections(t.primitiveOf("lfo"), t.primitiveOf("osc"), "frequency") == 1);
    }

    SECTION("after the source's primitive is rebuilt") {
        t.graph.updateParams("lfo", {{"type", "sawtooth"}});
        CHECK(t.engine.countConnections(t.primitiveOf("lfo"), t.primitiveOf("osc"), "frequency") == 1);
        CHECK(t.engine.connections().size() == 1);
    }
}

TEST_CASE("Signal wiring covers main input, named inputs and the sink", "[graph]") {
    TestGraph t;
    t.load({node("osc", "OscillatorFlowNode"), node("lfo", "OscillatorFlowNode"),
            node("sync", "AudioWorkletFlowNode", {{"processor", "hard-sync"}, {"inputs", nlohmann::json::array({"carrier", "modulator"})}, {"parameters", {{"ratio", 2.0}}}}),
            node("amp", "GainFlowNode"), node("master", "MasterOutFlowNode")},
           {edge("osc", "output", "sync", "carrier"), edge("lfo", "output", "sync", "modulator"),
            edge("lfo", "output", "sync", "param-ratio"), edge("sync", "output", "amp", "main-input"),
            edge("amp", "output", "master", "destination-input")});

    PrimitiveHandle sync = t.primitiveOf("sync");
    REQUIRE(t.engine.numberOfInputs(sync) == 2);
    auto inputOf = [&](PrimitiveHandle from) {
        for (const auto& c : t.engine.connections()) {
            if (c.from == from && c.to == sync && c.param.empty()) return c.input;
        }
        return -1;
    };
    CHECK(inputOf(t.primitiveOf("osc")) == 0);
    CHECK(inputOf(t.primitiveOf("lfo")) == 1);
    CHECK(t.engine.countConnections(t.primitiveOf("lfo"), sync, "ratio") == 1);
    CHECK(t.engine.countConnections(sync, t.primitiveOf("amp")) == 1);
    CHECK(t.engine.countConnections(t.primitiveOf("amp"), t.engine.destination()) == 1);
    CHECK(t.graph.connections().size() == 5);
}

TEST_CASE("A failing engine call skips only that connection", "[graph]") {
    TestGraph t;
    t.templates.add("fan", fanTemplate(3));
    t.load({node("osc", "OscillatorFlowNode"), node("t", "FlowNode", {{"selectedNode", "fan"}})}, {});
    // Pull one consumer's primitive out from under the graph
    t.engine.releasePrimitive(t.primitiveOf("t.g2"));
    t.graph.getAndResetStats();

    WarningCapture warnings;
    t.graph.addConnection(edge("osc", "output", "t", "input-0"));
    auto stats = t.graph.getAndResetStats();
    CHECK(stats.connectionsMade == 2);
    CHECK(stats.wiringFailures == 1);
    CHECK(t.graph.connections().size() == 2);
    CHECK_FALSE(t.graph.connections().contains("osc", "t.g2"));
    CHECK(t.engine.countConnections(t.primitiveOf("osc"), t.primitiveOf("t.g3")) == 1);
    CHECK_FALSE(warnings.messages.empty());
}

TEST_CASE("Source remapping crosses template outputs", "[graph][remap]") {
    TestGraph t;
    t.templates.add("src", sourceTemplate());

    SECTION("no hop") {
        t.load({node("osc", "OscillatorFlowNode"), node("master", "MasterOutFlowNode")},
               {edge("osc", "output", "master", "main-input")});
        CHECK(t.engine.countConnections(t.primitiveOf("osc"), t.engine.destination()) == 1);
    }

    SECTION("one hop") {
        Edge declared = edge("t", "output-0", "master", "main-input");
        t.load({node("t", "FlowNode", {{"selectedNode", "src"}}), node("master", "MasterOutFlowNode")}, {declared});
        REQUIRE(t.graph.findNode("t.osc"));
        CHECK(t.graph.findNode("t.osc")->parentId() == "t");
        CHECK(t.engine.countConnections(t.primitiveOf("t.osc"), t.engine.destination()) == 1);
        CHECK(t.graph.edgeIndex().contains(edge("t.osc", "output", "master", "main-input")));
        CHECK_FALSE(t.graph.edgeIndex().contains(declared));
        CHECK(t.graph.resolveEdge(declared) == std::vector<Edge>{edge("t.osc", "output", "master", "main-input")});
    }

    SECTION("nested templates") {
        t.templates.add("outer", GraphDocument{
            {node("inner", "FlowNode", {{"selectedNode", "src"}}), node("out", "OutputNode", {{"index", 0}})},
            {edge("inner", "output-0", "out", "input")}});
        t.load({node("o", "FlowNode", {{"selectedNode", "outer"}}), node("amp", "GainFlowNode")},
               {edge("o", "output-0", "amp", "main-input")});
        REQUIRE(t.graph.findNode("o.inner.osc"));
        CHECK(t.engine.countConnections(t.primitiveOf("o.inner.osc"), t.primitiveOf("amp")) == 1);
        CHECK(t.graph.connections().size() == 1);
    }
}

TEST_CASE("Template inputs fan out to every internal consumer", "[graph][remap]") {
    TestGraph t;
    int consumers = GENERATE(0, 1, 3);
    t.templates.add("fan", fanTemplate(consumers));
    t.load({node("osc", "OscillatorFlowNode"), node("t", "FlowNode", {{"selectedNode", "fan"}})},
           {edge("osc", "output", "t", "input-0")});

    size_t wired = 0;
    for (int i = 1; i <= consumers; ++i) {
        wired += t.engine.countConnections(t.primitiveOf("osc"), t.primitiveOf("t.g" + std::to_string(i)));
    }
    CHECK(wired == static_cast<size_t>(consumers));
    CHECK(t.graph.connections().size() == static_cast<size_t>(consumers));
    CHECK(t.graph.resolveEdge(edge("osc", "output", "t", "input-0")).size() == static_cast<size_t>(consumers));
}

TEST_CASE("Missing and self-including templates leave no instance", "[graph][templates]") {
    TestGraph t;
    WarningCapture warnings;
    t.templates.add("self", GraphDocument{{node("loop", "FlowNode", {{"selectedNode", "self"}}), node("g", "GainFlowNode")}, {}});
    t.load({node("missing", "FlowNode", {{"selectedNode", "nope"}}), node("r", "FlowNode", {{"selectedNode", "self"}})}, {});
    CHECK(t.graph.findNode("missing") == nullptr);
    CHECK(t.graph.findNode("r") != nullptr);
    CHECK(t.graph.findNode("r.g") != nullptr);
    CHECK(t.graph.findNode("r.loop") == nullptr);
    CHECK(warnings.messages.size() == 2);
}

TEST_CASE("Deleting nodes and edges releases their wiring", "[graph]") {
    TestGraph t;
    t.templates.add("src", sourceTemplate());
    t.load({node("lfo", "OscillatorFlowNode"), node("osc", "OscillatorFlowNode"), node("amp", "GainFlowNode"),
            node("master", "MasterOutFlowNode"), node("t", "FlowNode", {{"selectedNode", "src"}})},
           {edge("lfo", "output", "osc", "frequency"), edge("osc", "output", "amp", "main-input"),
            edge("amp", "output", "master", "main-input"), edge("t", "output-0", "amp", "main-input")});
    REQUIRE(t.graph.connections().size() == 4);

    SECTION("an edge") {
        t.graph.deleteEdge(edge("lfo", "output", "osc", "frequency"));
        CHECK(t.engine.countConnections(t.primitiveOf("lfo"), t.primitiveOf("osc"), "frequency") == 0);
        CHECK(t.graph.connections().size() == 3);
        // Four remain, including the template's internal edge
        CHECK(t.graph.edges().size() == 4);
    }

    SECTION("a node") {
        PrimitiveHandle amp = t.primitiveOf("amp");
        t.graph.deleteVirtualNode("amp");
        CHECK(t.graph.findNode("amp") == nullptr);
        CHECK_FALSE(t.engine.isAlive(amp));
        CHECK_FALSE(t.graph.connections().references("amp"));
        CHECK(t.graph.connections().size() == 1);
        for (const auto& topic : t.bus.topics()) CHECK(topic.nodeId != "amp");
        for (const auto& e : t.graph.edges()) CHECK(e.target != "amp");
    }

    SECTION("a template instance with its expansion") {
        t.graph.deleteVirtualNode("t");
        CHECK(t.graph.findNode("t") == nullptr);
        CHECK(t.graph.findNode("t.osc") == nullptr);
        CHECK(t.graph.findNode("t.out") == nullptr);
        CHECK(t.graph.connections().size() == 3);
        CHECK(t.graph.nodeCount() == 4);
    }
}

TEST_CASE("Disposal is idempotent and leaves nothing behind", "[graph][dispose]") {
    TestGraph t;
    t.load({node("clock", "ClockFlowNode", {{"bpm", 240}, {"sendOff", true}}), node("adsr", "ADSRFlowNode"),
            node("seq", "SequencerFlowNode"), node("amp", "GainFlowNode")},
           {edge("clock", "output", "seq", "main-input"), edge("seq", "row-0", "adsr", "main-input"),
            edge("adsr", "output", "amp", "gain")});
    t.scheduler.advance(600);
    REQUIRE(t.scheduler.pending() > 0);

    size_t before = t.scheduler.pending();
    REQUIRE(t.graph.findNode("clock")->pendingTimers() > 0);
    t.graph.deleteVirtualNode("clock");
    t.graph.deleteVirtualNode("clock");
    CHECK(t.graph.findNode("clock") == nullptr);
    CHECK(t.scheduler.pending() < before);
    CHECK_FALSE(t.graph.connections().references("clock"));
    for (const auto& topic : t.bus.topics()) CHECK(topic.nodeId != "clock");

    t.graph.dispose();
    t.graph.dispose();
    CHECK(t.graph.isDisposed());
    CHECK(t.graph.nodeCount() == 0);
    CHECK(t.scheduler.pending() == 0);
    CHECK(t.bus.size() == 0);
    CHECK(t.engine.livePrimitives() == 1); // destination only
    t.scheduler.advance(1000);
}

TEST_CASE("Deleting a node twice or a node never wired leaves no wiring records", "[graph][dispose]") {
    TestGraph t;
    t.load({node("osc", "OscillatorFlowNode"), node("amp", "GainFlowNode"), node("lone", "GainFlowNode")},
           {edge("osc", "output", "amp", "main-input")});
    REQUIRE(t.graph.connections().references("osc"));
    PrimitiveHandle osc = t.primitiveOf("osc");

    t.graph.deleteVirtualNode("osc");
    t.graph.deleteVirtualNode("osc");
    CHECK_FALSE(t.graph.connections().references("osc"));
    CHECK_FALSE(t.engine.isAlive(osc));
    CHECK(t.graph.connections().size() == 0);
    CHECK(t.graph.edges().empty());

    t.graph.deleteVirtualNode("lone");
    CHECK(t.graph.findNode("lone") == nullptr);
    CHECK_FALSE(t.graph.connections().references("lone"));
    CHECK(t.graph.nodeCount() == 1);
}

TEST_CASE("A template whose input feeds its output passes audio and events through", "[graph][remap]") {
    TestGraph t;
    t.templates.add("thru", GraphDocument{
        {node("in", "InputNode", {{"index", 0}}), node("out", "OutputNode", {{"index", 0}})},
        {edge("in", "output", "out", "input")}});

    SECTION("declared inputs first") {
        t.load({node("osc", "OscillatorFlowNode"), node("c", "ConstantFlowNode", {{"value", 3}}),
                node("tp", "FlowNode", {{"selectedNode", "thru"}}), node("amp", "GainFlowNode"), node("log", "LogFlowNode")},
               {edge("osc", "output", "tp", "input-0"), edge("c", "output", "tp", "input-0"),
                edge("tp", "output-0", "amp", "main-input"), edge("tp", "output-0", "log", "main-input")});
    }
    SECTION("declared outputs first") {
        t.load({node("osc", "OscillatorFlowNode"), node("c", "ConstantFlowNode", {{"value", 3}}),
                node("tp", "FlowNode", {{"selectedNode", "thru"}}), node("amp", "GainFlowNode"), node("log", "LogFlowNode")},
               {edge("tp", "output-0", "amp", "main-input"), edge("tp", "output-0", "log", "main-input"),
                edge("osc", "output", "tp", "input-0"), edge("c", "output", "tp", "input-0")});
    }

    auto& log = t.record("log");
    CHECK(t.engine.countConnections(t.primitiveOf("osc"), t.primitiveOf("amp")) == 1);
    CHECK(t.graph.connections().size() == 1);
    CHECK(t.graph.edgeIndex().contains(edge("c", "output", "log", "main-input")));

    t.graph.trigger("c", EventKind::ReceiveNodeOn);
    REQUIRE(log.size() == 1);
    CHECK(toString(log.front().payload.value) == "3");

    t.graph.updateEdges();
    t.graph.trigger("c", EventKind::ReceiveNodeOff);
    CHECK(log.size() == 2);
    CHECK(t.engine.countConnections(t.primitiveOf("osc"), t.primitiveOf("amp")) == 1);

    t.graph.deleteVirtualNode("tp");
    CHECK(t.engine.countConnections(t.primitiveOf("osc"), t.primitiveOf("amp")) == 0);
    CHECK(t.graph.connections().size() == 0);
}

TEST_CASE("Template outputs are not re-resolved on every emission", "[graph][remap]") {
    TestGraph t;
    t.templates.add("src", sourceTemplate());
    t.load({node("t", "FlowNode", {{"selectedNode", "src"}}), node("log", "LogFlowNode")},
           {edge("t", "output-0", "log", "main-input")});
    auto& log = t.record("log");
    t.graph.getAndResetStats();

    Payload p = makePayload(Value{1.0}, "t");
    for (int i = 0; i < 3; ++i) t.graph.emitEventsFromOutput("t", 0, p, EventKind::ReceiveNodeOn);
    CHECK(t.graph.getAndResetStats().lazyResolves == 0);
    CHECK(log.empty());

    SECTION("other sources still resolve lazily") {
        // Declared before its target exists, so nothing is indexed yet
        t.graph.addVirtualNode(node("late", "ConstantFlowNode"));
        t.graph.addConnection(edge("late", "output", "sink", "main-input"));
        t.graph.addVirtualNode(node("sink", "LogFlowNode"));
        auto& sink = t.record("sink");
        t.graph.trigger("late", EventKind::ReceiveNodeOn);
        CHECK(t.graph.getAndResetStats().lazyResolves == 1);
        CHECK(sink.size() == 1);
        CHECK(log.empty());
    }
}
