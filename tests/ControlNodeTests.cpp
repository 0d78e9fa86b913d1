// ControlNodeTests.cpp
//
// Control-only node kinds plus the primitive-bearing nodes that also react
// to control events (gate, worklet control-rate parameters).
#include "ControlNodes.hpp"
#include "Log.hpp"
#include "PrimitiveNodes.hpp"
#include "SchedulingNodes.hpp"
#include "TestGraph.hpp"
#include <catch2/catch.hpp>

using namespace SignalFlow;
using namespace SignalFlow::testing;

namespace {

void send(TestGraph& t, const NodeId& target, const std::string& handle, Value value,
          EventKind kind = EventKind::ReceiveNodeOn, const NodeId& source = "test") {
    Payload p = makePayload(std::move(value), source);
    p.nodeId = target;
    t.bus.emit(Topic{target, handle, kind}, p);
}

std::vector<std::string> values(const std::vector<Received>& events) {
    std::vector<std::string> out;
    for (const auto& e : events) out.push_back(toString(e.payload.value));
    return out;
}

} // namespace

TEST_CASE("Constant and frequency nodes emit their configured value", "[control]") {
    TestGraph t;
    t.load({node("k", "ConstantFlowNode", {{"value", "hello"}}),
            node("note", "FrequencyFlowNode", {{"frequency", 57}, {"frequencyType", "midi"}}),
            node("log", "LogFlowNode"), node("osc", "OscillatorFlowNode")},
           {edge("k", "output", "log", "main-input"), edge("note", "output", "osc", "frequency")});
    auto& log = t.record("log");

    t.graph.trigger("k", EventKind::ReceiveNodeOn);
    t.graph.trigger("k", EventKind::ReceiveNodeOff);
    REQUIRE(log.size() == 2);
    CHECK(values(log) == std::vector<std::string>{"hello", "hello"});
    CHECK(log[1].kind == EventKind::ReceiveNodeOff);

    auto* note = t.graph.findNodeAs<FrequencyNode>("note");
    CHECK(note->frequency() == Approx(220));
    t.graph.trigger("note", EventKind::ReceiveNodeOn);
    CHECK(t.graph.findNode("osc")->data()["frequency"].get<double>() == Approx(220));

    // A frequency change is pushed without a trigger
    t.graph.updateParams("note", {{"frequency", 69}});
    CHECK(t.graph.findNode("osc")->data()["frequency"].get<double>() == Approx(440));
}

TEST_CASE("Function nodes evaluate formulas over their inputs", "[control][function]") {
    TestGraph t;

    SECTION("scalar results fan out to every edge") {
        t.load({node("fn", "FunctionFlowNode", {{"formula", "main + input1 * input2"}}), node("log", "LogFlowNode")},
               {edge("fn", "output", "log", "main-input")});
        auto& log = t.record("log");
        send(t, "fn", "input-1", Value{10.0});
        send(t, "fn", "input-2", Value{std::string("3")});
        send(t, "fn", "main-input", Value{1.0});
        send(t, "fn", "main-input", Value{}, EventKind::ReceiveNodeOff);
        CHECK(values(log) == std::vector<std::string>{"31", "30"});
    }

    SECTION("array results go to the matching outputs") {
        t.load({node("fn", "FunctionFlowNode", {{"formula", "[main, main * 2]"}}), node("a", "LogFlowNode"),
                node("b", "LogFlowNode")},
               {edge("fn", "output-0", "a", "main-input"), edge("fn", "output-1", "b", "main-input")});
        auto& a = t.record("a");
        auto& b = t.record("b");
        send(t, "fn", "main-input", Value{3.0});
        CHECK(values(a) == std::vector<std::string>{"3"});
        CHECK(values(b) == std::vector<std::string>{"6"});
    }

    SECTION("errors emit the sentinel") {
        t.load({node("bad", "FunctionFlowNode", {{"formula", "main +"}}),
                node("div", "FunctionFlowNode", {{"formula", "main / input1"}}), node("log", "LogFlowNode")},
               {edge("bad", "output", "log", "main-input"), edge("div", "output", "log", "main-input")});
        auto& log = t.record("log");
        send(t, "bad", "main-input", Value{1.0});
        send(t, "div", "main-input", Value{1.0});
        CHECK(values(log) == std::vector<std::string>{FunctionNode::kErrorSentinel, FunctionNode::kErrorSentinel});

        // A corrected formula recompiles
        t.graph.updateParams("bad", {{"formula", "main * 4"}});
        send(t, "bad", "main-input", Value{2.0});
        CHECK(values(log).back() == "8");
    }
}

TEST_CASE("Event transforms rewrite events from a listened topic", "[control]") {
    TestGraph t;
    std::vector<std::string> warnings;
    setLogSink([&](LogLevel level, const std::string& msg) {
        if (level == LogLevel::Warn) warnings.push_back(msg);
    });
    t.load({node("x", "EventFlowNode", {{"formula", "main * 10"}, {"listener", "pad.main-input.sendNodeOn"}}),
            node("y", "EventFlowNode", {{"listener", "bogus"}}), node("log", "LogFlowNode")},
           {edge("x", "output", "log", "main-input")});
    setLogSink({});
    CHECK(warnings.size() == 1);
    auto& log = t.record("log");

    send(t, "pad", "main-input", Value{4.0}, EventKind::SendNodeOn);
    send(t, "x", "main-input", Value{std::string("0.5")}, EventKind::ReceiveNodeOff);
    REQUIRE(log.size() == 2);
    CHECK(values(log) == std::vector<std::string>{"40", "5"});
    CHECK(log[0].kind == EventKind::ReceiveNodeOn);
    CHECK(log[1].kind == EventKind::ReceiveNodeOff);
    CHECK(log[0].payload.source == "x");
}

TEST_CASE("Log nodes keep a bounded history", "[control]") {
    TestGraph t;
    t.load({node("log", "LogFlowNode", {{"maxEntries", 3}})}, {});
    for (int i = 1; i <= 5; ++i) send(t, "log", "main-input", Value{static_cast<double>(i)});
    auto* log = t.graph.findNodeAs<LogNode>("log");
    REQUIRE(log->entries().size() == 3);
    CHECK(toNumber(log->entries().front().value) == 3.0);
    CHECK(log->entries().back().source == "test");

    t.graph.updateParams("log", {{"maxEntries", 1}});
    REQUIRE(log->entries().size() == 1);
    CHECK(toNumber(log->entries().front().value) == 5.0);
}

TEST_CASE("Sequencer steps fire per-row pulses", "[control][sequencer]") {
    TestGraph t;
    nlohmann::json patterns = nlohmann::json::array({nlohmann::json::array({true, false, true}), nlohmann::json::array({false, true})});
    t.load({node("seq", "SequencerFlowNode",
                 {{"rows", 2}, {"squares", 3}, {"patterns", patterns}, {"pulseLengths", nlohmann::json::array({50})}}),
            node("r0", "LogFlowNode"), node("r1", "LogFlowNode"), node("main", "LogFlowNode"), node("bar", "LogFlowNode")},
           {edge("seq", "row-0", "r0", "main-input"), edge("seq", "row-1", "r1", "main-input"),
            edge("seq", "main-input", "main", "main-input"), edge("seq", "sync", "bar", "main-input")});
    auto& r0 = t.record("r0");
    auto& r1 = t.record("r1");
    auto& primary = t.record("main");
    auto& bar = t.record("bar");
    auto* seq = t.graph.findNodeAs<SequencerNode>("seq");
    // Short rows are padded with enabled steps
    CHECK(seq->cell(1, 2));
    CHECK_FALSE(seq->cell(0, 1));

    t.graph.trigger("seq", EventKind::ReceiveNodeOn);
    CHECK(seq->activeIndex() == 0);
    CHECK(countOn(r0) == 1);
    CHECK(countOn(primary) == 1);
    CHECK(r1.empty());
    CHECK(bar.empty());
    CHECK(r0[0].payload.data["step"] == 0);

    t.scheduler.advance(49);
    CHECK(r0.size() == 1);
    t.scheduler.advance(1);
    REQUIRE(r0.size() == 2);
    CHECK(r0[1].kind == EventKind::ReceiveNodeOff);

    send(t, "seq", "advance", Value{});
    send(t, "seq", "advance", Value{});
    CHECK(countOn(r0) == 2);
    CHECK(countOn(r1) == 2);
    CHECK(bar.empty());

    // Wrapping back to step 0 is a bar line
    t.graph.trigger("seq", EventKind::ReceiveNodeOn);
    CHECK(seq->activeIndex() == 0);
    CHECK(countOn(bar) == 1);

    send(t, "seq", "reset-input", Value{});
    CHECK(seq->activeIndex() == -1);
    CHECK(countOn(bar) == 2);
    t.graph.trigger("seq", EventKind::ReceiveNodeOn);
    CHECK(seq->activeIndex() == 0);
    CHECK(countOn(bar) == 2);

    t.graph.deleteVirtualNode("seq");
    CHECK(t.scheduler.pending() == 0);
}

TEST_CASE("Speed divider thins and multiplies triggers", "[control][divider]") {
    TestGraph t;

    SECTION("divides") {
        t.load({node("sd", "SpeedDividerFlowNode", {{"divider", 2}}), node("log", "LogFlowNode")},
               {edge("sd", "output", "log", "main-input")});
        auto& log = t.record("log");
        for (int i = 0; i < 4; ++i) send(t, "sd", "input", Value{static_cast<double>(i)});
        CHECK(values(log) == std::vector<std::string>{"1", "3"});

        // Changing the divider restarts the count
        send(t, "sd", "input", Value{4.0});
        send(t, "sd", "divider-input", Value{3.0});
        CHECK(t.graph.findNodeAs<SpeedDividerNode>("sd")->divider() == 3);
        for (int i = 5; i < 8; ++i) send(t, "sd", "main-input", Value{static_cast<double>(i)});
        CHECK(values(log).back() == "7");
        CHECK(log.size() == 3);
    }

    SECTION("multiplies across the measured interval") {
        t.load({node("sd", "SpeedDividerFlowNode", {{"multiplier", 2}}), node("log", "LogFlowNode")},
               {edge("sd", "output", "log", "main-input")});
        auto& log = t.record("log");
        auto times = [&log]() {
            std::vector<double> out;
            for (const auto& e : log) out.push_back(e.atMs);
            return out;
        };

        // No interval yet: the extra trigger goes out at once
        send(t, "sd", "input", Value{});
        CHECK(times() == std::vector<double>{0, 0});

        t.scheduler.advance(100);
        send(t, "sd", "input", Value{});
        t.scheduler.advance(100);
        CHECK(times() == std::vector<double>{0, 0, 100, 150});

        // A new hit cancels extras still pending from the last one
        send(t, "sd", "input", Value{});
        t.scheduler.advance(20);
        send(t, "sd", "input", Value{});
        t.scheduler.advance(100);
        CHECK(times() == std::vector<double>{0, 0, 100, 150, 200, 220, 230});

        t.graph.deleteVirtualNode("sd");
        CHECK(t.scheduler.pending() == 0);
    }

    SECTION("divides and multiplies together") {
        t.load({node("sd", "SpeedDividerFlowNode", {{"divider", 2}, {"multiplier", 3}}), node("log", "LogFlowNode")},
               {edge("sd", "output", "log", "main-input")});
        auto& log = t.record("log");
        for (int i = 0; i < 4; ++i) {
            send(t, "sd", "input", Value{});
            t.scheduler.advance(100);
        }
        // Extras are spread over one incoming interval and all fire before the next hit
        REQUIRE(log.size() == 6);
        std::vector<double> expected{100, 100 + 100.0 / 3, 100 + 200.0 / 3, 300, 300 + 100.0 / 3, 300 + 200.0 / 3};
        for (size_t i = 0; i < expected.size(); ++i) CHECK(log[i].atMs == Approx(expected[i]));
    }

    SECTION("passes offs through") {
        t.load({node("sd", "SpeedDividerFlowNode", {{"divider", 3}}), node("log", "LogFlowNode")},
               {edge("sd", "output", "log", "main-input")});
        auto& log = t.record("log");
        send(t, "sd", "input", Value{1.0}, EventKind::ReceiveNodeOff);
        send(t, "sd", "main-input", Value{2.0}, EventKind::ReceiveNodeOff);
        REQUIRE(log.size() == 2);
        CHECK(log[0].kind == EventKind::ReceiveNodeOff);
        CHECK(values(log) == std::vector<std::string>{"1", "2"});
        CHECK(log[1].payload.source == "sd");
    }
}

TEST_CASE("On/off gate passes events and audio only while open", "[control][gate]") {
    TestGraph t;
    t.load({node("gate", "OnOffButtonFlowNode"), node("log", "LogFlowNode")},
           {edge("gate", "output", "log", "main-input")});
    auto& log = t.record("log");
    auto* gate = t.graph.findNodeAs<OnOffGateNode>("gate");
    PrimitiveHandle gain = t.primitiveOf("gate");

    CHECK_FALSE(gate->isOpen());
    CHECK(t.engine.paramValue(gain, "gain") == 0.0);
    t.graph.trigger("gate", EventKind::ReceiveNodeOn);
    CHECK(log.empty());

    send(t, "gate", "toggle-input", Value{});
    CHECK(gate->isOpen());
    CHECK(t.engine.paramValue(gain, "gain") == 1.0);
    t.graph.trigger("gate", EventKind::ReceiveNodeOn);
    t.graph.trigger("gate", EventKind::ReceiveNodeOff);
    CHECK(log.size() == 2);

    t.graph.updateParams("gate", {{"isOn", false}});
    CHECK_FALSE(gate->isOpen());
    CHECK(t.engine.paramValue(gain, "gain") == 0.0);
    t.graph.trigger("gate", EventKind::ReceiveNodeOn);
    CHECK(log.size() == 2);
}

TEST_CASE("Worklet control-rate parameters take values from events", "[control][worklet]") {
    TestGraph t;
    t.load({node("k", "ConstantFlowNode", {{"value", 5}}),
            node("wk", "AudioWorkletFlowNode", {{"processor", "bitcrusher"}, {"parameters", {{"bits", 8}}}})},
           {edge("k", "output", "wk", "param-flow-bits")});
    PrimitiveHandle wk = t.primitiveOf("wk");
    CHECK(t.engine.paramValue(wk, "bits") == 8.0);
    // Control-rate handles never become signal connections
    CHECK(t.graph.connections().size() == 0);

    t.graph.trigger("k", EventKind::ReceiveNodeOn);
    CHECK(t.engine.paramValue(wk, "bits") == 5.0);
    CHECK(t.graph.findNode("wk")->data()["bits"] == 5.0);
}

TEST_CASE("Buttons turn presses into on/off for their edges", "[control][button]") {
    TestGraph t;
    auto type = GENERATE(as<std::string>{}, "ButtonFlowNode", "MouseTriggerButton");
    t.load({node("btn", type), node("log", "LogFlowNode")}, {edge("btn", "output", "log", "main-input")});
    auto& log = t.record("log");
    auto* btn = t.graph.findNodeAs<ButtonNode>("btn");
    REQUIRE(btn != nullptr);

    btn->press();
    CHECK(btn->isPressed());
    REQUIRE(log.size() == 1);
    CHECK(log[0].kind == EventKind::ReceiveNodeOn);
    CHECK(log[0].payload.source == "btn");
    btn->release();
    CHECK_FALSE(btn->isPressed());
    REQUIRE(log.size() == 2);
    CHECK(log[1].kind == EventKind::ReceiveNodeOff);

    // A key binding or pointer handler sends on the main input the same way
    send(t, "btn", "main-input", Value{64.0}, EventKind::SendNodeOn, "keyboard");
    REQUIRE(log.size() == 3);
    CHECK(values(log).back() == "64");
    // Receiving is not pressing
    send(t, "btn", "main-input", Value{}, EventKind::ReceiveNodeOn);
    CHECK(log.size() == 3);
}

TEST_CASE("Frequency sequencer pulses carry each cell's frequency", "[control][sequencer]") {
    TestGraph t;
    nlohmann::json freqs = nlohmann::json::array({nlohmann::json::array({220, "330", nullptr}), nlohmann::json::array({110})});
    t.load({node("seq", "SequencerFrequencyFlowNode", {{"rows", 2}, {"squares", 3}, {"frequencies", freqs}}),
            node("r0", "LogFlowNode"), node("r1", "LogFlowNode"), node("osc", "OscillatorFlowNode")},
           {edge("seq", "row-0", "r0", "main-input"), edge("seq", "row-1", "r1", "main-input"),
            edge("seq", "main-input", "osc", "frequency")});
    auto& r0 = t.record("r0");
    auto& r1 = t.record("r1");
    auto* seq = t.graph.findNodeAs<SequencerFrequencyNode>("seq");
    REQUIRE(seq != nullptr);
    CHECK(seq->kind() == NodeKind::SequencerFrequency);
    CHECK(seq->frequency(0, 2) == Approx(440));
    CHECK(seq->frequency(1, 1) == Approx(440));
    CHECK(seq->frequency(5, 0) == Approx(440));

    for (int i = 0; i < 3; ++i) t.graph.trigger("seq", EventKind::ReceiveNodeOn);
    CHECK(values(r0) == std::vector<std::string>{"220", "330", "440"});
    CHECK(values(r1) == std::vector<std::string>{"110", "440", "440"});
    CHECK(t.graph.findNode("osc")->data()["frequency"].get<double>() == Approx(440));

    SECTION("a single row applies to row 0 only") {
        t.graph.updateParams("seq", {{"frequencies", nlohmann::json::array({100, 200})}});
        CHECK(seq->frequency(0, 1) == Approx(200));
        CHECK(seq->frequency(1, 1) == Approx(440));
    }
}
