// AudioNodeTests.cpp
//
// Primitive-bearing sources and processors whose primitives are replaced or
// extended at runtime: noise, IIR filter, equalizer chain.
#include "PrimitiveNodes.hpp"
#include "TestGraph.hpp"
#include <catch2/catch.hpp>

using namespace SignalFlow;
using namespace SignalFlow::testing;

namespace {

nlohmann::json band(const std::string& type, double frequency, double gain) {
    return {{"type", type}, {"frequency", frequency}, {"gain", gain}, {"Q", 1.0}};
}

} // namespace

TEST_CASE("Noise is a source with a color and a gain", "[audio][noise]") {
    TestGraph t;
    t.load({node("hiss", "NoiseFlowNode", {{"noiseType", "pink"}, {"gain", 0.5}}), node("amp", "GainFlowNode"),
            node("osc", "OscillatorFlowNode")},
           {edge("hiss", "output", "amp", "main-input"), edge("osc", "output", "hiss", "main-input")});
    PrimitiveHandle hiss = t.primitiveOf("hiss");
    CHECK(t.engine.kindOf(hiss) == "noise");
    CHECK(t.engine.numberOfInputs(hiss) == 0);
    CHECK(t.engine.property(hiss, "noiseType") == "pink");
    CHECK(t.engine.paramValue(hiss, "gain") == Approx(0.5));
    CHECK(t.engine.countConnections(hiss, t.primitiveOf("amp")) == 1);
    // Nothing can feed a source
    CHECK(t.engine.countConnections(t.primitiveOf("osc"), hiss) == 0);

    t.graph.updateParams("hiss", {{"noiseType", "ultraviolet"}, {"gain", 9.0}});
    CHECK(t.engine.property(hiss, "noiseType") == "white");
    CHECK(t.engine.paramValue(hiss, "gain") == Approx(4.0));
    CHECK(t.primitiveOf("hiss") == hiss);
}

TEST_CASE("IIR coefficient changes replace the filter and rewire it", "[audio][iir]") {
    TestGraph t;
    t.load({node("osc", "OscillatorFlowNode"),
            node("iir", "IIRFilterFlowNode", {{"feedforward", nlohmann::json::array({0.2, "0.3", "x"})}}),
            node("amp", "GainFlowNode")},
           {edge("osc", "output", "iir", "main-input"), edge("iir", "output", "amp", "main-input")});
    auto* iir = t.graph.findNodeAs<IirFilterNode>("iir");
    PrimitiveHandle first = t.primitiveOf("iir");
    CHECK(t.engine.kindOf(first) == "iir");
    CHECK(iir->coefficients("feedforward") == std::vector<double>{0.2, 0.3});
    CHECK(iir->coefficients("feedback") == std::vector<double>{1.0, -0.5});

    SECTION("new coefficients") {
        t.graph.updateParams("iir", {{"feedback", nlohmann::json::array({1.0, -0.9})}});
        PrimitiveHandle second = t.primitiveOf("iir");
        REQUIRE(second != first);
        CHECK_FALSE(t.engine.isAlive(first));
        CHECK(t.engine.property(second, "feedback") == nlohmann::json::array({1.0, -0.9}));
        CHECK(t.engine.countConnections(t.primitiveOf("osc"), second) == 1);
        CHECK(t.engine.countConnections(second, t.primitiveOf("amp")) == 1);
        CHECK(t.engine.connections().size() == 2);
    }

    SECTION("the same coefficients again") {
        t.graph.updateParams("iir", {{"feedforward", nlohmann::json::array({0.2, "0.3", "x"})}});
        CHECK(t.primitiveOf("iir") == first);
    }

    SECTION("rejected coefficients keep the running filter") {
        t.graph.updateParams("iir", {{"feedback", nlohmann::json::array({0.0, 1.0})}});
        CHECK(t.primitiveOf("iir") == first);
        CHECK(t.engine.isAlive(first));
        CHECK(t.engine.countConnections(t.primitiveOf("osc"), first) == 1);
        CHECK(t.engine.countConnections(first, t.primitiveOf("amp")) == 1);
    }
}

TEST_CASE("Equalizer bands form a chain between two gains", "[audio][equalizer]") {
    TestGraph t;
    t.load({node("osc", "OscillatorFlowNode"), node("eq", "EqualizerFlowNode"), node("amp", "GainFlowNode")},
           {edge("osc", "output", "eq", "main-input"), edge("eq", "output", "amp", "main-input")});
    auto* eq = t.graph.findNodeAs<EqualizerNode>("eq");
    PrimitiveHandle in = eq->inputPort();
    PrimitiveHandle out = eq->outputPort();
    REQUIRE(in != out);
    std::vector<PrimitiveHandle> filters = eq->filterHandles();
    REQUIRE(filters.size() == 5);
    CHECK(t.engine.property(filters.front(), "type") == "lowshelf");
    CHECK(t.engine.property(filters.back(), "type") == "highshelf");
    CHECK(t.engine.paramValue(filters[2], "frequency") == Approx(1000));

    CHECK(t.engine.countConnections(t.primitiveOf("osc"), in) == 1);
    CHECK(t.engine.countConnections(in, filters[0]) == 1);
    for (size_t i = 1; i < filters.size(); ++i) CHECK(t.engine.countConnections(filters[i - 1], filters[i]) == 1);
    CHECK(t.engine.countConnections(filters.back(), out) == 1);
    CHECK(t.engine.countConnections(out, t.primitiveOf("amp")) == 1);

    SECTION("same band count edits the filters in place") {
        nlohmann::json bands = nlohmann::json::array();
        for (double f : {80.0, 300.0, 1200.0, 5000.0, 10000.0}) bands.push_back(band("peaking", f, 6.0));
        t.graph.updateParams("eq", {{"bands", bands}});
        CHECK(eq->filterHandles() == filters);
        CHECK(t.engine.paramValue(filters[0], "frequency") == Approx(80));
        CHECK(t.engine.paramValue(filters[4], "gain") == Approx(6));
        CHECK(t.engine.property(filters[0], "type") == "peaking");
    }

    SECTION("a new band count rebuilds the chain only") {
        t.graph.updateParams("eq", {{"bands", nlohmann::json::array({band("lowpass", 500, 0), band("highpass", 50, 0)})}});
        const auto& rebuilt = eq->filterHandles();
        REQUIRE(rebuilt.size() == 2);
        for (PrimitiveHandle f : filters) CHECK_FALSE(t.engine.isAlive(f));
        CHECK(t.engine.countConnections(in, rebuilt[0]) == 1);
        CHECK(t.engine.countConnections(rebuilt[0], rebuilt[1]) == 1);
        CHECK(t.engine.countConnections(rebuilt[1], out) == 1);
        CHECK(t.engine.countConnections(t.primitiveOf("osc"), in) == 1);
        CHECK(t.engine.countConnections(out, t.primitiveOf("amp")) == 1);
    }

    SECTION("deleting the node releases every primitive it made") {
        size_t before = t.engine.livePrimitives();
        t.graph.deleteVirtualNode("eq");
        CHECK(t.engine.livePrimitives() == before - 7);
        CHECK_FALSE(t.engine.isAlive(out));
        CHECK_FALSE(t.engine.isAlive(in));
    }
}
