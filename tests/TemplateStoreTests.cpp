// TemplateStoreTests.cpp
#include "Log.hpp"
#include "TemplateStore.hpp"
#include <catch2/catch.hpp>

using namespace SignalFlow;

TEST_CASE("Directory store loads templates by name", "[templates]") {
    DirectoryTemplateStore store(std::string(SIGNALFLOW_TEST_DATA_DIR) + "/templates");
    auto voice = store.load("voice");
    REQUIRE(voice);
    CHECK(voice->nodes.size() == 6);
    CHECK(voice->edges.size() == 5);
    CHECK(voice->nodes.front().type == "InputNode");
    CHECK(voice->edges[1].targetHandle == "gain");
}

TEST_CASE("Directory store rejects missing and unsafe names", "[templates]") {
    std::vector<std::string> warnings;
    setLogSink([&](LogLevel level, const std::string& msg) {
        if (level == LogLevel::Warn) warnings.push_back(msg);
    });
    DirectoryTemplateStore store(std::string(SIGNALFLOW_TEST_DATA_DIR) + "/templates");
    CHECK_FALSE(store.load("does-not-exist"));
    CHECK_FALSE(store.load("../CMakeLists"));
    CHECK_FALSE(store.load("sub/voice"));
    setLogSink({});
    CHECK(warnings.size() == 3);
}

TEST_CASE("Memory store returns what was added", "[templates]") {
    MemoryTemplateStore store;
    CHECK_FALSE(store.load("empty"));
    store.add("empty", GraphDocument{});
    auto doc = store.load("empty");
    REQUIRE(doc);
    CHECK(doc->nodes.empty());
}
