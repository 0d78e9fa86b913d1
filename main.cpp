// main.cpp
//
// Headless SignalFlow runtime. Parses CLI (CLI11), loads the JSON flow and
// its templates onto an offline engine, applies start-up triggers and
// parameter sets, then drives the scheduler from a wall or virtual clock
// until the requested duration has elapsed and prints a JSON summary.
#include "EventBus.hpp"
#include "GraphManager.hpp"
#include "Log.hpp"
#include "OfflineEngine.hpp"
#include "Scheduler.hpp"
#include "TemplateStore.hpp"
#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <stdexcept>
#include <thread>

namespace {

std::atomic<bool> running(true);

void onSignal(int) { running = false; }

// Looks next to the working directory first, then one and two levels up
nlohmann::json readFlow(const std::string& flowPath) {
    for (const std::string& prefix : {std::string(), std::string("../"), std::string("../../")}) {
        std::ifstream f(prefix + flowPath);
        if (!f.good()) continue;
        nlohmann::json json;
        f >> json;
        return json;
    }
    throw std::runtime_error("Could not find flow file: " + flowPath);
}

struct ParamSet {
    std::string nodeId;
    std::string key;
    nlohmann::json value;
};

// "<nodeId>.<key>=<value>"; node ids may contain dots so the key is the last segment
ParamSet parseSet(const std::string& text) {
    auto eq = text.find('=');
    if (eq == std::string::npos) throw std::runtime_error("--set expects <nodeId>.<key>=<value>, got '" + text + "'");
    std::string lhs = text.substr(0, eq);
    auto dot = lhs.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == lhs.size()) {
        throw std::runtime_error("--set expects <nodeId>.<key>=<value>, got '" + text + "'");
    }
    ParamSet s{lhs.substr(0, dot), lhs.substr(dot + 1), nlohmann::json()};
    std::string rhs = text.substr(eq + 1);
    s.value = nlohmann::json::parse(rhs, nullptr, false);
    if (s.value.is_discarded()) s.value = rhs;
    return s;
}

} // namespace

int main(int argc, char** argv) {
    std::string flowPath;
    std::string templateDir = "templates";
    double durationSec = 4.0;
    std::string clockType = "wall"; // "wall" | "virtual"
    double timeScale = 1.0;
    double stepMs = 1.0;            // virtual clock step
    std::vector<std::string> triggers;
    std::vector<std::string> sets;
    bool describeOnly = false;
    std::string logLevelText = "info";
    int statsIntervalMs = 0;        // 0 = off

    CLI::App app{"SignalFlow runtime"};
    try {
        app.add_option("--flow", flowPath, "Path to flow JSON file")->required();
        app.add_option("--templates", templateDir, "Directory holding <name>.json templates");
        app.add_option("--duration", durationSec, "Seconds to run")->check(CLI::NonNegativeNumber);
        app.add_option("--clock", clockType, "Clock type: wall|virtual")->check(CLI::IsMember({"wall", "virtual"}));
        app.add_option("--time-scale", timeScale, "Time scale multiplier for the wall clock")->check(CLI::PositiveNumber);
        app.add_option("--step-ms", stepMs, "Virtual clock step in milliseconds")->check(CLI::PositiveNumber);
        app.add_option("--trigger", triggers, "Emit <nodeId>.main-input.receiveNodeOn at start (repeatable)");
        app.add_option("--set", sets, "Send a parameter update <nodeId>.<key>=<value> at start (repeatable)");
        app.add_flag("--describe", describeOnly, "Print the node/connection schema as JSON and exit");
        app.add_option("--log-level", logLevelText, "debug|info|warn|error|off")
            ->check(CLI::IsMember({"debug", "info", "warn", "error", "off"}));
        app.add_option("--stats-interval", statsIntervalMs, "Router statistics interval ms (0=off)")->check(CLI::NonNegativeNumber);
        app.allow_extras(false);
        app.validate_positionals();
        app.set_config("--config");
        app.set_help_all_flag("--help-all", "Show all help");
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    SignalFlow::LogLevel level = SignalFlow::LogLevel::Info;
    SignalFlow::parseLogLevel(logLevelText, level);
    SignalFlow::setLogLevel(level);

    std::vector<ParamSet> paramSets;
    nlohmann::json json;
    try {
        for (const auto& s : sets) paramSets.push_back(parseSet(s));
        json = readFlow(flowPath);
    } catch (const nlohmann::json::exception& e) {
        fmt::print(stderr, "Malformed flow '{}': {}\n", flowPath, e.what());
        return 1;
    } catch (const std::runtime_error& e) {
        fmt::print(stderr, "{}\n", e.what());
        return 1;
    }

    SignalFlow::EventBus bus;
    SignalFlow::Scheduler scheduler;
    SignalFlow::OfflineEngine engine([&scheduler]() { return scheduler.nowSeconds(); });
    SignalFlow::DirectoryTemplateStore templates(templateDir);
    SignalFlow::GraphManager graph(bus, engine, scheduler, templates);
    try {
        graph.loadFromJson(json);
    } catch (const nlohmann::json::exception& e) {
        fmt::print(stderr, "Malformed flow '{}': {}\n", flowPath, e.what());
        return 1;
    }

    if (describeOnly) {
        nlohmann::json schema = graph.describe();
        schema["type"] = "schema";
        schema["engine"] = engine.describe();
        fmt::print("{}\n", schema.dump(2));
        return 0;
    }

    fmt::print("SignalFlow started. flow='{}', clock={}, duration={}s\n", flowPath, clockType, durationSec);

    for (const auto& s : paramSets) {
        if (!graph.findNode(s.nodeId)) {
            SignalFlow::logWarn("--set: no node '{}'", s.nodeId);
            continue;
        }
        graph.updateParams(s.nodeId, nlohmann::json{{s.key, s.value}});
    }
    for (const auto& id : triggers) {
        if (!graph.findNode(id)) {
            SignalFlow::logWarn("--trigger: no node '{}'", id);
            continue;
        }
        graph.trigger(id);
    }

    std::signal(SIGINT, onSignal);
    const double endMs = durationSec * 1000.0;
    double lastStatsMs = 0.0;
    auto reportStats = [&]() {
        if (statsIntervalMs <= 0 || scheduler.nowMs() - lastStatsMs < statsIntervalMs) return;
        lastStatsMs = scheduler.nowMs();
        auto rs = graph.getAndResetStats();
        auto bs = bus.getAndResetStats();
        SignalFlow::logInfo("stats t={:.0f}ms routed={} paramUpdates={} connections={} dedup={} failed={} lazy={} emitted={} dropped={}",
                            scheduler.nowMs(), rs.eventsRouted, rs.paramUpdates, rs.connectionsMade, rs.deduplicated,
                            rs.wiringFailures, rs.lazyResolves, bs.emitted, bs.dropped);
    };

    // Main loop: advance the scheduler until the duration has elapsed
    if (clockType == "virtual") {
        while (running && scheduler.nowMs() < endMs) {
            scheduler.advance(std::min(stepMs, endMs - scheduler.nowMs()));
            reportStats();
        }
    } else {
        using Steady = std::chrono::steady_clock;
        auto lastTs = Steady::now();
        while (running && scheduler.nowMs() < endMs) {
            auto nowTs = Steady::now();
            double dtMs = std::chrono::duration<double, std::milli>(nowTs - lastTs).count() * timeScale;
            lastTs = nowTs;
            if (dtMs > 0.0) scheduler.advance(std::min(dtMs, endMs - scheduler.nowMs()));
            reportStats();
            // Poll finely only while a fine timer is close
            double sleepMs = scheduler.suggestedSleepMs(10.0, 1.0) / timeScale;
            std::this_thread::sleep_for(std::chrono::duration<double, std::milli>(std::max(0.1, sleepMs)));
        }
    }

    nlohmann::json summary;
    summary["type"] = "summary";
    summary["flow"] = flowPath;
    summary["elapsedMs"] = scheduler.nowMs();
    summary["nodes"] = graph.nodeCount();
    summary["connections"] = graph.connections().size();
    summary["pendingTimers"] = scheduler.pending();
    summary["engineConnections"] = engine.connections().size();
    summary["livePrimitives"] = engine.livePrimitives();
    fmt::print("{}\n", summary.dump());

    graph.dispose();
    return 0;
}
