// SchedulingNodes.cpp
#include "SchedulingNodes.hpp"
#include "Log.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <fmt/core.h>

namespace SignalFlow {

namespace {
double numberOr(const nlohmann::json& data, const char* key, double fallback) {
    auto it = data.find(key);
    if (it == data.end() || !it->is_number()) return fallback;
    return it->get<double>();
}

TimerPrecision precisionFor(double delayMs) {
    return delayMs < Scheduler::kFinePollingThresholdMs ? TimerPrecision::Fine : TimerPrecision::Coarse;
}
}

AdsrParams AdsrParams::fromJson(const nlohmann::json& data) {
    AdsrParams p;
    p.attack = std::max(0.0, numberOr(data, "attack", p.attack));
    p.sustainTime = std::max(0.0, numberOr(data, "sustainTime", p.sustainTime));
    p.sustainLevel = std::clamp(numberOr(data, "sustainLevel", p.sustainLevel), 0.0, 1.0);
    p.release = std::max(0.0, numberOr(data, "release", p.release));
    p.minPercent = numberOr(data, "minPercent", p.minPercent);
    p.maxPercent = numberOr(data, "maxPercent", p.maxPercent);
    return p;
}

void scheduleEnvelopeAttack(AudioEngine& engine, const ParamTarget& target, const AdsrParams& params, double now) {
    double minAbs = target.base * params.minPercent / 100.0;
    double maxAbs = target.base * params.maxPercent / 100.0;
    double sustainAbs = minAbs + (maxAbs - minAbs) * params.sustainLevel;
    double current = engine.paramValue(target.owner, target.param);
    engine.cancelScheduledValues(target.owner, target.param, now);
    engine.setValueAtTime(target.owner, target.param, std::max(current, minAbs), now);
    engine.linearRampToValueAtTime(target.owner, target.param, maxAbs, now + params.attack);
    engine.linearRampToValueAtTime(target.owner, target.param, sustainAbs, now + params.attack + params.sustainTime);
}

void scheduleEnvelopeRelease(AudioEngine& engine, const ParamTarget& target, const AdsrParams& params, double now) {
    double minAbs = target.base * params.minPercent / 100.0;
    double current = engine.paramValue(target.owner, target.param);
    engine.cancelScheduledValues(target.owner, target.param, now);
    engine.setValueAtTime(target.owner, target.param, current, now);
    engine.linearRampToValueAtTime(target.owner, target.param, minAbs, now + params.release);
}

AdsrNode::AdsrNode(NodeContext context, NodeSpec nodeSpec)
    : VirtualNode(context, std::move(nodeSpec), NodeKind::Adsr), adsr(AdsrParams::fromJson(spec.data)) {}

void AdsrNode::render() {
    VirtualNode::render();
    subscribe("main-input", EventKind::ReceiveNodeOn, [this](const Payload&) { noteOn(); });
    subscribe("main-input", EventKind::ReceiveNodeOff, [this](const Payload&) { noteOff(); });
    for (const char* name : {"attack", "sustainTime", "sustainLevel", "release", "minPercent", "maxPercent"}) {
        std::string key = name;
        subscribe(key + "-input", EventKind::ReceiveNodeOn, [this, key](const Payload& p) {
            if (auto v = toNumber(p.value)) applyParameterUpdate(nlohmann::json::object({{key, *v}}));
        });
    }
}

void AdsrNode::applyParameterUpdate(const nlohmann::json& update) {
    VirtualNode::applyParameterUpdate(update);
    adsr = AdsrParams::fromJson(spec.data);
}

void AdsrNode::noteOn() {
    // Retrigger while held releases first so the attack starts from the live value
    if (on) noteOff();
    on = true;
    double now = ctx.engine.currentTime();
    ctx.router.forEachParamTarget(id(), [&](const ParamTarget& t) {
        try {
            scheduleEnvelopeAttack(ctx.engine, t, adsr, now);
        } catch (const std::exception& e) {
            logWarn("{}: attack on {}.{} failed: {}", id(), t.nodeId, t.param, e.what());
        }
    });
}

void AdsrNode::noteOff() {
    on = false;
    double now = ctx.engine.currentTime();
    ctx.router.forEachParamTarget(id(), [&](const ParamTarget& t) {
        try {
            scheduleEnvelopeRelease(ctx.engine, t, adsr, now);
        } catch (const std::exception& e) {
            logWarn("{}: release on {}.{} failed: {}", id(), t.nodeId, t.param, e.what());
        }
    });
}

AutomationNode::AutomationNode(NodeContext context, NodeSpec nodeSpec)
    : VirtualNode(context, std::move(nodeSpec), NodeKind::Automation) {}

void AutomationNode::render() {
    VirtualNode::render();
    subscribe("main-input", EventKind::ReceiveNodeOn, [this](const Payload&) { start(); });
    subscribe("main-input", EventKind::ReceiveNodeOff, [this](const Payload&) { stop(); });
}

double AutomationNode::lengthSec() const { return std::max(kMinLengthSec, dataNumber("lengthSec", 2.0)); }

std::vector<AutomationPoint> AutomationNode::points() const {
    std::vector<AutomationPoint> out;
    auto it = spec.data.find("points");
    if (it != spec.data.end() && it->is_array()) {
        for (const auto& p : *it) {
            if (!p.is_object()) continue;
            out.push_back({std::clamp(numberOr(p, "x", 0.0), 0.0, 1.0), std::clamp(numberOr(p, "y", 0.5), 0.0, 1.0)});
        }
    }
    if (out.empty()) out = {{0.0, 0.5}, {1.0, 0.5}};
    std::stable_sort(out.begin(), out.end(), [](const AutomationPoint& a, const AutomationPoint& b) { return a.x < b.x; });
    return out;
}

void AutomationNode::start() {
    cancelTimer(loopTimer);
    running = true;
    writeCurves();
    if (dataBool("loop", false)) {
        loopTimer = scheduleTimer(lengthSec() * 1000.0, [this]() {
            loopTimer = kNoTimer;
            if (running) start();
        });
    }
}

void AutomationNode::stop() {
    running = false;
    cancelTimer(loopTimer);
    double now = ctx.engine.currentTime();
    ctx.router.forEachParamTarget(id(), [&](const ParamTarget& t) {
        try {
            ctx.engine.cancelScheduledValues(t.owner, t.param, now);
        } catch (const std::exception& e) {
            logWarn("{}: cancel on {}.{} failed: {}", id(), t.nodeId, t.param, e.what());
        }
    });
}

void AutomationNode::writeCurves() {
    const auto pts = points();
    const double length = lengthSec();
    const double minPct = dataNumber("min", 0.0);
    const double maxPct = dataNumber("max", 200.0);
    const double span = maxPct - minPct;
    double now = ctx.engine.currentTime();
    ctx.router.forEachParamTarget(id(), [&](const ParamTarget& t) {
        try {
            ctx.engine.cancelScheduledValues(t.owner, t.param, now);
            for (size_t i = 0; i < pts.size(); ++i) {
                double percent = maxPct - pts[i].y * span;
                double value = t.base * percent / 100.0;
                double at = now + pts[i].x * length;
                if (i == 0) ctx.engine.setValueAtTime(t.owner, t.param, value, at);
                else ctx.engine.linearRampToValueAtTime(t.owner, t.param, value, at);
            }
        } catch (const std::exception& e) {
            logWarn("{}: automation on {}.{} failed: {}", id(), t.nodeId, t.param, e.what());
        }
    });
}

void AutomationNode::onDispose() {
    running = false;
    cancelTimer(loopTimer);
}

ClockNode::ClockNode(NodeContext context, NodeSpec nodeSpec)
    : VirtualNode(context, std::move(nodeSpec), NodeKind::Clock) {}

double ClockNode::intervalMs() const {
    double bpm = dataNumber("bpm", 120.0);
    if (bpm <= 0.0) bpm = 120.0;
    return 60000.0 / bpm;
}

void ClockNode::render() {
    VirtualNode::render();
    subscribe("main-input", EventKind::ReceiveNodeOn, [this](const Payload&) {
        if (running) stop(); else start();
    });
    // Deferred to the first advance so the first tick sees the graph's edges
    if (dataBool("isEmitting", true)) {
        tickTimer = scheduleTimer(0.0, [this]() {
            tickTimer = kNoTimer;
            if (!running) start();
        }, TimerPrecision::Fine);
    }
}

void ClockNode::applyParameterUpdate(const nlohmann::json& update) {
    double oldInterval = intervalMs();
    VirtualNode::applyParameterUpdate(update);
    if (update.contains("isEmitting")) {
        bool want = dataBool("isEmitting", true);
        if (want && !running) start();
        else if (!want) stop();
    }
    if (update.contains("bpm") && running && intervalMs() != oldInterval) changeTempo(oldInterval);
}

void ClockNode::start() {
    cancelTimer(tickTimer);
    running = true;
    spec.data["isEmitting"] = true;
    startMs = ctx.scheduler.nowMs();
    tickCount = 0;
    tick();
}

void ClockNode::stop() {
    running = false;
    spec.data["isEmitting"] = false;
    cancelTimer(tickTimer);
    if (offTimer != kNoTimer) {
        cancelTimer(offTimer);
        emitOff();
    }
}

void ClockNode::tick() {
    tickTimer = kNoTimer;
    if (!running) return;
    if (offTimer != kNoTimer) {
        // A pending off must never trail the next on
        cancelTimer(offTimer);
        emitOff();
    }
    lastTickMs = ctx.scheduler.nowMs();
    ++tickCount;
    Payload p = makeOwnPayload(Value{});
    p.data["tick"] = tickCount;
    emitOwn("main-input", EventKind::SendNodeOn, p);
    ctx.router.emitEventsForConnectedEdges(id(), p, EventKind::ReceiveNodeOn);
    if (!running) return; // a downstream handler may have stopped us
    scheduleOff();
    double next = startMs + static_cast<double>(tickCount) * intervalMs();
    scheduleNextTick(next - ctx.scheduler.nowMs());
}

void ClockNode::scheduleNextTick(double delayMs) {
    delayMs = std::max(0.0, delayMs);
    tickTimer = scheduleTimer(delayMs, [this]() { tick(); }, precisionFor(delayMs));
}

void ClockNode::scheduleOff() {
    if (!dataBool("sendOff", false)) return;
    double interval = intervalMs();
    double delay = dataBool("sendOffBeforeNextOn", false)
        ? interval - dataNumber("offBeforeNextMs", 10.0)
        : dataNumber("offDelayMs", 50.0);
    delay = std::clamp(delay, 1.0, std::max(1.0, interval - 1.0));
    offTimer = scheduleTimer(delay, [this]() {
        offTimer = kNoTimer;
        emitOff();
    }, precisionFor(delay));
}

void ClockNode::emitOff() {
    Payload p = makeOwnPayload(Value{});
    emitOwn("main-input", EventKind::SendNodeOff, p);
    ctx.router.emitEventsForConnectedEdges(id(), p, EventKind::ReceiveNodeOff);
}

void ClockNode::changeTempo(double oldIntervalMs) {
    double now = ctx.scheduler.nowMs();
    double phase = std::min(1.0, (now - lastTickMs) / oldIntervalMs);
    double bridge = std::max(kMinBridgeMs, intervalMs() * (1.0 - phase));
    logDebug("{}: tempo change, phase {:.3f}, bridging {:.1f}ms", id(), phase, bridge);
    cancelTimer(tickTimer);
    tickTimer = scheduleTimer(bridge, [this]() {
        tickTimer = kNoTimer;
        // Re-anchor so steady-state ticks follow the new interval
        startMs = ctx.scheduler.nowMs();
        tickCount = 0;
        tick();
    }, precisionFor(bridge));
}

void ClockNode::onDispose() {
    running = false;
    cancelTimer(tickTimer);
    cancelTimer(offTimer);
}

SequencerNode::SequencerNode(NodeContext context, NodeSpec nodeSpec)
    : SequencerNode(context, std::move(nodeSpec), NodeKind::Sequencer) {}

SequencerNode::SequencerNode(NodeContext context, NodeSpec nodeSpec, NodeKind kind)
    : VirtualNode(context, std::move(nodeSpec), kind) {
    loadPatterns();
}

Value SequencerNode::stepValue(int, int) const { return Value{1.0}; }

int SequencerNode::squares() const { return std::clamp(static_cast<int>(dataNumber("squares", 8)), 1, kMaxSquares); }

int SequencerNode::rows() const { return std::clamp(static_cast<int>(dataNumber("rows", 1)), 1, kMaxRows); }

bool SequencerNode::cell(int row, int step) const {
    if (row < 0 || row >= static_cast<int>(patterns.size())) return false;
    const auto& r = patterns[static_cast<size_t>(row)];
    return step >= 0 && step < static_cast<int>(r.size()) && r[static_cast<size_t>(step)];
}

double SequencerNode::pulseMs(int step) const {
    double fallback = dataNumber("defaultPulseMs", 10.0);
    auto it = spec.data.find("pulseLengths");
    if (it != spec.data.end() && it->is_array() && step >= 0 && step < static_cast<int>(it->size())) {
        const auto& v = (*it)[static_cast<size_t>(step)];
        if (v.is_number()) fallback = v.get<double>();
    }
    return std::clamp(fallback, kMinPulseMs, kMaxPulseMs);
}

void SequencerNode::loadPatterns() {
    const int nRows = rows();
    const int nSteps = squares();
    patterns.assign(static_cast<size_t>(nRows), std::vector<bool>(static_cast<size_t>(nSteps), true));
    auto readRow = [&](const nlohmann::json& src, std::vector<bool>& dst) {
        for (size_t i = 0; i < dst.size() && i < src.size(); ++i) {
            const auto& v = src[i];
            dst[i] = v.is_boolean() ? v.get<bool>() : (v.is_number() ? v.get<double>() != 0.0 : true);
        }
    };
    auto grid = spec.data.find("patterns");
    if (grid != spec.data.end() && grid->is_array()) {
        for (size_t r = 0; r < patterns.size() && r < grid->size(); ++r) {
            if ((*grid)[r].is_array()) readRow((*grid)[r], patterns[r]);
        }
        return;
    }
    auto legacy = spec.data.find("pattern");
    if (legacy != spec.data.end() && legacy->is_array()) readRow(*legacy, patterns[0]);
}

void SequencerNode::render() {
    VirtualNode::render();
    for (const char* handle : {"main-input", "advance"}) {
        subscribe(handle, EventKind::ReceiveNodeOn, [this](const Payload&) { advance(); });
    }
    subscribe("reset", EventKind::ReceiveNodeOn, [this](const Payload&) { reset(); });
    subscribe("reset-input", EventKind::ReceiveNodeOn, [this](const Payload&) { reset(); });
}

void SequencerNode::applyParameterUpdate(const nlohmann::json& update) {
    VirtualNode::applyParameterUpdate(update);
    if (update.contains("patterns") || update.contains("pattern") || update.contains("rows") || update.contains("squares")) {
        loadPatterns();
        if (active >= squares()) active = -1;
    }
}

void SequencerNode::advance() {
    int previous = active;
    active = (active + 1) % squares();
    spec.data["activeIndex"] = active;
    if (active == 0 && previous >= 0) {
        Payload sync = makeOwnPayload(Value{});
        pulse({"sync"}, sync, pulseMs(0));
    }
    for (int r = 0; r < rows(); ++r) {
        if (!cell(r, active)) continue;
        Payload p = makeOwnPayload(stepValue(r, active));
        p.data["row"] = r;
        p.data["step"] = active;
        std::vector<std::string> handles{fmt::format("row-{}", r)};
        if (r == 0) handles.emplace_back("main-input");
        pulse(handles, p, pulseMs(active));
    }
}

void SequencerNode::reset() {
    active = -1;
    spec.data["activeIndex"] = 0;
    pulse({"sync"}, makeOwnPayload(Value{}), pulseMs(0));
}

void SequencerNode::pulse(const std::vector<std::string>& handles, const Payload& p, double lengthMs) {
    for (const auto& h : handles) {
        Payload on = p;
        on.sourceHandle = h;
        ctx.router.emitEventsForHandle(id(), h, on, EventKind::ReceiveNodeOn);
    }
    scheduleTimer(lengthMs, [this, handles, p]() {
        for (const auto& h : handles) {
            Payload off = p;
            off.sourceHandle = h;
            ctx.router.emitEventsForHandle(id(), h, off, EventKind::ReceiveNodeOff);
        }
    }, precisionFor(lengthMs));
}

void SequencerNode::onDispose() { active = -1; }

SequencerFrequencyNode::SequencerFrequencyNode(NodeContext context, NodeSpec nodeSpec)
    : SequencerNode(context, std::move(nodeSpec), NodeKind::SequencerFrequency) {}

double SequencerFrequencyNode::frequency(int row, int step) const {
    auto grid = spec.data.find("frequencies");
    if (grid == spec.data.end() || !grid->is_array() || grid->empty() || row < 0 || step < 0) return kDefaultFrequency;
    const nlohmann::json* cells = &*grid;
    if ((*grid)[0].is_array()) {
        if (row >= static_cast<int>(grid->size())) return kDefaultFrequency;
        cells = &(*grid)[static_cast<size_t>(row)];
    } else if (row != 0) {
        return kDefaultFrequency;
    }
    if (!cells->is_array() || step >= static_cast<int>(cells->size())) return kDefaultFrequency;
    const auto& v = (*cells)[static_cast<size_t>(step)];
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) {
        if (auto n = toNumber(Value{v.get<std::string>()})) return *n;
    }
    return kDefaultFrequency;
}

Value SequencerFrequencyNode::stepValue(int row, int step) const { return Value{frequency(row, step)}; }

} // namespace SignalFlow
