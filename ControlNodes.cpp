// ControlNodes.cpp
#include "ControlNodes.hpp"
#include "Log.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/core.h>

namespace SignalFlow {

ConstantNode::ConstantNode(NodeContext context, NodeSpec nodeSpec)
    : VirtualNode(context, std::move(nodeSpec), NodeKind::Constant) {}

void ConstantNode::render() {
    VirtualNode::render();
    auto emitValue = [this](EventKind kind) {
        return [this, kind](const Payload&) {
            Value v = spec.data.contains("value") ? valueFromJson(spec.data["value"]) : Value{};
            ctx.router.handleConnectedEdges(id(), makeOwnPayload(v), kind, std::nullopt);
        };
    };
    subscribe("main-input", EventKind::ReceiveNodeOn, emitValue(EventKind::ReceiveNodeOn));
    subscribe("main-input", EventKind::ReceiveNodeOff, emitValue(EventKind::ReceiveNodeOff));
}

FrequencyNode::FrequencyNode(NodeContext context, NodeSpec nodeSpec)
    : VirtualNode(context, std::move(nodeSpec), NodeKind::Frequency) {}

double FrequencyNode::frequency() const {
    if (dataString("frequencyType", "hz") == "midi") {
        return 440.0 * std::pow(2.0, (dataNumber("frequency", 69.0) - 69.0) / 12.0);
    }
    return dataNumber("frequency", 440.0);
}

void FrequencyNode::render() {
    VirtualNode::render();
    subscribe("main-input", EventKind::ReceiveNodeOn, [this](const Payload&) { emitFrequency(EventKind::ReceiveNodeOn); });
}

void FrequencyNode::applyParameterUpdate(const nlohmann::json& update) {
    VirtualNode::applyParameterUpdate(update);
    if (update.contains("frequency") || update.contains("frequencyType")) emitFrequency(EventKind::ReceiveNodeOn);
}

void FrequencyNode::emitFrequency(EventKind kind) {
    ctx.router.handleConnectedEdges(id(), makeOwnPayload(frequency()), kind, std::nullopt);
}

FunctionNode::FunctionNode(NodeContext context, NodeSpec nodeSpec)
    : VirtualNode(context, std::move(nodeSpec), NodeKind::Function) {}

void FunctionNode::render() {
    VirtualNode::render();
    subscribe("main-input", EventKind::ReceiveNodeOn, [this](const Payload& p) { evaluateAndEmit(p, EventKind::ReceiveNodeOn); });
    subscribe("main-input", EventKind::ReceiveNodeOff, [this](const Payload& p) { evaluateAndEmit(p, EventKind::ReceiveNodeOff); });
    int count = std::clamp(static_cast<int>(dataNumber("numInputs", 2)), 0, kMaxInputs);
    for (int i = 1; i <= count; ++i) {
        subscribe(fmt::format("input-{}", i), EventKind::ReceiveNodeOn, [this, i](const Payload& p) { inputs[i] = p.value; });
    }
}

void FunctionNode::applyParameterUpdate(const nlohmann::json& update) {
    VirtualNode::applyParameterUpdate(update);
    if (update.contains("formula")) {
        formula.reset();
        compileError.clear();
    }
}

const Formula* FunctionNode::compiled() {
    if (formula) return formula.get();
    if (!compileError.empty()) return nullptr;
    try {
        formula = std::make_unique<Formula>(dataString("formula", "main"));
    } catch (const FormulaError& e) {
        compileError = e.what();
        logWarn("{}: formula does not compile: {}", id(), compileError);
    }
    return formula.get();
}

void FunctionNode::evaluateAndEmit(const Payload& trigger, EventKind kind) {
    FormulaVariables vars;
    vars["main"] = hasValue(trigger.value) ? trigger.value : Value{0.0};
    int count = std::clamp(static_cast<int>(dataNumber("numInputs", 2)), 0, kMaxInputs);
    for (int i = 1; i <= count; ++i) {
        auto it = inputs.find(i);
        vars[fmt::format("input{}", i)] = it != inputs.end() ? it->second : Value{0.0};
    }
    const Formula* f = compiled();
    if (!f) {
        ctx.router.handleConnectedEdges(id(), makeOwnPayload(kErrorSentinel), kind, std::nullopt);
        return;
    }
    FormulaResult result;
    try {
        result = f->evaluate(vars);
    } catch (const FormulaError& e) {
        logWarn("{}: formula failed: {}", id(), e.what());
        ctx.router.handleConnectedEdges(id(), makeOwnPayload(kErrorSentinel), kind, std::nullopt);
        return;
    }
    if (!result.isArray) {
        ctx.router.handleConnectedEdges(id(), makeOwnPayload(result.scalar()), kind, std::nullopt);
        return;
    }
    for (size_t i = 0; i < result.items.size(); ++i) {
        ctx.router.handleConnectedEdges(id(), makeOwnPayload(result.items[i]), kind, static_cast<int>(i));
    }
}

EventTransformNode::EventTransformNode(NodeContext context, NodeSpec nodeSpec)
    : VirtualNode(context, std::move(nodeSpec), NodeKind::EventTransform) {}

void EventTransformNode::render() {
    VirtualNode::render();
    subscribe("main-input", EventKind::ReceiveNodeOn, [this](const Payload& p) { transform(p, EventKind::ReceiveNodeOn); });
    subscribe("main-input", EventKind::ReceiveNodeOff, [this](const Payload& p) { transform(p, EventKind::ReceiveNodeOff); });
    std::string listener = dataString("listener", "");
    if (listener.empty()) return;
    auto topic = Topic::parse(listener);
    if (!topic) {
        logWarn("{}: listener '{}' is not a topic", id(), listener);
        return;
    }
    EventKind forwarded = isOffEvent(topic->kind) ? EventKind::ReceiveNodeOff : EventKind::ReceiveNodeOn;
    subscribeTopic(*topic, [this, forwarded](const Payload& p) { transform(p, forwarded); });
}

void EventTransformNode::applyParameterUpdate(const nlohmann::json& update) {
    VirtualNode::applyParameterUpdate(update);
    if (update.contains("formula")) {
        formula.reset();
        compileError.clear();
    }
}

void EventTransformNode::transform(const Payload& trigger, EventKind kind) {
    Value out;
    try {
        if (!formula) {
            if (!compileError.empty()) throw FormulaError(compileError);
            try {
                formula = std::make_unique<Formula>(dataString("formula", "main"));
            } catch (const FormulaError& e) {
                compileError = e.what();
                throw;
            }
        }
        FormulaVariables vars;
        vars["main"] = hasValue(trigger.value) ? trigger.value : Value{0.0};
        FormulaResult result = formula->evaluate(vars);
        if (!result.items.empty()) out = result.items.front();
    } catch (const FormulaError& e) {
        logWarn("{}: transform failed: {}", id(), e.what());
        out = FunctionNode::kErrorSentinel;
    }
    ctx.router.emitEventsForConnectedEdges(id(), makeOwnPayload(out), kind);
}

LogNode::LogNode(NodeContext context, NodeSpec nodeSpec)
    : VirtualNode(context, std::move(nodeSpec), NodeKind::Log) {}

void LogNode::render() {
    VirtualNode::render();
    subscribe("main-input", EventKind::ReceiveNodeOn, [this](const Payload& p) { record(p, EventKind::ReceiveNodeOn); });
    subscribe("main-input", EventKind::ReceiveNodeOff, [this](const Payload& p) { record(p, EventKind::ReceiveNodeOff); });
}

size_t LogNode::maxEntries() const {
    return static_cast<size_t>(std::max(1.0, dataNumber("maxEntries", 20)));
}

void LogNode::applyParameterUpdate(const nlohmann::json& update) {
    VirtualNode::applyParameterUpdate(update);
    while (history.size() > maxEntries()) history.pop_front();
}

void LogNode::record(const Payload& p, EventKind kind) {
    history.push_back({ctx.scheduler.nowMs(), kind, p.value, p.source});
    while (history.size() > maxEntries()) history.pop_front();
    logInfo("{} [{:.1f}ms] {} {} from {}", id(), ctx.scheduler.nowMs(), eventKindName(kind),
            hasValue(p.value) ? toString(p.value) : std::string("-"), p.source.empty() ? std::string("?") : p.source);
}

SwitchNode::SwitchNode(NodeContext context, NodeSpec nodeSpec)
    : VirtualNode(context, std::move(nodeSpec), NodeKind::Switch), active(static_cast<int>(dataNumber("activeOutput", 0))) {
    if (active < 0 || active >= numOutputs()) active = 0;
}

int SwitchNode::numOutputs() const { return std::max(1, static_cast<int>(dataNumber("numOutputs", 2))); }

void SwitchNode::render() {
    VirtualNode::render();
    subscribe("main-input", EventKind::ReceiveNodeOn, [this](const Payload& p) {
        active = (active + 1) % numOutputs();
        spec.data["activeOutput"] = active;
        Payload out = p;
        out.source = id();
        out.sourceHandle.clear();
        out.activeOutput = active;
        ctx.router.handleSendNodeEventSwitch(id(), out, EventKind::ReceiveNodeOn);
    });
    subscribe("main-input", EventKind::ReceiveNodeOff, [this](const Payload& p) {
        Payload out = p;
        out.source = id();
        out.sourceHandle.clear();
        out.activeOutput = active;
        ctx.router.handleSendNodeEventSwitch(id(), out, EventKind::ReceiveNodeOff);
    });
    subscribe("reset-input", EventKind::ReceiveNodeOn, [this](const Payload&) {
        active = 0;
        spec.data["activeOutput"] = 0;
    });
}

void SwitchNode::applyParameterUpdate(const nlohmann::json& update) {
    VirtualNode::applyParameterUpdate(update);
    if (update.contains("activeOutput")) active = static_cast<int>(dataNumber("activeOutput", 0));
    if (active < 0 || active >= numOutputs()) active = 0;
}

BlockingSwitchNode::BlockingSwitchNode(NodeContext context, NodeSpec nodeSpec)
    : VirtualNode(context, std::move(nodeSpec), NodeKind::BlockingSwitch) {}

int BlockingSwitchNode::numOutputs() const { return std::max(1, static_cast<int>(dataNumber("numOutputs", 2))); }

void BlockingSwitchNode::render() {
    VirtualNode::render();
    for (const char* handle : {"input", "main-input"}) {
        subscribe(handle, EventKind::ReceiveNodeOn, [this](const Payload& p) { handleOn(p); });
        subscribe(handle, EventKind::ReceiveNodeOff, [this](const Payload& p) { handleOff(p); });
    }
    subscribe("reset-input", EventKind::ReceiveNodeOn, [this](const Payload&) { reset(); });
}

void BlockingSwitchNode::applyParameterUpdate(const nlohmann::json& update) {
    int before = numOutputs();
    VirtualNode::applyParameterUpdate(update);
    if (numOutputs() != before) reset();
}

std::string BlockingSwitchNode::allocationKey(const Payload& p) {
    return p.source + "|" + toString(p.value);
}

std::optional<int> BlockingSwitchNode::outputFor(const Payload& p) const {
    auto it = assignments.find(allocationKey(p));
    if (it == assignments.end()) return std::nullopt;
    return it->second;
}

void BlockingSwitchNode::handleOn(const Payload& p) {
    std::string key = allocationKey(p);
    if (assignments.count(key)) {
        logDebug("{}: '{}' already holds output {}", id(), key, assignments[key]);
        return;
    }
    int n = numOutputs();
    int slot = -1;
    for (int i = 0; i < n; ++i) {
        if (!occupied.count(i)) {
            slot = i;
            break;
        }
    }
    if (slot < 0) {
        logDebug("{}: all {} outputs occupied, dropping '{}'", id(), n, key);
        return;
    }
    assignments[key] = slot;
    occupied.insert(slot);
    Payload out = p;
    out.source = id();
    out.sourceHandle.clear();
    ctx.router.emitEventsFromOutput(id(), slot, out, EventKind::ReceiveNodeOn);
}

void BlockingSwitchNode::handleOff(const Payload& p) {
    auto it = assignments.find(allocationKey(p));
    if (it == assignments.end()) return;
    int slot = it->second;
    assignments.erase(it);
    occupied.erase(slot);
    Payload out = p;
    out.source = id();
    out.sourceHandle.clear();
    ctx.router.emitEventsFromOutput(id(), slot, out, EventKind::ReceiveNodeOff);
}

void BlockingSwitchNode::reset() {
    std::set<int> held;
    held.swap(occupied);
    assignments.clear();
    for (int slot : held) {
        ctx.router.emitEventsFromOutput(id(), slot, makeOwnPayload(Value{}), EventKind::ReceiveNodeOff);
    }
}

SpeedDividerNode::SpeedDividerNode(NodeContext context, NodeSpec nodeSpec)
    : VirtualNode(context, std::move(nodeSpec), NodeKind::SpeedDivider) {}

int SpeedDividerNode::divider() const { return std::clamp(static_cast<int>(dataNumber("divider", 1)), 1, 10); }

int SpeedDividerNode::multiplier() const { return std::clamp(static_cast<int>(dataNumber("multiplier", 1)), 1, 10); }

void SpeedDividerNode::render() {
    VirtualNode::render();
    for (const char* handle : {"input", "main-input"}) {
        subscribe(handle, EventKind::ReceiveNodeOn, [this](const Payload& p) { onHit(p); });
        // Offs pass straight through, whatever the hit count
        subscribe(handle, EventKind::ReceiveNodeOff, [this](const Payload& p) {
            ctx.router.emitEventsForConnectedEdges(id(), makeOwnPayload(p.value), EventKind::ReceiveNodeOff);
        });
    }
    subscribe("divider-input", EventKind::ReceiveNodeOn, [this](const Payload& p) {
        if (auto v = toNumber(p.value)) applyParameterUpdate({{"divider", std::clamp(std::round(*v), 1.0, 10.0)}});
    });
    subscribe("multiplier-input", EventKind::ReceiveNodeOn, [this](const Payload& p) {
        if (auto v = toNumber(p.value)) applyParameterUpdate({{"multiplier", std::clamp(std::round(*v), 1.0, 10.0)}});
    });
}

void SpeedDividerNode::applyParameterUpdate(const nlohmann::json& update) {
    VirtualNode::applyParameterUpdate(update);
    if (update.contains("divider")) hitCount = 0;
    if (update.contains("multiplier")) cancelExtras();
}

void SpeedDividerNode::onDispose() { cancelExtras(); }

void SpeedDividerNode::cancelExtras() {
    for (TimerId& t : extras) cancelTimer(t);
    extras.clear();
}

void SpeedDividerNode::onHit(const Payload& p) {
    double now = ctx.scheduler.nowMs();
    std::optional<double> interval;
    if (lastHitMs) interval = now - *lastHitMs;
    lastHitMs = now;
    cancelExtras();

    if (++hitCount < divider()) return;
    hitCount = 0;

    Payload out = makeOwnPayload(p.value);
    ctx.router.emitEventsForConnectedEdges(id(), out, EventKind::ReceiveNodeOn);

    int mult = multiplier();
    if (mult <= 1) return;
    if (!interval || *interval <= 0.0) {
        for (int i = 1; i < mult; ++i) ctx.router.emitEventsForConnectedEdges(id(), out, EventKind::ReceiveNodeOn);
        return;
    }
    // Spread across the incoming interval so the extras land before the next hit
    double spacing = *interval / mult;
    for (int i = 1; i < mult; ++i) {
        TimerPrecision precision = spacing * i < Scheduler::kFinePollingThresholdMs ? TimerPrecision::Fine : TimerPrecision::Coarse;
        extras.push_back(scheduleTimer(spacing * i, [this, out]() {
            ctx.router.emitEventsForConnectedEdges(id(), out, EventKind::ReceiveNodeOn);
        }, precision));
    }
}

ButtonNode::ButtonNode(NodeContext context, NodeSpec nodeSpec, NodeKind kind)
    : VirtualNode(context, std::move(nodeSpec), kind) {}

void ButtonNode::render() {
    VirtualNode::render();
    subscribe("main-input", EventKind::SendNodeOn, [this](const Payload& p) {
        pressed = true;
        ctx.router.emitEventsForConnectedEdges(id(), makeOwnPayload(p.value), EventKind::ReceiveNodeOn);
    });
    subscribe("main-input", EventKind::SendNodeOff, [this](const Payload& p) {
        pressed = false;
        ctx.router.emitEventsForConnectedEdges(id(), makeOwnPayload(p.value), EventKind::ReceiveNodeOff);
    });
}

void ButtonNode::press() { emitOwn("main-input", EventKind::SendNodeOn, makeOwnPayload(Value{})); }

void ButtonNode::release() { emitOwn("main-input", EventKind::SendNodeOff, makeOwnPayload(Value{})); }

} // namespace SignalFlow
