// VirtualNode.cpp
#include "VirtualNode.hpp"
#include "Log.hpp"
#include <exception>
#include <memory>

namespace SignalFlow {

VirtualNode::VirtualNode(NodeContext context, NodeSpec nodeSpec, NodeKind kind)
    : ctx(context), spec(std::move(nodeSpec)), nodeKind(kind) {
    if (!spec.data.is_object()) spec.data = nlohmann::json::object();
}

VirtualNode::~VirtualNode() {
    // Owners dispose explicitly so derived onDispose() runs; this is the backstop
    dispose();
}

void VirtualNode::render() {
    subscribe("params", EventKind::UpdateParams, [this](const Payload& p) {
        if (p.data.is_object()) applyParameterUpdate(p.data);
    });
}

double VirtualNode::dataNumber(const std::string& key, double fallback) const {
    auto it = spec.data.find(key);
    if (it == spec.data.end()) return fallback;
    if (it->is_number()) return it->get<double>();
    if (it->is_string()) {
        auto n = toNumber(Value{it->get<std::string>()});
        if (n) return *n;
    }
    return fallback;
}

bool VirtualNode::dataBool(const std::string& key, bool fallback) const {
    auto it = spec.data.find(key);
    if (it == spec.data.end()) return fallback;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_number()) return it->get<double>() != 0.0;
    return fallback;
}

std::string VirtualNode::dataString(const std::string& key, const std::string& fallback) const {
    auto it = spec.data.find(key);
    if (it == spec.data.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

void VirtualNode::applyParameterUpdate(const nlohmann::json& update) {
    for (const auto& item : update.items()) spec.data[item.key()] = item.value();
}

std::optional<int> VirtualNode::namedInputIndex(const std::string&) const { return std::nullopt; }

std::optional<std::string> VirtualNode::automatableParam(const std::string& handle) const {
    if (primitive == kNoPrimitive || handle.empty()) return std::nullopt;
    if (ctx.engine.hasParam(primitive, handle)) return handle;
    return std::nullopt;
}

double VirtualNode::declaredBase(const std::string& param) const { return dataNumber(param, 1.0); }

void VirtualNode::dispose() {
    if (disposed) return;
    disposed = true;
    try {
        onDispose();
    } catch (const std::exception& e) {
        logWarn("{}: dispose hook failed: {}", spec.id, e.what());
    }
    cancelAllTimers();
    for (const auto& sub : subscriptions) ctx.bus.unsubscribe(sub.first, sub.second);
    subscriptions.clear();
    if (primitive != kNoPrimitive) {
        try {
            ctx.engine.disconnect(primitive);
            ctx.engine.releasePrimitive(primitive);
        } catch (const std::exception& e) {
            logWarn("{}: releasing primitive {} failed: {}", spec.id, primitive, e.what());
        }
        primitive = kNoPrimitive;
    }
}

SubscriptionId VirtualNode::subscribe(const std::string& handle, EventKind kind, EventHandler handler) {
    return subscribeTopic(Topic{spec.id, handle, kind}, std::move(handler));
}

SubscriptionId VirtualNode::subscribeTopic(const Topic& topic, EventHandler handler) {
    SubscriptionId sid = ctx.bus.subscribe(topic, std::move(handler));
    subscriptions.emplace_back(topic, sid);
    return sid;
}

TimerId VirtualNode::scheduleTimer(double delayMs, std::function<void()> callback, TimerPrecision precision) {
    auto self = std::make_shared<TimerId>(kNoTimer);
    *self = ctx.scheduler.schedule(delayMs, [this, self, cb = std::move(callback)]() {
        timers.erase(*self);
        cb();
    }, precision);
    timers.insert(*self);
    return *self;
}

void VirtualNode::cancelTimer(TimerId& id) {
    if (id == kNoTimer) return;
    ctx.scheduler.cancel(id);
    timers.erase(id);
    id = kNoTimer;
}

void VirtualNode::cancelAllTimers() {
    for (TimerId t : timers) ctx.scheduler.cancel(t);
    timers.clear();
}

Payload VirtualNode::makeOwnPayload(Value value) const {
    Payload p = makePayload(std::move(value), spec.id);
    p.nodeId = spec.id;
    return p;
}

void VirtualNode::emitOwn(const std::string& handle, EventKind kind, const Payload& payload) {
    ctx.bus.emit(Topic{spec.id, handle, kind}, payload);
}

} // namespace SignalFlow
