// EventBus.cpp
#include "EventBus.hpp"
#include "Log.hpp"
#include <exception>

namespace SignalFlow {

SubscriptionId EventBus::subscribe(const Topic& topic, EventHandler handler) {
    SubscriptionId id = nextId++;
    subscribers[topic].push_back({id, std::make_shared<EventHandler>(std::move(handler))});
    live.insert(id);
    return id;
}

bool EventBus::unsubscribe(const Topic& topic, SubscriptionId id) {
    auto it = subscribers.find(topic);
    if (it == subscribers.end()) return false;
    auto& list = it->second;
    for (auto e = list.begin(); e != list.end(); ++e) {
        if (e->id == id) {
            list.erase(e);
            live.erase(id);
            if (list.empty()) subscribers.erase(it);
            return true;
        }
    }
    return false;
}

void EventBus::unsubscribeAll(const Topic& topic) {
    auto it = subscribers.find(topic);
    if (it == subscribers.end()) return;
    for (const auto& e : it->second) live.erase(e.id);
    subscribers.erase(it);
}

void EventBus::unsubscribeAllByNodeId(const NodeId& nodeId) {
    for (auto it = subscribers.begin(); it != subscribers.end();) {
        if (it->first.nodeId == nodeId) {
            for (const auto& e : it->second) live.erase(e.id);
            it = subscribers.erase(it);
        } else {
            ++it;
        }
    }
}

void EventBus::emit(const Topic& topic, const Payload& payload) {
    ++stats.emitted;
    auto it = subscribers.find(topic);
    if (it == subscribers.end()) {
        ++stats.dropped;
        return;
    }
    if (depth >= kMaxEmitDepth) {
        ++stats.depthExceeded;
        logError("event bus: emit depth {} exceeded at '{}', dropping (cyclic control graph?)", kMaxEmitDepth, topic.str());
        return;
    }
    // Snapshot: handlers added during this emit are not called, handlers
    // removed during this emit are skipped.
    std::vector<Entry> snapshot = it->second;
    struct DepthGuard {
        unsigned& d;
        explicit DepthGuard(unsigned& v) : d(v) { ++d; }
        ~DepthGuard() { --d; }
    } guard(depth);
    for (const auto& e : snapshot) {
        if (!live.count(e.id)) continue;
        try {
            (*e.handler)(payload);
            ++stats.delivered;
        } catch (const std::exception& ex) {
            ++stats.handlerErrors;
            logError("event bus: handler for '{}' threw: {}", topic.str(), ex.what());
        }
    }
}

size_t EventBus::subscriberCount(const Topic& topic) const {
    auto it = subscribers.find(topic);
    return it == subscribers.end() ? 0 : it->second.size();
}

std::vector<Topic> EventBus::topics() const {
    std::vector<Topic> out;
    out.reserve(subscribers.size());
    for (const auto& kv : subscribers) out.push_back(kv.first);
    return out;
}

} // namespace SignalFlow
