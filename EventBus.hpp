// EventBus.hpp
//
// Topic-keyed publish/subscribe used as the control plane between node
// instances. Emission is synchronous and depth-first: emit() returns only
// after every handler (and everything those handlers emitted) has run. There
// is no queueing and no replay; an emit with no subscribers is dropped.
#pragma once
#include "GraphTypes.hpp"
#include <functional>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace SignalFlow {

using EventHandler = std::function<void(const Payload&)>;
using SubscriptionId = unsigned long long;

class EventBus {
public:
    // Re-entrant emits deeper than this are dropped (cyclic control graphs)
    static constexpr unsigned kMaxEmitDepth = 64;

    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriptionId subscribe(const Topic& topic, EventHandler handler);
    // Removes one handler; returns false when it was not subscribed to topic
    bool unsubscribe(const Topic& topic, SubscriptionId id);
    void unsubscribeAll(const Topic& topic);
    // Removes every topic whose node id equals nodeId exactly
    void unsubscribeAllByNodeId(const NodeId& nodeId);

    void emit(const Topic& topic, const Payload& payload);

    size_t subscriberCount(const Topic& topic) const;
    std::vector<Topic> topics() const;
    size_t size() const { return live.size(); }

    struct Stats {
        unsigned long long emitted = 0;
        unsigned long long delivered = 0;
        unsigned long long dropped = 0;     // no subscribers
        unsigned long long handlerErrors = 0;
        unsigned long long depthExceeded = 0;
    };
    Stats getAndResetStats() {
        Stats out = stats;
        stats = Stats{};
        return out;
    }

private:
    struct Entry {
        SubscriptionId id;
        std::shared_ptr<EventHandler> handler;
    };
    std::unordered_map<Topic, std::vector<Entry>, TopicHash> subscribers;
    std::unordered_set<SubscriptionId> live;
    SubscriptionId nextId = 1;
    unsigned depth = 0;
    Stats stats;
};

} // namespace SignalFlow
