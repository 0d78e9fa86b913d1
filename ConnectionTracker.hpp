// ConnectionTracker.hpp
//
// Bookkeeping owned by the graph manager:
// - ConnectionTracker records which engine-level wirings are live, keyed by
//   (source node, TargetKey). A TargetKey is either "<nodeId>" for signal
//   connections or "<nodeId>:<handle>" for parameter and named-input
//   connections. A pair is recorded at most once; this is the only place the
//   dedup rule lives.
// - EdgeIndex is the control-routing view: resolved edges keyed by their
//   (post-remap) source, with edges into reset handles ordered first.
#pragma once
#include "GraphTypes.hpp"
#include <set>
#include <unordered_map>
#include <vector>

namespace SignalFlow {

using TargetKey = std::string;

class ConnectionTracker {
public:
    static TargetKey targetKey(const NodeId& target, const std::string& handle = {});
    // Node id part of a TargetKey
    static NodeId targetNode(const TargetKey& key);

    bool contains(const NodeId& source, const TargetKey& key) const;
    // False when the pair was already present
    bool add(const NodeId& source, const TargetKey& key);
    bool remove(const NodeId& source, const TargetKey& key);
    // Prune every pair where nodeId is the source or the target node
    size_t removeNode(const NodeId& nodeId);
    bool references(const NodeId& nodeId) const;

    std::vector<TargetKey> targetsOf(const NodeId& source) const;
    std::vector<NodeId> sourcesOf(const TargetKey& key) const;
    size_t size() const { return pairCount; }
    void clear();

private:
    std::unordered_map<NodeId, std::set<TargetKey>> sourceToTargets;
    std::unordered_map<TargetKey, std::set<NodeId>> targetToSources;
    size_t pairCount = 0;
};

class EdgeIndex {
public:
    static bool isResetHandle(const std::string& handle);

    // Inserts under edge.source; false for a duplicate 4-tuple
    bool insert(const Edge& edge);
    bool erase(const Edge& edge);
    // Drops the node's own list and every edge that targets it
    void eraseNode(const NodeId& nodeId);
    const std::vector<Edge>& edgesFrom(const NodeId& source) const;
    bool contains(const Edge& edge) const;
    size_t size() const;
    void clear() { bySource.clear(); }

private:
    std::unordered_map<NodeId, std::vector<Edge>> bySource;
};

} // namespace SignalFlow
