// ConnectionTracker.cpp
#include "ConnectionTracker.hpp"
#include <algorithm>
#include <cctype>

namespace SignalFlow {

TargetKey ConnectionTracker::targetKey(const NodeId& target, const std::string& handle) {
    return handle.empty() ? target : target + ":" + handle;
}

NodeId ConnectionTracker::targetNode(const TargetKey& key) {
    auto colon = key.rfind(':');
    return colon == std::string::npos ? key : key.substr(0, colon);
}

bool ConnectionTracker::contains(const NodeId& source, const TargetKey& key) const {
    auto it = sourceToTargets.find(source);
    return it != sourceToTargets.end() && it->second.count(key) != 0;
}

bool ConnectionTracker::add(const NodeId& source, const TargetKey& key) {
    if (!sourceToTargets[source].insert(key).second) return false;
    targetToSources[key].insert(source);
    ++pairCount;
    return true;
}

bool ConnectionTracker::remove(const NodeId& source, const TargetKey& key) {
    auto it = sourceToTargets.find(source);
    if (it == sourceToTargets.end() || !it->second.erase(key)) return false;
    if (it->second.empty()) sourceToTargets.erase(it);
    auto back = targetToSources.find(key);
    if (back != targetToSources.end()) {
        back->second.erase(source);
        if (back->second.empty()) targetToSources.erase(back);
    }
    --pairCount;
    return true;
}

size_t ConnectionTracker::removeNode(const NodeId& nodeId) {
    std::vector<std::pair<NodeId, TargetKey>> doomed;
    auto out = sourceToTargets.find(nodeId);
    if (out != sourceToTargets.end()) {
        for (const auto& key : out->second) doomed.emplace_back(nodeId, key);
    }
    for (const auto& kv : targetToSources) {
        if (targetNode(kv.first) != nodeId) continue;
        for (const auto& src : kv.second) doomed.emplace_back(src, kv.first);
    }
    size_t removed = 0;
    for (const auto& d : doomed) {
        if (remove(d.first, d.second)) ++removed;
    }
    return removed;
}

bool ConnectionTracker::references(const NodeId& nodeId) const {
    if (sourceToTargets.count(nodeId)) return true;
    for (const auto& kv : targetToSources) {
        if (targetNode(kv.first) == nodeId) return true;
    }
    return false;
}

std::vector<TargetKey> ConnectionTracker::targetsOf(const NodeId& source) const {
    auto it = sourceToTargets.find(source);
    if (it == sourceToTargets.end()) return {};
    return {it->second.begin(), it->second.end()};
}

std::vector<NodeId> ConnectionTracker::sourcesOf(const TargetKey& key) const {
    auto it = targetToSources.find(key);
    if (it == targetToSources.end()) return {};
    return {it->second.begin(), it->second.end()};
}

void ConnectionTracker::clear() {
    sourceToTargets.clear();
    targetToSources.clear();
    pairCount = 0;
}

bool EdgeIndex::isResetHandle(const std::string& handle) {
    std::string lower(handle.size(), '\0');
    std::transform(handle.begin(), handle.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("reset") != std::string::npos;
}

bool EdgeIndex::insert(const Edge& edge) {
    auto& list = bySource[edge.source];
    if (std::find(list.begin(), list.end(), edge) != list.end()) return false;
    if (isResetHandle(edge.targetHandle)) {
        // After the existing reset edges, before everything else
        auto pos = std::find_if(list.begin(), list.end(), [](const Edge& e) { return !isResetHandle(e.targetHandle); });
        list.insert(pos, edge);
    } else {
        list.push_back(edge);
    }
    return true;
}

bool EdgeIndex::erase(const Edge& edge) {
    auto it = bySource.find(edge.source);
    if (it == bySource.end()) return false;
    auto& list = it->second;
    auto pos = std::find(list.begin(), list.end(), edge);
    if (pos == list.end()) return false;
    list.erase(pos);
    if (list.empty()) bySource.erase(it);
    return true;
}

void EdgeIndex::eraseNode(const NodeId& nodeId) {
    bySource.erase(nodeId);
    for (auto it = bySource.begin(); it != bySource.end();) {
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(), [&](const Edge& e) { return e.target == nodeId; }), list.end());
        if (list.empty()) it = bySource.erase(it); else ++it;
    }
}

const std::vector<Edge>& EdgeIndex::edgesFrom(const NodeId& source) const {
    static const std::vector<Edge> empty;
    auto it = bySource.find(source);
    return it == bySource.end() ? empty : it->second;
}

bool EdgeIndex::contains(const Edge& edge) const {
    const auto& list = edgesFrom(edge.source);
    return std::find(list.begin(), list.end(), edge) != list.end();
}

size_t EdgeIndex::size() const {
    size_t n = 0;
    for (const auto& kv : bySource) n += kv.second.size();
    return n;
}

} // namespace SignalFlow
