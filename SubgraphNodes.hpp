// SubgraphNodes.hpp
//
// Template instances and their boundary markers. An instance owns nothing
// itself: its expansion (internal nodes and edges) is registered in the graph
// manager under "<instanceId>.<localId>". The markers carry control events
// across the boundary; audio wiring crosses it through edge remapping.
#pragma once
#include "VirtualNode.hpp"
#include <map>
#include <vector>

namespace SignalFlow {

// Inside a template: receives what the instance forwards to input-<index>
class InputMarkerNode : public VirtualNode {
public:
    InputMarkerNode(NodeContext context, NodeSpec spec);
    void render() override;
    int index() const;
};

// Inside a template: re-emits what it receives as <parent>.output-<index>
class OutputMarkerNode : public VirtualNode {
public:
    OutputMarkerNode(NodeContext context, NodeSpec spec);
    void render() override;
    int index() const;

private:
    void forward(const Payload& p, EventKind kind);
};

struct TemplateExpansion {
    std::string templateName;
    std::vector<NodeId> nodeIds;   // namespaced, creation order
    std::vector<Edge> edges;       // namespaced
    std::map<int, NodeId> inputMarkers;
    std::map<int, NodeId> outputMarkers;
};

class TemplateInstanceNode : public VirtualNode {
public:
    TemplateInstanceNode(NodeContext context, NodeSpec spec, TemplateExpansion expansion);
    void render() override;

    const TemplateExpansion& expansion() const { return contents; }
    const std::string& templateName() const { return contents.templateName; }
    std::optional<NodeId> findInputMarker(int index) const;
    std::optional<NodeId> findOutputMarker(int index) const;

private:
    TemplateExpansion contents;
};

} // namespace SignalFlow
