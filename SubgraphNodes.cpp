// SubgraphNodes.cpp
#include "SubgraphNodes.hpp"
#include "Log.hpp"
#include <fmt/core.h>

namespace SignalFlow {

InputMarkerNode::InputMarkerNode(NodeContext context, NodeSpec nodeSpec)
    : VirtualNode(context, std::move(nodeSpec), NodeKind::InputMarker) {}

int InputMarkerNode::index() const { return static_cast<int>(dataNumber("index", 0)); }

void InputMarkerNode::render() {
    VirtualNode::render();
    for (EventKind kind : {EventKind::ReceiveNodeOn, EventKind::ReceiveNodeOff}) {
        subscribe("main-input", kind, [this, kind](const Payload& p) {
            Payload out = p;
            out.source = id();
            out.sourceHandle.clear();
            ctx.router.handleConnectedEdges(id(), out, kind, std::nullopt);
        });
    }
}

OutputMarkerNode::OutputMarkerNode(NodeContext context, NodeSpec nodeSpec)
    : VirtualNode(context, std::move(nodeSpec), NodeKind::OutputMarker) {}

int OutputMarkerNode::index() const { return static_cast<int>(dataNumber("index", 0)); }

void OutputMarkerNode::render() {
    VirtualNode::render();
    for (const char* handle : {"input", "main-input"}) {
        for (EventKind kind : {EventKind::ReceiveNodeOn, EventKind::ReceiveNodeOff}) {
            subscribe(handle, kind, [this, kind](const Payload& p) { forward(p, kind); });
        }
    }
}

void OutputMarkerNode::forward(const Payload& p, EventKind kind) {
    if (parentId().empty()) {
        logDebug("{}: output marker outside a template, dropping {}", id(), eventKindName(kind));
        return;
    }
    Payload out = p;
    out.nodeId = parentId();
    ctx.bus.emit(Topic{parentId(), fmt::format("output-{}", index()), kind}, out);
}

TemplateInstanceNode::TemplateInstanceNode(NodeContext context, NodeSpec nodeSpec, TemplateExpansion expansion)
    : VirtualNode(context, std::move(nodeSpec), NodeKind::Template), contents(std::move(expansion)) {}

std::optional<NodeId> TemplateInstanceNode::findInputMarker(int index) const {
    auto it = contents.inputMarkers.find(index);
    if (it == contents.inputMarkers.end()) return std::nullopt;
    return it->second;
}

std::optional<NodeId> TemplateInstanceNode::findOutputMarker(int index) const {
    auto it = contents.outputMarkers.find(index);
    if (it == contents.outputMarkers.end()) return std::nullopt;
    return it->second;
}

void TemplateInstanceNode::render() {
    VirtualNode::render();
    for (EventKind kind : {EventKind::ReceiveNodeOn, EventKind::ReceiveNodeOff}) {
        for (const auto& marker : contents.inputMarkers) {
            NodeId target = marker.second;
            subscribe(fmt::format("input-{}", marker.first), kind, [this, target, kind](const Payload& p) {
                ctx.bus.emit(Topic{target, "main-input", kind}, p);
            });
        }
        // A trigger on the instance itself reaches every input
        subscribe("main-input", kind, [this, kind](const Payload& p) {
            for (const auto& marker : contents.inputMarkers) ctx.bus.emit(Topic{marker.second, "main-input", kind}, p);
        });
        for (const auto& marker : contents.outputMarkers) {
            int index = marker.first;
            subscribe(fmt::format("output-{}", index), kind, [this, index, kind](const Payload& p) {
                Payload out = p;
                out.source = id();
                out.sourceHandle.clear();
                ctx.router.emitEventsFromOutput(id(), index, out, kind);
            });
        }
    }
}

} // namespace SignalFlow
