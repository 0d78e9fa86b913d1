// ControlNodes.hpp
//
// Control-only node kinds. None of them owns an engine primitive; they react
// to events on their own topics and emit through the EdgeRouter.
#pragma once
#include "Formula.hpp"
#include "VirtualNode.hpp"
#include <deque>
#include <map>
#include <memory>
#include <set>

namespace SignalFlow {

class ConstantNode : public VirtualNode {
public:
    ConstantNode(NodeContext context, NodeSpec spec);
    void render() override;
};

class FrequencyNode : public VirtualNode {
public:
    FrequencyNode(NodeContext context, NodeSpec spec);
    void render() override;
    void applyParameterUpdate(const nlohmann::json& update) override;
    // Hz; data.frequency is a MIDI note number when frequencyType is "midi"
    double frequency() const;

private:
    void emitFrequency(EventKind kind);
};

// Evaluates a user formula with main (the triggering value) and input1..N
// (last values seen on input-1..input-N).
class FunctionNode : public VirtualNode {
public:
    static constexpr int kMaxInputs = 16;
    static inline const std::string kErrorSentinel = "Error";

    FunctionNode(NodeContext context, NodeSpec spec);
    void render() override;
    void applyParameterUpdate(const nlohmann::json& update) override;

private:
    void evaluateAndEmit(const Payload& trigger, EventKind kind);
    const Formula* compiled();

    std::map<int, Value> inputs;
    std::unique_ptr<Formula> formula;
    std::string compileError;
};

// Applies a formula to events from its main input or from a listened topic
class EventTransformNode : public VirtualNode {
public:
    EventTransformNode(NodeContext context, NodeSpec spec);
    void render() override;
    void applyParameterUpdate(const nlohmann::json& update) override;

private:
    void transform(const Payload& trigger, EventKind kind);

    std::unique_ptr<Formula> formula;
    std::string compileError;
};

class LogNode : public VirtualNode {
public:
    struct Entry {
        double timeMs;
        EventKind kind;
        Value value;
        NodeId source;
    };

    LogNode(NodeContext context, NodeSpec spec);
    void render() override;
    void applyParameterUpdate(const nlohmann::json& update) override;
    const std::deque<Entry>& entries() const { return history; }

private:
    void record(const Payload& p, EventKind kind);
    size_t maxEntries() const;

    std::deque<Entry> history;
};

// Round-robin exclusive router: each trigger advances activeOutput and
// routes only to that output.
class SwitchNode : public VirtualNode {
public:
    SwitchNode(NodeContext context, NodeSpec spec);
    void render() override;
    void applyParameterUpdate(const nlohmann::json& update) override;
    int activeOutput() const { return active; }

private:
    int numOutputs() const;

    int active;
};

// Slot allocator. Each distinct (source, value) "on" gets the first free
// output and keeps it until the matching "off"; when every output is
// occupied further "on" events are dropped.
class BlockingSwitchNode : public VirtualNode {
public:
    BlockingSwitchNode(NodeContext context, NodeSpec spec);
    void render() override;
    void applyParameterUpdate(const nlohmann::json& update) override;

    int numOutputs() const;
    const std::set<int>& occupiedOutputs() const { return occupied; }
    std::optional<int> outputFor(const Payload& p) const;
    void reset();

private:
    static std::string allocationKey(const Payload& p);
    void handleOn(const Payload& p);
    void handleOff(const Payload& p);

    std::map<std::string, int> assignments;
    std::set<int> occupied;
};

// Forwards every divider-th trigger; with multiplier > 1 adds evenly spaced
// extra triggers across the measured input interval.
class SpeedDividerNode : public VirtualNode {
public:
    SpeedDividerNode(NodeContext context, NodeSpec spec);
    void render() override;
    void applyParameterUpdate(const nlohmann::json& update) override;

    int divider() const;
    int multiplier() const;

protected:
    void onDispose() override;

private:
    void onHit(const Payload& p);
    void cancelExtras();

    int hitCount = 0;
    std::optional<double> lastHitMs;
    std::vector<TimerId> extras;
};

// Manual trigger. Whatever sends on its main-input (a key binding, a
// mouse press, press()/release()) reaches the connected edges as on/off.
class ButtonNode : public VirtualNode {
public:
    ButtonNode(NodeContext context, NodeSpec spec, NodeKind kind = NodeKind::Button);
    void render() override;

    void press();
    void release();
    bool isPressed() const { return pressed; }

private:
    bool pressed = false;
};

} // namespace SignalFlow
