// SchedulingNodes.hpp
//
// Nodes whose behavior unfolds over time: envelopes and automation curves
// that write parameter timelines on their targets, and the clock and
// sequencer that drive other nodes from scheduler timers.
#pragma once
#include "VirtualNode.hpp"
#include <vector>

namespace SignalFlow {

struct AdsrParams {
    double attack = 0.1;        // seconds
    double sustainTime = 0.5;   // seconds
    double sustainLevel = 0.7;  // fraction of the min..max span
    double release = 0.3;       // seconds
    double minPercent = 0.0;
    double maxPercent = 100.0;

    static AdsrParams fromJson(const nlohmann::json& data);
};

// Envelope segments written onto one parameter target. "now" is engine time.
void scheduleEnvelopeAttack(AudioEngine& engine, const ParamTarget& target, const AdsrParams& params, double now);
void scheduleEnvelopeRelease(AudioEngine& engine, const ParamTarget& target, const AdsrParams& params, double now);

class AdsrNode : public VirtualNode {
public:
    AdsrNode(NodeContext context, NodeSpec spec);
    void render() override;
    void applyParameterUpdate(const nlohmann::json& update) override;

    void noteOn();
    void noteOff();
    bool isOn() const { return on; }
    const AdsrParams& params() const { return adsr; }

private:
    AdsrParams adsr;
    bool on = false;
};

struct AutomationPoint {
    double x; // 0..1 along lengthSec
    double y; // 0 = top of range (max), 1 = bottom (min)
};

class AutomationNode : public VirtualNode {
public:
    static constexpr double kMinLengthSec = 0.01;

    AutomationNode(NodeContext context, NodeSpec spec);
    void render() override;

    void start();
    void stop();
    std::vector<AutomationPoint> points() const;
    double lengthSec() const;

protected:
    void onDispose() override;

private:
    void writeCurves();

    TimerId loopTimer = kNoTimer;
    bool running = false;
};

// BPM clock. Tick n is due at start + n * interval, so timer lateness never
// accumulates. A tempo change bridges the current beat proportionally and
// then re-anchors.
class ClockNode : public VirtualNode {
public:
    static constexpr double kMinBridgeMs = 5.0;

    ClockNode(NodeContext context, NodeSpec spec);
    void render() override;
    void applyParameterUpdate(const nlohmann::json& update) override;

    void start();
    void stop();
    bool isRunning() const { return running; }
    double intervalMs() const;
    long long ticks() const { return tickCount; }

protected:
    void onDispose() override;

private:
    void tick();
    void scheduleNextTick(double delayMs);
    void scheduleOff();
    void emitOff();
    void changeTempo(double oldIntervalMs);

    bool running = false;
    double startMs = 0.0;
    double lastTickMs = 0.0;
    long long tickCount = 0;
    TimerId tickTimer = kNoTimer;
    TimerId offTimer = kNoTimer;
};

// Step sequencer. Each advance moves to the next step and fires an on pulse
// on row-N for every enabled row, followed by an off after that step's pulse
// length. Wrapping to step 0 fires a sync pulse.
class SequencerNode : public VirtualNode {
public:
    static constexpr int kMaxSquares = 128;
    static constexpr int kMaxRows = 25;
    static constexpr double kMinPulseMs = 1.0;
    static constexpr double kMaxPulseMs = 5000.0;

    SequencerNode(NodeContext context, NodeSpec spec);
    void render() override;
    void applyParameterUpdate(const nlohmann::json& update) override;

    void advance();
    void reset();
    int activeIndex() const { return active; }
    int squares() const;
    int rows() const;
    bool cell(int row, int step) const;
    double pulseMs(int step) const;

protected:
    SequencerNode(NodeContext context, NodeSpec spec, NodeKind kind);
    void onDispose() override;
    // Value carried by the pulse of an active cell
    virtual Value stepValue(int row, int step) const;

private:
    void loadPatterns();
    void pulse(const std::vector<std::string>& handles, const Payload& p, double lengthMs);

    std::vector<std::vector<bool>> patterns;
    int active = -1;
};

// Sequencer whose pulses carry a frequency per cell (data.frequencies, a
// rows x squares grid or a single row). Missing cells play 440 Hz.
class SequencerFrequencyNode : public SequencerNode {
public:
    static constexpr double kDefaultFrequency = 440.0;

    SequencerFrequencyNode(NodeContext context, NodeSpec spec);
    double frequency(int row, int step) const;

protected:
    Value stepValue(int row, int step) const override;
};

} // namespace SignalFlow
