// PrimitiveNodes.hpp
//
// Node kinds that own an engine primitive (oscillator, gain, filters, ...).
// Parameter updates push numeric keys onto the primitive's automatable
// parameters and everything else onto engine properties.
#pragma once
#include "VirtualNode.hpp"
#include <set>
#include <string>

namespace SignalFlow {

class PrimitiveNode : public VirtualNode {
public:
    static constexpr double kMinFrequency = 0.0001;
    static constexpr double kMaxFrequency = 24000.0;
    static constexpr double kMinQ = 0.0001;
    static constexpr double kMaxQ = 1000.0;
    static constexpr double kFrequencyRampSec = 0.010;

    PrimitiveNode(NodeContext context, NodeSpec spec, NodeKind kind, std::string primitiveKind);

    void render() override;
    void applyParameterUpdate(const nlohmann::json& update) override;

    // Replace the primitive and re-resolve this node's connections
    void rebuild();

protected:
    virtual nlohmann::json primitiveOptions() const;
    // Keys whose change cannot be applied in place
    virtual const std::set<std::string>& rebuildKeys() const;
    virtual void applyKey(const std::string& key, const nlohmann::json& value);
    void setParam(const std::string& param, double value);
    bool createPrimitive();

    std::string primitiveKind;
};

class OscillatorNode : public PrimitiveNode {
public:
    OscillatorNode(NodeContext context, NodeSpec spec);
    // Sources have no signal input
    PrimitiveHandle inputPort() const override { return kNoPrimitive; }

protected:
    const std::set<std::string>& rebuildKeys() const override;
};

class GainNode : public PrimitiveNode {
public:
    GainNode(NodeContext context, NodeSpec spec);
};

class BiquadFilterNode : public PrimitiveNode {
public:
    BiquadFilterNode(NodeContext context, NodeSpec spec);

protected:
    nlohmann::json primitiveOptions() const override;
    void applyKey(const std::string& key, const nlohmann::json& value) override;
};

// delayTime is milliseconds in node data and seconds on the primitive
class DelayNode : public PrimitiveNode {
public:
    DelayNode(NodeContext context, NodeSpec spec);
    double declaredBase(const std::string& param) const override;

protected:
    nlohmann::json primitiveOptions() const override;
    void applyKey(const std::string& key, const nlohmann::json& value) override;
};

class CompressorNode : public PrimitiveNode {
public:
    CompressorNode(NodeContext context, NodeSpec spec);
};

class DistortionNode : public PrimitiveNode {
public:
    DistortionNode(NodeContext context, NodeSpec spec);
    // "0,0.5,1" -> [0, 0.5, 1]; malformed entries are skipped
    static std::vector<double> parseCurve(const std::string& text);

protected:
    nlohmann::json primitiveOptions() const override;
    void applyKey(const std::string& key, const nlohmann::json& value) override;
};

class ReverbNode : public PrimitiveNode {
public:
    ReverbNode(NodeContext context, NodeSpec spec);

protected:
    nlohmann::json primitiveOptions() const override;
    void applyKey(const std::string& key, const nlohmann::json& value) override;

private:
    nlohmann::json impulse() const;
};

// Host for a custom processor. data.parameters declares automatable
// parameters, data.inputs names the signal inputs in index order.
class WorkletNode : public PrimitiveNode {
public:
    WorkletNode(NodeContext context, NodeSpec spec);
    void render() override;
    std::optional<int> namedInputIndex(const std::string& handle) const override;
    std::optional<std::string> automatableParam(const std::string& handle) const override;
    double declaredBase(const std::string& param) const override;

protected:
    nlohmann::json primitiveOptions() const override;
    void applyKey(const std::string& key, const nlohmann::json& value) override;
};

// Noise source; data.noiseType picks the color (white, pink, brown, blue,
// violet, gray)
class NoiseNode : public PrimitiveNode {
public:
    NoiseNode(NodeContext context, NodeSpec spec);
    PrimitiveHandle inputPort() const override { return kNoPrimitive; }
    static std::string noiseType(const std::string& requested);

protected:
    nlohmann::json primitiveOptions() const override;
    void applyKey(const std::string& key, const nlohmann::json& value) override;
};

// Coefficients are fixed at creation, so changing them replaces the
// primitive. Rejected coefficients keep the current filter.
class IirFilterNode : public PrimitiveNode {
public:
    IirFilterNode(NodeContext context, NodeSpec spec);
    std::vector<double> coefficients(const std::string& key) const;

protected:
    nlohmann::json primitiveOptions() const override;
    const std::set<std::string>& rebuildKeys() const override;
    void applyKey(const std::string& key, const nlohmann::json& value) override;
};

// Input gain -> one biquad per band -> output gain. data.bands holds
// {type, frequency, gain, Q} objects; a new band count rebuilds the chain
// between the two gains, other band edits apply in place.
class EqualizerNode : public PrimitiveNode {
public:
    struct Band {
        std::string type;
        double frequency;
        double gain;
        double q;
    };

    EqualizerNode(NodeContext context, NodeSpec spec);
    void render() override;
    void applyParameterUpdate(const nlohmann::json& update) override;
    PrimitiveHandle outputPort() const override { return output; }

    std::vector<Band> bands() const;
    const std::vector<PrimitiveHandle>& filterHandles() const { return filters; }

protected:
    nlohmann::json primitiveOptions() const override;
    void applyKey(const std::string& key, const nlohmann::json& value) override;
    void onDispose() override;

private:
    void buildChain();
    void releaseFilters();
    void applyBand(PrimitiveHandle filter, const Band& band);

    std::vector<PrimitiveHandle> filters;
    PrimitiveHandle output = kNoPrimitive;
};

// Terminal sink. It wraps the engine destination and owns no primitive.
class MasterOutNode : public VirtualNode {
public:
    MasterOutNode(NodeContext context, NodeSpec spec);
    PrimitiveHandle inputPort() const override { return ctx.engine.destination(); }
    PrimitiveHandle outputPort() const override { return kNoPrimitive; }
};

// Gate with an audio path: a gain primitive that follows the gate state,
// and control events on main-input that only pass while open.
class OnOffGateNode : public PrimitiveNode {
public:
    OnOffGateNode(NodeContext context, NodeSpec spec);
    void render() override;
    bool isOpen() const { return open; }

protected:
    nlohmann::json primitiveOptions() const override;
    void applyKey(const std::string& key, const nlohmann::json& value) override;

private:
    void setOpen(bool value);
    bool open;
};

} // namespace SignalFlow
