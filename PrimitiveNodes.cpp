// PrimitiveNodes.cpp
#include "PrimitiveNodes.hpp"
#include "Log.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <sstream>

namespace SignalFlow {

namespace {
// Node data keys that only matter to editors
const std::set<std::string>& presentationKeys() {
    static const std::set<std::string> keys = {"label", "style", "color", "collapsed", "selected", "knobValue"};
    return keys;
}
}

PrimitiveNode::PrimitiveNode(NodeContext context, NodeSpec nodeSpec, NodeKind kind, std::string primitiveKindName)
    : VirtualNode(context, std::move(nodeSpec), kind), primitiveKind(std::move(primitiveKindName)) {}

void PrimitiveNode::render() {
    VirtualNode::render();
    createPrimitive();
}

bool PrimitiveNode::createPrimitive() {
    try {
        primitive = ctx.engine.createPrimitive(primitiveKind, primitiveOptions());
        return true;
    } catch (const std::exception& e) {
        logWarn("{}: could not create {} primitive: {}", id(), primitiveKind, e.what());
        primitive = kNoPrimitive;
        return false;
    }
}

nlohmann::json PrimitiveNode::primitiveOptions() const {
    nlohmann::json options = nlohmann::json::object();
    for (const auto& item : spec.data.items()) {
        if (presentationKeys().count(item.key())) continue;
        options[item.key()] = item.value();
    }
    if (options.contains("frequency") && options["frequency"].is_number()) {
        double f = std::clamp(options["frequency"].get<double>(), kMinFrequency, kMaxFrequency);
        options["frequency"] = std::round(f * 100.0) / 100.0;
    }
    if (options.contains("Q") && options["Q"].is_number()) {
        options["Q"] = std::clamp(options["Q"].get<double>(), kMinQ, kMaxQ);
    }
    return options;
}

const std::set<std::string>& PrimitiveNode::rebuildKeys() const {
    static const std::set<std::string> none;
    return none;
}

void PrimitiveNode::applyParameterUpdate(const nlohmann::json& update) {
    bool needsRebuild = false;
    for (const auto& item : update.items()) {
        if (!rebuildKeys().count(item.key())) continue;
        auto current = spec.data.find(item.key());
        if (current == spec.data.end() || *current != item.value()) needsRebuild = true;
    }
    VirtualNode::applyParameterUpdate(update);
    if (needsRebuild) {
        rebuild();
        return;
    }
    if (primitive == kNoPrimitive) return;
    for (const auto& item : update.items()) {
        if (presentationKeys().count(item.key())) continue;
        try {
            applyKey(item.key(), item.value());
        } catch (const std::exception& e) {
            logWarn("{}: applying '{}' failed: {}", id(), item.key(), e.what());
        }
    }
}

void PrimitiveNode::applyKey(const std::string& key, const nlohmann::json& value) {
    if (value.is_number() && ctx.engine.hasParam(primitive, key)) {
        setParam(key, value.get<double>());
        return;
    }
    ctx.engine.setProperty(primitive, key, value);
}

void PrimitiveNode::setParam(const std::string& param, double value) {
    if (param == "Q") {
        ctx.engine.setParamValue(primitive, param, std::clamp(value, kMinQ, kMaxQ));
        return;
    }
    if (param != "frequency") {
        ctx.engine.setParamValue(primitive, param, value);
        return;
    }
    double target = std::round(std::clamp(value, kMinFrequency, kMaxFrequency) * 100.0) / 100.0;
    double now = ctx.engine.currentTime();
    double current = ctx.engine.paramValue(primitive, param);
    if (current > 0.0 && std::fabs(target - current) / current < 0.0005) return;
    // Short ramp to avoid zipper noise; big jumps get an intermediate step
    ctx.engine.cancelScheduledValues(primitive, param, now);
    ctx.engine.setValueAtTime(primitive, param, current, now);
    double lo = std::max(std::min(target, current), kMinFrequency);
    double hi = std::max(target, current);
    if (hi / lo > 4.0) {
        ctx.engine.linearRampToValueAtTime(primitive, param, current + (target - current) * 0.4, now + kFrequencyRampSec * 0.4);
    }
    ctx.engine.linearRampToValueAtTime(primitive, param, target, now + kFrequencyRampSec);
}

void PrimitiveNode::rebuild() {
    PrimitiveHandle previous = primitive;
    if (!createPrimitive()) {
        primitive = previous;
        logWarn("{}: keeping the current {} primitive", id(), primitiveKind);
        return;
    }
    if (previous != kNoPrimitive) {
        try {
            ctx.engine.disconnect(previous);
            ctx.engine.releasePrimitive(previous);
        } catch (const std::exception& e) {
            logWarn("{}: releasing primitive before rebuild failed: {}", id(), e.what());
        }
    }
    logDebug("{}: rebuilt {} primitive as {}", id(), primitiveKind, primitive);
    ctx.router.resetConnectionsOfNode(id());
}

OscillatorNode::OscillatorNode(NodeContext context, NodeSpec nodeSpec)
    : PrimitiveNode(context, std::move(nodeSpec), NodeKind::Oscillator, "oscillator") {}

const std::set<std::string>& OscillatorNode::rebuildKeys() const {
    static const std::set<std::string> keys = {"type", "pulseWidth", "periodicWaveHarmonics"};
    return keys;
}

GainNode::GainNode(NodeContext context, NodeSpec nodeSpec)
    : PrimitiveNode(context, std::move(nodeSpec), NodeKind::Gain, "gain") {}

BiquadFilterNode::BiquadFilterNode(NodeContext context, NodeSpec nodeSpec)
    : PrimitiveNode(context, std::move(nodeSpec), NodeKind::BiquadFilter, "biquad") {}

nlohmann::json BiquadFilterNode::primitiveOptions() const {
    nlohmann::json options = PrimitiveNode::primitiveOptions();
    if (options.contains("filterType")) {
        options["type"] = options["filterType"];
        options.erase("filterType");
    }
    return options;
}

void BiquadFilterNode::applyKey(const std::string& key, const nlohmann::json& value) {
    if (key == "filterType") {
        ctx.engine.setProperty(primitive, "type", value);
        return;
    }
    PrimitiveNode::applyKey(key, value);
}

DelayNode::DelayNode(NodeContext context, NodeSpec nodeSpec)
    : PrimitiveNode(context, std::move(nodeSpec), NodeKind::Delay, "delay") {}

double DelayNode::declaredBase(const std::string& param) const {
    if (param == "delayTime") return dataNumber("delayTime", 1000.0) / 1000.0;
    return PrimitiveNode::declaredBase(param);
}

nlohmann::json DelayNode::primitiveOptions() const {
    nlohmann::json options = PrimitiveNode::primitiveOptions();
    if (options.contains("delayTime") && options["delayTime"].is_number()) {
        options["delayTime"] = options["delayTime"].get<double>() / 1000.0;
    }
    return options;
}

void DelayNode::applyKey(const std::string& key, const nlohmann::json& value) {
    if (key == "delayTime" && value.is_number()) {
        setParam("delayTime", value.get<double>() / 1000.0);
        return;
    }
    PrimitiveNode::applyKey(key, value);
}

CompressorNode::CompressorNode(NodeContext context, NodeSpec nodeSpec)
    : PrimitiveNode(context, std::move(nodeSpec), NodeKind::Compressor, "compressor") {}

DistortionNode::DistortionNode(NodeContext context, NodeSpec nodeSpec)
    : PrimitiveNode(context, std::move(nodeSpec), NodeKind::Distortion, "waveshaper") {}

std::vector<double> DistortionNode::parseCurve(const std::string& text) {
    std::vector<double> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto n = toNumber(Value{item});
        if (!n) {
            // tolerate surrounding whitespace
            auto first = item.find_first_not_of(" \t");
            auto last = item.find_last_not_of(" \t");
            if (first != std::string::npos) n = toNumber(Value{item.substr(first, last - first + 1)});
        }
        if (n) out.push_back(*n);
    }
    return out;
}

nlohmann::json DistortionNode::primitiveOptions() const {
    nlohmann::json options = nlohmann::json::object();
    options["curve"] = parseCurve(dataString("curve", ""));
    options["oversample"] = dataString("oversample", "none");
    return options;
}

void DistortionNode::applyKey(const std::string& key, const nlohmann::json& value) {
    if (key == "curve" && value.is_string()) {
        ctx.engine.setProperty(primitive, "curve", parseCurve(value.get<std::string>()));
        return;
    }
    PrimitiveNode::applyKey(key, value);
}

ReverbNode::ReverbNode(NodeContext context, NodeSpec nodeSpec)
    : PrimitiveNode(context, std::move(nodeSpec), NodeKind::Reverb, "convolver") {}

nlohmann::json ReverbNode::impulse() const {
    return nlohmann::json{{"seconds", std::max(0.01, dataNumber("seconds", 3.0))},
                          {"decay", std::max(0.0, dataNumber("decay", 2.0))},
                          {"reverse", dataBool("reverse", false)}};
}

nlohmann::json ReverbNode::primitiveOptions() const {
    return nlohmann::json{{"impulse", impulse()}, {"normalize", dataBool("normalize", true)}};
}

void ReverbNode::applyKey(const std::string& key, const nlohmann::json& value) {
    if (key == "seconds" || key == "decay" || key == "reverse") {
        ctx.engine.setProperty(primitive, "impulse", impulse());
        return;
    }
    PrimitiveNode::applyKey(key, value);
}

WorkletNode::WorkletNode(NodeContext context, NodeSpec nodeSpec)
    : PrimitiveNode(context, std::move(nodeSpec), NodeKind::Worklet, "worklet") {}

nlohmann::json WorkletNode::primitiveOptions() const {
    nlohmann::json params = nlohmann::json::object();
    auto declared = spec.data.find("parameters");
    if (declared != spec.data.end() && declared->is_object()) {
        for (const auto& item : declared->items()) {
            double def = item.value().is_number() ? item.value().get<double>() : 0.0;
            params[item.key()] = dataNumber(item.key(), def);
        }
    }
    int inputs = 1;
    auto names = spec.data.find("inputs");
    if (names != spec.data.end() && names->is_array() && !names->empty()) inputs = static_cast<int>(names->size());
    return nlohmann::json{{"processor", dataString("processor", "")}, {"parameters", params}, {"inputs", inputs}};
}

void WorkletNode::render() {
    PrimitiveNode::render();
    auto declared = spec.data.find("parameters");
    if (declared == spec.data.end() || !declared->is_object()) return;
    // Control-rate handles: values arrive as events, never as signal connections
    for (const auto& item : declared->items()) {
        std::string name = item.key();
        subscribe("param-flow-" + name, EventKind::ReceiveNodeOn, [this, name](const Payload& p) {
            auto v = toNumber(p.value);
            if (!v || primitive == kNoPrimitive) return;
            spec.data[name] = *v;
            setParam(name, *v);
        });
    }
}

std::optional<int> WorkletNode::namedInputIndex(const std::string& handle) const {
    auto names = spec.data.find("inputs");
    if (names == spec.data.end() || !names->is_array()) return std::nullopt;
    for (size_t i = 0; i < names->size(); ++i) {
        const auto& n = (*names)[i];
        if (n.is_string() && n.get<std::string>() == handle) return static_cast<int>(i);
    }
    return std::nullopt;
}

std::optional<std::string> WorkletNode::automatableParam(const std::string& handle) const {
    static const std::string flow = "param-flow-";
    static const std::string stream = "param-stream-";
    static const std::string plain = "param-";
    if (handle.compare(0, flow.size(), flow) == 0) return std::nullopt;
    std::string name = handle;
    if (handle.compare(0, stream.size(), stream) == 0) name = handle.substr(stream.size());
    else if (handle.compare(0, plain.size(), plain) == 0) name = handle.substr(plain.size());
    return PrimitiveNode::automatableParam(name);
}

double WorkletNode::declaredBase(const std::string& param) const {
    double def = 1.0;
    auto declared = spec.data.find("parameters");
    if (declared != spec.data.end() && declared->is_object()) {
        auto p = declared->find(param);
        if (p != declared->end() && p->is_number()) def = p->get<double>();
    }
    return dataNumber(param, def);
}

void WorkletNode::applyKey(const std::string& key, const nlohmann::json& value) {
    if (key == "parameters" || key == "inputs" || key == "processor") return;
    PrimitiveNode::applyKey(key, value);
}

NoiseNode::NoiseNode(NodeContext context, NodeSpec nodeSpec)
    : PrimitiveNode(context, std::move(nodeSpec), NodeKind::Noise, "noise") {}

std::string NoiseNode::noiseType(const std::string& requested) {
    static const std::set<std::string> known = {"white", "pink", "brown", "blue", "violet", "gray"};
    return known.count(requested) ? requested : "white";
}

nlohmann::json NoiseNode::primitiveOptions() const {
    return nlohmann::json{{"gain", std::clamp(dataNumber("gain", 1.0), 0.0, 4.0)},
                          {"noiseType", noiseType(dataString("noiseType", "white"))}};
}

void NoiseNode::applyKey(const std::string& key, const nlohmann::json& value) {
    if (key == "noiseType") {
        ctx.engine.setProperty(primitive, key, noiseType(value.is_string() ? value.get<std::string>() : ""));
        return;
    }
    if (key == "gain" && value.is_number()) {
        setParam("gain", std::clamp(value.get<double>(), 0.0, 4.0));
        return;
    }
    PrimitiveNode::applyKey(key, value);
}

IirFilterNode::IirFilterNode(NodeContext context, NodeSpec nodeSpec)
    : PrimitiveNode(context, std::move(nodeSpec), NodeKind::IirFilter, "iir") {}

std::vector<double> IirFilterNode::coefficients(const std::string& key) const {
    std::vector<double> out;
    auto it = spec.data.find(key);
    if (it != spec.data.end() && it->is_array()) {
        for (const auto& v : *it) {
            if (v.is_number()) out.push_back(v.get<double>());
            else if (v.is_string()) {
                if (auto n = toNumber(Value{v.get<std::string>()})) out.push_back(*n);
            }
        }
    }
    if (out.empty()) out = key == "feedback" ? std::vector<double>{1.0, -0.5} : std::vector<double>{0.5, 0.5};
    return out;
}

nlohmann::json IirFilterNode::primitiveOptions() const {
    return nlohmann::json{{"feedforward", coefficients("feedforward")}, {"feedback", coefficients("feedback")}};
}

const std::set<std::string>& IirFilterNode::rebuildKeys() const {
    static const std::set<std::string> keys = {"feedforward", "feedback"};
    return keys;
}

void IirFilterNode::applyKey(const std::string& key, const nlohmann::json& value) {
    if (rebuildKeys().count(key)) return;
    PrimitiveNode::applyKey(key, value);
}

EqualizerNode::EqualizerNode(NodeContext context, NodeSpec nodeSpec)
    : PrimitiveNode(context, std::move(nodeSpec), NodeKind::Equalizer, "gain") {}

nlohmann::json EqualizerNode::primitiveOptions() const {
    return nlohmann::json{{"gain", 1.0}};
}

std::vector<EqualizerNode::Band> EqualizerNode::bands() const {
    std::vector<Band> out;
    auto it = spec.data.find("bands");
    if (it != spec.data.end() && it->is_array()) {
        for (const auto& b : *it) {
            if (!b.is_object()) continue;
            out.push_back(Band{b.value("type", std::string("peaking")), b.value("frequency", 1000.0),
                               b.value("gain", 0.0), b.value("Q", 1.0)});
        }
    }
    if (out.empty()) {
        out = {{"lowshelf", 60.0, 0.0, 1.0},
               {"peaking", 250.0, 0.0, 1.0},
               {"peaking", 1000.0, 0.0, 1.0},
               {"peaking", 4000.0, 0.0, 1.0},
               {"highshelf", 12000.0, 0.0, 1.0}};
    }
    return out;
}

void EqualizerNode::render() {
    PrimitiveNode::render();
    if (primitive == kNoPrimitive) return;
    try {
        output = ctx.engine.createPrimitive("gain", nlohmann::json{{"gain", 1.0}});
    } catch (const std::exception& e) {
        logWarn("{}: could not create output gain: {}", id(), e.what());
        return;
    }
    buildChain();
}

void EqualizerNode::applyBand(PrimitiveHandle filter, const Band& band) {
    ctx.engine.setProperty(filter, "type", band.type);
    ctx.engine.setParamValue(filter, "frequency", std::clamp(band.frequency, kMinFrequency, kMaxFrequency));
    ctx.engine.setParamValue(filter, "gain", band.gain);
    ctx.engine.setParamValue(filter, "Q", std::clamp(band.q, kMinQ, kMaxQ));
}

void EqualizerNode::buildChain() {
    releaseFilters();
    try {
        ctx.engine.disconnect(primitive);
        PrimitiveHandle prev = primitive;
        for (const Band& band : bands()) {
            PrimitiveHandle f = ctx.engine.createPrimitive("biquad", nlohmann::json::object());
            filters.push_back(f);
            applyBand(f, band);
            ctx.engine.connect(prev, f);
            prev = f;
        }
        ctx.engine.connect(prev, output);
    } catch (const std::exception& e) {
        logWarn("{}: building the band chain failed: {}", id(), e.what());
    }
}

void EqualizerNode::releaseFilters() {
    for (PrimitiveHandle f : filters) {
        try {
            ctx.engine.disconnect(f);
            ctx.engine.releasePrimitive(f);
        } catch (const std::exception& e) {
            logWarn("{}: releasing band filter {} failed: {}", id(), f, e.what());
        }
    }
    filters.clear();
}

void EqualizerNode::applyParameterUpdate(const nlohmann::json& update) {
    PrimitiveNode::applyParameterUpdate(update);
    auto it = update.find("bands");
    if (it == update.end() || !it->is_array() || it->empty() || output == kNoPrimitive) return;
    std::vector<Band> next = bands();
    if (next.size() != filters.size()) {
        buildChain();
        return;
    }
    try {
        for (size_t i = 0; i < next.size(); ++i) applyBand(filters[i], next[i]);
    } catch (const std::exception& e) {
        logWarn("{}: band update failed: {}", id(), e.what());
    }
}

void EqualizerNode::applyKey(const std::string& key, const nlohmann::json& value) {
    if (key == "bands") return;
    PrimitiveNode::applyKey(key, value);
}

void EqualizerNode::onDispose() {
    releaseFilters();
    if (output == kNoPrimitive) return;
    try {
        ctx.engine.disconnect(output);
        ctx.engine.releasePrimitive(output);
    } catch (const std::exception& e) {
        logWarn("{}: releasing output gain failed: {}", id(), e.what());
    }
    output = kNoPrimitive;
}

MasterOutNode::MasterOutNode(NodeContext context, NodeSpec nodeSpec)
    : VirtualNode(context, std::move(nodeSpec), NodeKind::MasterOut) {}

OnOffGateNode::OnOffGateNode(NodeContext context, NodeSpec nodeSpec)
    : PrimitiveNode(context, std::move(nodeSpec), NodeKind::OnOffGate, "gain"), open(dataBool("isOn", false)) {}

nlohmann::json OnOffGateNode::primitiveOptions() const {
    return nlohmann::json{{"gain", open ? 1.0 : 0.0}};
}

void OnOffGateNode::render() {
    PrimitiveNode::render();
    subscribe("toggle-input", EventKind::ReceiveNodeOn, [this](const Payload&) { setOpen(!open); });
    auto forward = [this](EventKind kind) {
        return [this, kind](const Payload& p) {
            if (!open) return;
            Payload out = p;
            out.source = id();
            out.sourceHandle.clear();
            ctx.router.emitEventsForConnectedEdges(id(), out, kind);
        };
    };
    subscribe("main-input", EventKind::ReceiveNodeOn, forward(EventKind::ReceiveNodeOn));
    subscribe("main-input", EventKind::ReceiveNodeOff, forward(EventKind::ReceiveNodeOff));
}

void OnOffGateNode::applyKey(const std::string& key, const nlohmann::json& value) {
    if (key == "isOn") {
        if (value.is_boolean()) setOpen(value.get<bool>());
        return;
    }
    PrimitiveNode::applyKey(key, value);
}

void OnOffGateNode::setOpen(bool value) {
    open = value;
    spec.data["isOn"] = value;
    if (primitive == kNoPrimitive) return;
    try {
        ctx.engine.setParamValue(primitive, "gain", open ? 1.0 : 0.0);
    } catch (const std::exception& e) {
        logWarn("{}: gate gain update failed: {}", id(), e.what());
    }
}

} // namespace SignalFlow
