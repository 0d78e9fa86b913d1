// OfflineEngine.cpp
#include "OfflineEngine.hpp"
#include <algorithm>
#include <fmt/core.h>

namespace SignalFlow {

namespace {

struct CatalogEntry {
    int inputs;
    std::vector<std::pair<const char*, double>> params;
};

const std::unordered_map<std::string, CatalogEntry>& catalog() {
    static const std::unordered_map<std::string, CatalogEntry> table = {
        {"oscillator", {0, {{"frequency", 440.0}, {"detune", 0.0}}}},
        {"gain", {1, {{"gain", 1.0}}}},
        {"biquad", {1, {{"frequency", 350.0}, {"Q", 1.0}, {"gain", 0.0}, {"detune", 0.0}}}},
        {"delay", {1, {{"delayTime", 0.0}}}},
        {"compressor", {1, {{"threshold", -24.0}, {"knee", 30.0}, {"ratio", 12.0}, {"attack", 0.003}, {"release", 0.25}}}},
        {"waveshaper", {1, {}}},
        {"convolver", {1, {}}},
        {"constant", {0, {{"offset", 1.0}}}},
        {"noise", {0, {{"gain", 1.0}}}},
        {"iir", {1, {}}},
    };
    return table;
}

// Coefficient rules of an IIR filter: 1..20 of each, feedforward not all
// zero, feedback[0] non-zero
void checkIirCoefficients(const nlohmann::json& options) {
    auto coefficients = [&options](const char* name) {
        std::vector<double> out;
        auto it = options.find(name);
        if (it == options.end() || !it->is_array()) throw EngineError(fmt::format("iir: missing {} coefficients", name));
        for (const auto& v : *it) {
            if (!v.is_number()) throw EngineError(fmt::format("iir: {} coefficient is not a number", name));
            out.push_back(v.get<double>());
        }
        if (out.empty() || out.size() > 20) throw EngineError(fmt::format("iir: {} needs 1 to 20 coefficients, got {}", name, out.size()));
        return out;
    };
    auto ff = coefficients("feedforward");
    auto fb = coefficients("feedback");
    if (std::all_of(ff.begin(), ff.end(), [](double c) { return c == 0.0; })) throw EngineError("iir: feedforward coefficients are all zero");
    if (fb.front() == 0.0) throw EngineError("iir: feedback[0] must not be zero");
}

} // namespace

OfflineEngine::OfflineEngine(std::function<double()> clockSeconds) : clock(std::move(clockSeconds)) {
    Primitive dest;
    dest.kind = "destination";
    dest.inputs = 1;
    destinationHandle = nextHandle++;
    primitives.emplace(destinationHandle, std::move(dest));
}

PrimitiveHandle OfflineEngine::createPrimitive(const std::string& kind, const nlohmann::json& options) {
    Primitive p;
    p.kind = kind;
    if (kind == "worklet") {
        // Custom processors declare their own parameters and inputs
        p.inputs = options.contains("inputs") && options["inputs"].is_number_integer() ? options["inputs"].get<int>() : 1;
        if (options.contains("parameters") && options["parameters"].is_object()) {
            for (const auto& item : options["parameters"].items()) {
                Param param;
                param.value = item.value().is_number() ? item.value().get<double>() : 0.0;
                p.params.emplace(item.key(), std::move(param));
            }
        }
        if (options.contains("processor")) p.properties["processor"] = options["processor"];
    } else if (kind == "iir") {
        checkIirCoefficients(options);
    }
    if (kind != "worklet") {
        auto it = catalog().find(kind);
        if (it == catalog().end()) throw EngineError(fmt::format("unknown primitive kind '{}'", kind));
        p.inputs = it->second.inputs;
        for (const auto& def : it->second.params) {
            Param param;
            param.value = def.second;
            if (options.contains(def.first) && options[def.first].is_number()) param.value = options[def.first].get<double>();
            p.params.emplace(def.first, std::move(param));
        }
        if (options.is_object()) {
            for (const auto& item : options.items()) {
                if (!p.params.count(item.key())) p.properties[item.key()] = item.value();
            }
        }
    }
    PrimitiveHandle h = nextHandle++;
    primitives.emplace(h, std::move(p));
    return h;
}

void OfflineEngine::releasePrimitive(PrimitiveHandle h) {
    if (h == destinationHandle) throw EngineError("cannot release the destination");
    get(h);
    links.erase(std::remove_if(links.begin(), links.end(), [h](const Connection& c) { return c.from == h || c.to == h; }), links.end());
    primitives.erase(h);
}

void OfflineEngine::connect(PrimitiveHandle from, PrimitiveHandle to, int inputIndex) {
    get(from);
    const Primitive& target = get(to);
    if (inputIndex < 0 || inputIndex >= target.inputs) {
        throw EngineError(fmt::format("input index {} out of range for {} ({} inputs)", inputIndex, target.kind, target.inputs));
    }
    links.push_back({from, to, inputIndex, {}});
}

void OfflineEngine::connectParam(PrimitiveHandle from, PrimitiveHandle owner, const std::string& param) {
    get(from);
    getParam(owner, param);
    links.push_back({from, owner, -1, param});
}

void OfflineEngine::disconnect(PrimitiveHandle from) {
    get(from);
    links.erase(std::remove_if(links.begin(), links.end(), [from](const Connection& c) { return c.from == from; }), links.end());
}

void OfflineEngine::disconnect(PrimitiveHandle from, PrimitiveHandle to) {
    get(from);
    get(to);
    links.erase(std::remove_if(links.begin(), links.end(), [&](const Connection& c) { return c.from == from && c.to == to && c.param.empty(); }), links.end());
}

void OfflineEngine::disconnectParam(PrimitiveHandle from, PrimitiveHandle owner, const std::string& param) {
    get(from);
    getParam(owner, param);
    links.erase(std::remove_if(links.begin(), links.end(), [&](const Connection& c) { return c.from == from && c.to == owner && c.param == param; }), links.end());
}

bool OfflineEngine::hasParam(PrimitiveHandle h, const std::string& param) const {
    auto it = primitives.find(h);
    return it != primitives.end() && it->second.params.count(param) != 0;
}

int OfflineEngine::numberOfInputs(PrimitiveHandle h) const { return get(h).inputs; }

double OfflineEngine::paramValue(PrimitiveHandle h, const std::string& param) const {
    return evaluate(getParam(h, param), currentTime());
}

void OfflineEngine::setParamValue(PrimitiveHandle h, const std::string& param, double value) {
    Param& p = getParam(h, param);
    p.value = value;
    // With a timeline in place a direct set behaves like setValueAtTime(now)
    if (!p.events.empty()) insertEvent(p, {AutomationEvent::Type::SetValue, value, currentTime()});
}

void OfflineEngine::setProperty(PrimitiveHandle h, const std::string& name, const nlohmann::json& value) {
    get(h).properties[name] = value;
}

void OfflineEngine::setValueAtTime(PrimitiveHandle h, const std::string& param, double value, double time) {
    insertEvent(getParam(h, param), {AutomationEvent::Type::SetValue, value, time});
}

void OfflineEngine::linearRampToValueAtTime(PrimitiveHandle h, const std::string& param, double value, double time) {
    insertEvent(getParam(h, param), {AutomationEvent::Type::LinearRamp, value, time});
}

void OfflineEngine::cancelScheduledValues(PrimitiveHandle h, const std::string& param, double fromTime) {
    Param& p = getParam(h, param);
    // Keep the value reached so far as the new resting value
    p.value = evaluate(p, fromTime);
    p.events.erase(std::remove_if(p.events.begin(), p.events.end(), [fromTime](const AutomationEvent& e) { return e.time >= fromTime; }), p.events.end());
}

double OfflineEngine::currentTime() const { return clock ? clock() : manualTime; }

bool OfflineEngine::isAlive(PrimitiveHandle h) const { return primitives.count(h) != 0; }

std::string OfflineEngine::kindOf(PrimitiveHandle h) const { return get(h).kind; }

double OfflineEngine::valueAt(PrimitiveHandle h, const std::string& param, double time) const {
    return evaluate(getParam(h, param), time);
}

std::vector<OfflineEngine::AutomationEvent> OfflineEngine::automation(PrimitiveHandle h, const std::string& param) const {
    return getParam(h, param).events;
}

nlohmann::json OfflineEngine::property(PrimitiveHandle h, const std::string& name) const {
    const auto& props = get(h).properties;
    return props.contains(name) ? props[name] : nlohmann::json();
}

size_t OfflineEngine::countConnections(PrimitiveHandle from, PrimitiveHandle to, const std::string& param) const {
    return static_cast<size_t>(std::count_if(links.begin(), links.end(), [&](const Connection& c) {
        return c.from == from && c.to == to && c.param == param;
    }));
}

size_t OfflineEngine::livePrimitives() const { return primitives.size(); }

nlohmann::json OfflineEngine::describe() const {
    nlohmann::json out;
    out["primitives"] = nlohmann::json::array();
    for (const auto& kv : primitives) {
        nlohmann::json p{{"handle", kv.first}, {"kind", kv.second.kind}};
        for (const auto& param : kv.second.params) p["params"][param.first] = evaluate(param.second, currentTime());
        out["primitives"].push_back(std::move(p));
    }
    out["connections"] = nlohmann::json::array();
    for (const auto& c : links) {
        nlohmann::json j{{"from", c.from}, {"to", c.to}};
        if (c.param.empty()) j["input"] = c.input; else j["param"] = c.param;
        out["connections"].push_back(std::move(j));
    }
    return out;
}

OfflineEngine::Primitive& OfflineEngine::get(PrimitiveHandle h) {
    auto it = primitives.find(h);
    if (it == primitives.end()) throw EngineError(fmt::format("invalid primitive handle {}", h));
    return it->second;
}

const OfflineEngine::Primitive& OfflineEngine::get(PrimitiveHandle h) const {
    auto it = primitives.find(h);
    if (it == primitives.end()) throw EngineError(fmt::format("invalid primitive handle {}", h));
    return it->second;
}

OfflineEngine::Param& OfflineEngine::getParam(PrimitiveHandle h, const std::string& param) {
    Primitive& p = get(h);
    auto it = p.params.find(param);
    if (it == p.params.end()) throw EngineError(fmt::format("{} has no parameter '{}'", p.kind, param));
    return it->second;
}

const OfflineEngine::Param& OfflineEngine::getParam(PrimitiveHandle h, const std::string& param) const {
    const Primitive& p = get(h);
    auto it = p.params.find(param);
    if (it == p.params.end()) throw EngineError(fmt::format("{} has no parameter '{}'", p.kind, param));
    return it->second;
}

void OfflineEngine::insertEvent(Param& p, AutomationEvent ev) {
    auto pos = std::upper_bound(p.events.begin(), p.events.end(), ev.time,
                                [](double t, const AutomationEvent& e) { return t < e.time; });
    p.events.insert(pos, ev);
}

double OfflineEngine::evaluate(const Param& p, double time) {
    double current = p.value;
    double prevTime = 0.0;
    double prevValue = p.value;
    for (const auto& ev : p.events) {
        if (ev.time <= time) {
            current = ev.value;
            prevTime = ev.time;
            prevValue = ev.value;
            continue;
        }
        if (ev.type == AutomationEvent::Type::LinearRamp) {
            double span = ev.time - prevTime;
            if (span <= 0.0) return ev.value;
            double t = (time - prevTime) / span;
            return prevValue + (ev.value - prevValue) * std::clamp(t, 0.0, 1.0);
        }
        break;
    }
    return current;
}

} // namespace SignalFlow
