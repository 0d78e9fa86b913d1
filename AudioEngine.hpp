// AudioEngine.hpp
//
// Boundary to the audio rendering engine. The graph runtime never renders
// samples; it creates primitives, wires them, and drives parameter
// automation through this interface. Primitives are referred to by opaque
// integer handles owned by the engine.
#pragma once
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace SignalFlow {

using PrimitiveHandle = int;
constexpr PrimitiveHandle kNoPrimitive = -1;

// Raised for invalid handles, unknown primitive kinds, unknown parameters or
// out-of-range input indices.
class EngineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class AudioEngine {
public:
    virtual ~AudioEngine() = default;

    // Primitive lifecycle
    virtual PrimitiveHandle createPrimitive(const std::string& kind, const nlohmann::json& options) = 0;
    virtual void releasePrimitive(PrimitiveHandle h) = 0;
    // Terminal sink; always valid
    virtual PrimitiveHandle destination() const = 0;

    // Signal wiring
    virtual void connect(PrimitiveHandle from, PrimitiveHandle to, int inputIndex = 0) = 0;
    virtual void connectParam(PrimitiveHandle from, PrimitiveHandle owner, const std::string& param) = 0;
    // Drops every outgoing connection of from
    virtual void disconnect(PrimitiveHandle from) = 0;
    virtual void disconnect(PrimitiveHandle from, PrimitiveHandle to) = 0;
    virtual void disconnectParam(PrimitiveHandle from, PrimitiveHandle owner, const std::string& param) = 0;

    // Parameters
    virtual bool hasParam(PrimitiveHandle h, const std::string& param) const = 0;
    virtual int numberOfInputs(PrimitiveHandle h) const = 0;
    virtual double paramValue(PrimitiveHandle h, const std::string& param) const = 0;
    virtual void setParamValue(PrimitiveHandle h, const std::string& param, double value) = 0;
    virtual void setProperty(PrimitiveHandle h, const std::string& name, const nlohmann::json& value) = 0;

    // Automation timeline (times in seconds on the engine clock)
    virtual void setValueAtTime(PrimitiveHandle h, const std::string& param, double value, double time) = 0;
    virtual void linearRampToValueAtTime(PrimitiveHandle h, const std::string& param, double value, double time) = 0;
    virtual void cancelScheduledValues(PrimitiveHandle h, const std::string& param, double fromTime) = 0;

    virtual double currentTime() const = 0;
};

} // namespace SignalFlow
