// OfflineEngine.hpp
//
// In-memory AudioEngine. It renders nothing but keeps the full primitive and
// connection topology and each parameter's automation timeline, so a graph
// can run headless and tests can inspect exactly what the runtime asked the
// engine to do. Connections are kept as a multiset: wiring the same pair twice
// is visible as two connections.
#pragma once
#include "AudioEngine.hpp"
#include <functional>
#include <map>
#include <unordered_map>
#include <vector>

namespace SignalFlow {

class OfflineEngine : public AudioEngine {
public:
    // clockSeconds supplies currentTime(); when empty the engine uses a
    // manually set time (setCurrentTime).
    explicit OfflineEngine(std::function<double()> clockSeconds = {});

    PrimitiveHandle createPrimitive(const std::string& kind, const nlohmann::json& options) override;
    void releasePrimitive(PrimitiveHandle h) override;
    PrimitiveHandle destination() const override { return destinationHandle; }

    void connect(PrimitiveHandle from, PrimitiveHandle to, int inputIndex = 0) override;
    void connectParam(PrimitiveHandle from, PrimitiveHandle owner, const std::string& param) override;
    void disconnect(PrimitiveHandle from) override;
    void disconnect(PrimitiveHandle from, PrimitiveHandle to) override;
    void disconnectParam(PrimitiveHandle from, PrimitiveHandle owner, const std::string& param) override;

    bool hasParam(PrimitiveHandle h, const std::string& param) const override;
    int numberOfInputs(PrimitiveHandle h) const override;
    double paramValue(PrimitiveHandle h, const std::string& param) const override;
    void setParamValue(PrimitiveHandle h, const std::string& param, double value) override;
    void setProperty(PrimitiveHandle h, const std::string& name, const nlohmann::json& value) override;

    void setValueAtTime(PrimitiveHandle h, const std::string& param, double value, double time) override;
    void linearRampToValueAtTime(PrimitiveHandle h, const std::string& param, double value, double time) override;
    void cancelScheduledValues(PrimitiveHandle h, const std::string& param, double fromTime) override;

    double currentTime() const override;
    void setCurrentTime(double seconds) { manualTime = seconds; }

    // Inspection
    struct AutomationEvent {
        enum class Type { SetValue, LinearRamp };
        Type type;
        double value;
        double time;
    };
    struct Connection {
        PrimitiveHandle from;
        PrimitiveHandle to;
        int input;          // -1 for parameter connections
        std::string param;  // empty for signal connections
    };

    bool isAlive(PrimitiveHandle h) const;
    std::string kindOf(PrimitiveHandle h) const;
    double valueAt(PrimitiveHandle h, const std::string& param, double time) const;
    std::vector<AutomationEvent> automation(PrimitiveHandle h, const std::string& param) const;
    nlohmann::json property(PrimitiveHandle h, const std::string& name) const;
    const std::vector<Connection>& connections() const { return links; }
    size_t countConnections(PrimitiveHandle from, PrimitiveHandle to, const std::string& param = {}) const;
    size_t livePrimitives() const;
    nlohmann::json describe() const;

private:
    struct Param {
        double value = 0.0;
        std::vector<AutomationEvent> events; // sorted by time, stable for equal times
    };
    struct Primitive {
        std::string kind;
        int inputs = 1;
        std::map<std::string, Param> params;
        nlohmann::json properties = nlohmann::json::object();
    };

    Primitive& get(PrimitiveHandle h);
    const Primitive& get(PrimitiveHandle h) const;
    Param& getParam(PrimitiveHandle h, const std::string& param);
    const Param& getParam(PrimitiveHandle h, const std::string& param) const;
    static void insertEvent(Param& p, AutomationEvent ev);
    static double evaluate(const Param& p, double time);

    std::unordered_map<PrimitiveHandle, Primitive> primitives;
    std::vector<Connection> links;
    PrimitiveHandle nextHandle = 0;
    PrimitiveHandle destinationHandle = kNoPrimitive;
    std::function<double()> clock;
    double manualTime = 0.0;
};

} // namespace SignalFlow
