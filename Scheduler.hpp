// Scheduler.hpp
//
// Single-threaded timer queue on a millisecond clock. Nothing runs on its own:
// the runtime loop (or a test) calls advance() and every timer whose deadline
// falls inside the advanced window fires in deadline order, ties broken by
// insertion order. The clock reads the deadline of the timer being fired, so
// callbacks that reschedule themselves see drift-free time.
#pragma once
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>

namespace SignalFlow {

using TimerId = unsigned long long;
constexpr TimerId kNoTimer = 0;

// Coarse timers are fine with a few milliseconds of polling jitter; fine
// timers ask the loop to poll at its fine step until they fire.
enum class TimerPrecision { Coarse, Fine };

class Scheduler {
public:
    // Deadlines closer than this switch the loop to fine polling
    static constexpr double kFinePollingThresholdMs = 20.0;

    explicit Scheduler(double startMs = 0.0) : now(startMs) {}
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    double nowMs() const { return now; }
    double nowSeconds() const { return now / 1000.0; }

    TimerId schedule(double delayMs, std::function<void()> callback, TimerPrecision precision = TimerPrecision::Coarse);
    TimerId scheduleAt(double deadlineMs, std::function<void()> callback, TimerPrecision precision = TimerPrecision::Coarse);
    // Returns false when the timer already fired or was cancelled
    bool cancel(TimerId id);
    bool isPending(TimerId id) const { return index.count(id) != 0; }

    // Fire everything due within [now, now + dtMs] and move the clock forward
    void advance(double dtMs);
    void advanceTo(double targetMs);

    size_t pending() const { return timers.size(); }
    std::optional<double> nextDeadline() const;
    // Sleep step the loop should use before the next advance()
    double suggestedSleepMs(double coarseMs, double fineMs) const;

    struct Stats {
        unsigned long long fired = 0;
        unsigned long long cancelled = 0;
        unsigned long long callbackErrors = 0;
    };
    Stats getAndResetStats() {
        Stats out = stats;
        stats = Stats{};
        return out;
    }

private:
    using Key = std::pair<double, unsigned long long>; // deadline, insertion sequence
    struct Timer {
        TimerId id;
        TimerPrecision precision;
        std::function<void()> callback;
    };
    std::map<Key, Timer> timers;
    std::unordered_map<TimerId, Key> index;
    double now;
    unsigned long long sequence = 0;
    TimerId nextId = 1;
    Stats stats;
};

} // namespace SignalFlow
