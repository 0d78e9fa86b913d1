// Scheduler.cpp
#include "Scheduler.hpp"
#include "Log.hpp"
#include <algorithm>
#include <exception>

namespace SignalFlow {

TimerId Scheduler::schedule(double delayMs, std::function<void()> callback, TimerPrecision precision) {
    return scheduleAt(now + std::max(0.0, delayMs), std::move(callback), precision);
}

TimerId Scheduler::scheduleAt(double deadlineMs, std::function<void()> callback, TimerPrecision precision) {
    TimerId id = nextId++;
    Key key{std::max(deadlineMs, now), sequence++};
    timers.emplace(key, Timer{id, precision, std::move(callback)});
    index.emplace(id, key);
    return id;
}

bool Scheduler::cancel(TimerId id) {
    auto it = index.find(id);
    if (it == index.end()) return false;
    timers.erase(it->second);
    index.erase(it);
    ++stats.cancelled;
    return true;
}

void Scheduler::advance(double dtMs) {
    if (dtMs < 0.0) return;
    advanceTo(now + dtMs);
}

void Scheduler::advanceTo(double targetMs) {
    if (targetMs < now) return;
    // Callbacks may schedule or cancel timers; re-read the head every time
    while (!timers.empty()) {
        auto head = timers.begin();
        if (head->first.first > targetMs) break;
        now = head->first.first;
        Timer timer = std::move(head->second);
        index.erase(timer.id);
        timers.erase(head);
        ++stats.fired;
        try {
            timer.callback();
        } catch (const std::exception& e) {
            ++stats.callbackErrors;
            logError("scheduler: timer {} threw: {}", timer.id, e.what());
        }
    }
    now = targetMs;
}

std::optional<double> Scheduler::nextDeadline() const {
    if (timers.empty()) return std::nullopt;
    return timers.begin()->first.first;
}

double Scheduler::suggestedSleepMs(double coarseMs, double fineMs) const {
    if (timers.empty()) return coarseMs;
    const auto& head = *timers.begin();
    double untilDue = head.first.first - now;
    if (head.second.precision == TimerPrecision::Fine || untilDue < kFinePollingThresholdMs) {
        return std::max(0.0, std::min(fineMs, untilDue));
    }
    return std::min(coarseMs, untilDue - kFinePollingThresholdMs / 2.0);
}

} // namespace SignalFlow
