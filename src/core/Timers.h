#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace SandSim {

/**
 * Named wall-clock accumulators for the phases of a simulation step.
 * Not thread-safe: only the thread driving World::advance() touches them.
 */
class Timers {
public:
    Timers() = default;
    ~Timers() = default;

    // Starting a running timer is a no-op.
    void startTimer(const std::string& name);

    // Returns the accumulated time in milliseconds, or -1 for an unknown timer.
    double stopTimer(const std::string& name);

    bool hasTimer(const std::string& name) const;

    // Includes the in-flight session of a running timer.
    double getAccumulatedTime(const std::string& name) const;

    uint32_t getCallCount(const std::string& name) const;

    void resetTimer(const std::string& name);
    void resetAll();

    std::vector<std::string> getAllTimerNames() const;

    // Logs every timer as a share of the "advance" timer.
    void dumpTimerStats() const;

    nlohmann::json exportAllTimersAsJson() const;

private:
    using TimePoint = std::chrono::steady_clock::time_point;

    struct TimerData {
        TimePoint startTime;
        double accumulatedTime = 0.0;
        bool isRunning = false;
        uint32_t callCount = 0;
    };

    std::unordered_map<std::string, TimerData> timers;
};

/**
 * Times the enclosing scope under `name`.
 */
class ScopeTimer {
public:
    ScopeTimer(Timers& timers, std::string name) : timers_(timers), name_(std::move(name))
    {
        timers_.startTimer(name_);
    }

    ~ScopeTimer() { timers_.stopTimer(name_); }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;

private:
    Timers& timers_;
    std::string name_;
};

} // namespace SandSim
