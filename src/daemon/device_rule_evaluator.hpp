#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include "common/models.hpp"

namespace sprout {

// DeviceRuleEvaluator decides the desired state of one device from its
// configuration, the current time and the latest environment values.
// It performs no I/O. Duty-cycle rules are the only stateful part; that state
// is kept per device and rule position.
class DeviceRuleEvaluator {
public:
    DeviceDecision evaluate(const DeviceConfig &config,
                            std::chrono::system_clock::time_point now,
                            std::optional<double> temperature,
                            std::optional<double> humidity);

    // Drop duty-cycle state for a device whose configuration changed.
    void forgetDevice(const std::string &deviceName);
    void reset();

    bool scheduleMatches(const DeviceConfig &config,
                         std::chrono::system_clock::time_point now);
    bool thresholdMatches(const DeviceConfig &config,
                          std::optional<double> temperature,
                          std::optional<double> humidity) const;

private:
    struct DutyCycleState {
        std::optional<std::chrono::system_clock::time_point> cycleStartedAt;
        bool currentlyRunning = false;
    };

    using DutyCycleKey = std::pair<std::string, std::size_t>;
    std::map<DutyCycleKey, DutyCycleState> m_dutyCycles;

    bool timeWindowMatches(const std::string &deviceName,
                           const TimeWindowRule &rule,
                           std::chrono::system_clock::time_point now) const;
    bool dutyCycleMatches(const std::string &deviceName,
                          std::size_t ruleIndex,
                          const DutyCycleRule &rule,
                          std::chrono::system_clock::time_point now);
    bool pulseMatches(const std::string &deviceName,
                      const PulseAtRule &rule,
                      std::chrono::system_clock::time_point now) const;
};

// Parses a 24h "HH:MM" (or "H:MM") time of day into seconds after midnight.
std::optional<int> parseTimeOfDay(const std::string &value);

} // namespace sprout
