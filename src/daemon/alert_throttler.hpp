#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace sprout {

// AlertThrottler derives alert conditions from a reading and suppresses a
// condition that was already reported within the notification interval.
// It only decides; delivering the message is the caller's job.
class AlertThrottler {
public:
    std::vector<AlertCondition> check(const EnvironmentReading &reading,
                                      const AlertConfig &config,
                                      std::chrono::system_clock::time_point now);

    // Conditions present in `reading`, without throttling.
    static std::vector<AlertCondition> conditionsFor(const EnvironmentReading &reading,
                                                     const AlertConfig &config);

    std::map<std::string, std::chrono::system_clock::time_point> lastSent() const;
    void reset();

private:
    std::map<std::string, std::chrono::system_clock::time_point> m_lastSentAt;
};

} // namespace sprout
