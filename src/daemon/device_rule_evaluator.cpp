#include "daemon/device_rule_evaluator.hpp"

#include <ctime>
#include <exception>
#include <type_traits>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace sprout {

namespace {

std::tm toLocalTime(std::chrono::system_clock::time_point t)
{
    std::time_t raw = std::chrono::system_clock::to_time_t(t);
    std::tm localTime{};
    localtime_r(&raw, &localTime);
    return localTime;
}

int secondsOfDay(std::chrono::system_clock::time_point t)
{
    const std::tm localTime = toLocalTime(t);
    return localTime.tm_hour * 3600 + localTime.tm_min * 60 + localTime.tm_sec;
}

void logInvalidRule(const std::string &deviceName,
                    const QString &what,
                    const nlohmann::json &context)
{
    nlohmann::json ctx = context;
    ctx["device"] = deviceName;
    SLOG_WARN(QStringLiteral("DeviceRuleEvaluator"),
              QStringLiteral("evaluate"),
              what,
              QStringLiteral("device_schedule_evaluation"),
              QStringLiteral("skip_rule"),
              logging::defaultWho(),
              QString(),
              ctx);
}

} // namespace

std::optional<int> parseTimeOfDay(const std::string &value)
{
    const auto colon = value.find(':');
    if (colon == std::string::npos || colon == 0 || colon > 2
        || value.size() != colon + 3) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (i != colon && (value[i] < '0' || value[i] > '9')) {
            return std::nullopt;
        }
    }

    int hours = 0;
    int minutes = 0;
    try {
        hours = std::stoi(value.substr(0, colon));
        minutes = std::stoi(value.substr(colon + 1, 2));
    } catch (const std::exception &) {
        return std::nullopt;
    }
    if (hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
        return std::nullopt;
    }
    return hours * 3600 + minutes * 60;
}

DeviceDecision DeviceRuleEvaluator::evaluate(const DeviceConfig &config,
                                             std::chrono::system_clock::time_point now,
                                             std::optional<double> temperature,
                                             std::optional<double> humidity)
{
    // A disabled device is forced off so it cannot stay energized from an
    // earlier mode.
    if (!config.enabled) {
        return DeviceDecision::Off;
    }

    bool on = false;
    switch (config.mode) {
    case DeviceMode::Manual:
        return DeviceDecision::NoOpinion;
    case DeviceMode::Schedule:
        on = scheduleMatches(config, now);
        break;
    case DeviceMode::Threshold:
        on = thresholdMatches(config, temperature, humidity);
        break;
    case DeviceMode::Auto: {
        // Both sides are evaluated so duty-cycle state advances regardless
        // of the threshold outcome.
        const bool scheduled = scheduleMatches(config, now);
        const bool threshold = thresholdMatches(config, temperature, humidity);
        on = scheduled || threshold;
        break;
    }
    }

    SLOG_DEBUG(QStringLiteral("DeviceRuleEvaluator"),
               QStringLiteral("evaluate"),
               QStringLiteral("device_evaluated"),
               QStringLiteral("control_tick"),
               QString::fromStdString(toDeviceModeString(config.mode)),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"device", config.name},
                              {"on", on},
                              {"temperature", optionalToJson(temperature)},
                              {"humidity", optionalToJson(humidity)}});
    return on ? DeviceDecision::On : DeviceDecision::Off;
}

void DeviceRuleEvaluator::forgetDevice(const std::string &deviceName)
{
    for (auto it = m_dutyCycles.begin(); it != m_dutyCycles.end();) {
        if (it->first.first == deviceName) {
            it = m_dutyCycles.erase(it);
        } else {
            ++it;
        }
    }
}

void DeviceRuleEvaluator::reset()
{
    m_dutyCycles.clear();
}

bool DeviceRuleEvaluator::scheduleMatches(const DeviceConfig &config,
                                          std::chrono::system_clock::time_point now)
{
    // Rules are OR-ed, but every rule is visited so each duty cycle keeps
    // its own timing.
    bool matched = false;
    for (std::size_t index = 0; index < config.schedule.size(); ++index) {
        const bool ruleMatched = std::visit([&](const auto &rule) -> bool {
            using Rule = std::decay_t<decltype(rule)>;
            if constexpr (std::is_same_v<Rule, TimeWindowRule>) {
                return timeWindowMatches(config.name, rule, now);
            } else if constexpr (std::is_same_v<Rule, DutyCycleRule>) {
                return dutyCycleMatches(config.name, index, rule, now);
            } else {
                return pulseMatches(config.name, rule, now);
            }
        }, config.schedule[index]);
        matched = matched || ruleMatched;
    }
    return matched;
}

bool DeviceRuleEvaluator::thresholdMatches(const DeviceConfig &config,
                                           std::optional<double> temperature,
                                           std::optional<double> humidity) const
{
    const auto fires = [&config](std::optional<double> reading,
                                 std::optional<double> threshold) {
        if (!reading || !threshold) {
            return false;
        }
        switch (config.role) {
        case DeviceRole::ShedExcess:
            return *reading >= *threshold;
        case DeviceRole::CompensateDeficit:
            return *reading <= *threshold;
        case DeviceRole::None:
            return false;
        }
        return false;
    };

    return fires(temperature, config.thresholds.temperature)
        || fires(humidity, config.thresholds.humidity);
}

bool DeviceRuleEvaluator::timeWindowMatches(const std::string &deviceName,
                                            const TimeWindowRule &rule,
                                            std::chrono::system_clock::time_point now) const
{
    const auto onSeconds = parseTimeOfDay(rule.on);
    const auto offSeconds = parseTimeOfDay(rule.off);
    if (!onSeconds || !offSeconds) {
        logInvalidRule(deviceName,
                       QStringLiteral("invalid_time_window"),
                       nlohmann::json{{"on", rule.on}, {"off", rule.off}});
        return false;
    }

    const int current = secondsOfDay(now);
    if (*onSeconds <= *offSeconds) {
        return current >= *onSeconds && current < *offSeconds;
    }
    // Overnight window.
    return current >= *onSeconds || current < *offSeconds;
}

bool DeviceRuleEvaluator::dutyCycleMatches(const std::string &deviceName,
                                           std::size_t ruleIndex,
                                           const DutyCycleRule &rule,
                                           std::chrono::system_clock::time_point now)
{
    if (rule.intervalMinutes <= 0 || rule.durationMinutes < 0) {
        logInvalidRule(deviceName,
                       QStringLiteral("invalid_duty_cycle"),
                       nlohmann::json{{"duration", rule.durationMinutes},
                                      {"interval", rule.intervalMinutes}});
        return false;
    }

    const auto interval = std::chrono::minutes(rule.intervalMinutes);
    const auto duration = std::chrono::minutes(rule.durationMinutes);

    DutyCycleState &state = m_dutyCycles[DutyCycleKey{deviceName, ruleIndex}];
    if (!state.cycleStartedAt || now - *state.cycleStartedAt >= interval) {
        state.cycleStartedAt = now;
        state.currentlyRunning = true;
    }

    if (state.currentlyRunning && now - *state.cycleStartedAt < duration) {
        return true;
    }
    state.currentlyRunning = false;
    return false;
}

bool DeviceRuleEvaluator::pulseMatches(const std::string &deviceName,
                                       const PulseAtRule &rule,
                                       std::chrono::system_clock::time_point now) const
{
    const auto triggerSeconds = parseTimeOfDay(rule.time);
    if (!triggerSeconds || rule.durationMinutes < 0) {
        logInvalidRule(deviceName,
                       QStringLiteral("invalid_pulse"),
                       nlohmann::json{{"time", rule.time},
                                      {"duration", rule.durationMinutes}});
        return false;
    }

    std::tm trigger = toLocalTime(now);
    trigger.tm_hour = *triggerSeconds / 3600;
    trigger.tm_min = (*triggerSeconds % 3600) / 60;
    trigger.tm_sec = 0;
    trigger.tm_isdst = -1;
    const std::time_t triggerRaw = std::mktime(&trigger);
    if (triggerRaw == static_cast<std::time_t>(-1)) {
        return false;
    }

    const auto today = std::chrono::system_clock::from_time_t(triggerRaw);
    const auto duration = std::chrono::minutes(rule.durationMinutes);
    if (now >= today && now < today + duration) {
        return true;
    }

    // A pulse that started before midnight may still be running.
    const auto yesterday = today - std::chrono::hours(24);
    return now >= yesterday && now < yesterday + duration;
}

} // namespace sprout
