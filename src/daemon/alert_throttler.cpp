#include "daemon/alert_throttler.hpp"

#include <QString>

#include "common/logging.hpp"

namespace sprout {

namespace {

std::string formatOneDecimal(double value)
{
    return QString::number(value, 'f', 1).toStdString();
}

AlertCondition makeCondition(const char *key,
                             const char *label,
                             const char *direction,
                             double value,
                             const char *unit,
                             const char *boundName,
                             double bound)
{
    AlertCondition condition;
    condition.key = key;
    condition.message = std::string(label) + " too " + direction + ": "
        + formatOneDecimal(value) + unit + " (" + boundName + ": "
        + formatOneDecimal(bound) + unit + ")";
    return condition;
}

} // namespace

std::vector<AlertCondition> AlertThrottler::conditionsFor(const EnvironmentReading &reading,
                                                          const AlertConfig &config)
{
    std::vector<AlertCondition> conditions;
    if (!config.enabled) {
        return conditions;
    }

    if (config.tempMin && reading.temperature < *config.tempMin) {
        conditions.push_back(makeCondition("temp_low", "Temperature", "LOW",
                                           reading.temperature, "°C",
                                           "min", *config.tempMin));
    } else if (config.tempMax && reading.temperature > *config.tempMax) {
        conditions.push_back(makeCondition("temp_high", "Temperature", "HIGH",
                                           reading.temperature, "°C",
                                           "max", *config.tempMax));
    }

    if (config.humidityMin && reading.humidity < *config.humidityMin) {
        conditions.push_back(makeCondition("humidity_low", "Humidity", "LOW",
                                           reading.humidity, "%",
                                           "min", *config.humidityMin));
    } else if (config.humidityMax && reading.humidity > *config.humidityMax) {
        conditions.push_back(makeCondition("humidity_high", "Humidity", "HIGH",
                                           reading.humidity, "%",
                                           "max", *config.humidityMax));
    }

    return conditions;
}

std::vector<AlertCondition> AlertThrottler::check(const EnvironmentReading &reading,
                                                  const AlertConfig &config,
                                                  std::chrono::system_clock::time_point now)
{
    std::vector<AlertCondition> fired;
    const auto interval = std::chrono::seconds(config.notificationIntervalSeconds);

    for (const auto &condition : conditionsFor(reading, config)) {
        auto it = m_lastSentAt.find(condition.key);
        if (it != m_lastSentAt.end() && now - it->second < interval) {
            SLOG_DEBUG(QStringLiteral("AlertThrottler"),
                       QStringLiteral("check"),
                       QStringLiteral("alert_suppressed"),
                       QStringLiteral("alert_check"),
                       QStringLiteral("notification_interval"),
                       logging::defaultWho(),
                       QString(),
                       nlohmann::json{{"key", condition.key},
                                      {"intervalSeconds",
                                       config.notificationIntervalSeconds}});
            continue;
        }

        m_lastSentAt[condition.key] = now;
        fired.push_back(condition);
    }
    return fired;
}

std::map<std::string, std::chrono::system_clock::time_point> AlertThrottler::lastSent() const
{
    return m_lastSentAt;
}

void AlertThrottler::reset()
{
    m_lastSentAt.clear();
}

} // namespace sprout
