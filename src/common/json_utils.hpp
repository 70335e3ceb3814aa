#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace sprout {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
    std::time_t time = timegm(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline std::string toDeviceModeString(DeviceMode mode)
{
    switch (mode) {
    case DeviceMode::Schedule:
        return "schedule";
    case DeviceMode::Threshold:
        return "threshold";
    case DeviceMode::Auto:
        return "auto";
    case DeviceMode::Manual:
        return "manual";
    }
    return "manual";
}

inline std::optional<DeviceMode> parseDeviceMode(const std::string &value)
{
    if (value == "schedule") {
        return DeviceMode::Schedule;
    }
    if (value == "threshold") {
        return DeviceMode::Threshold;
    }
    if (value == "auto") {
        return DeviceMode::Auto;
    }
    if (value == "manual") {
        return DeviceMode::Manual;
    }
    return std::nullopt;
}

inline std::string toDeviceRoleString(DeviceRole role)
{
    switch (role) {
    case DeviceRole::ShedExcess:
        return "shed_excess";
    case DeviceRole::CompensateDeficit:
        return "compensate_deficit";
    case DeviceRole::None:
        return "none";
    }
    return "none";
}

inline std::optional<DeviceRole> parseDeviceRole(const std::string &value)
{
    if (value == "shed_excess") {
        return DeviceRole::ShedExcess;
    }
    if (value == "compensate_deficit") {
        return DeviceRole::CompensateDeficit;
    }
    if (value == "none") {
        return DeviceRole::None;
    }
    return std::nullopt;
}

// Threshold role implied by the device's name. Unknown devices never react
// to thresholds unless a role is configured explicitly.
inline DeviceRole defaultRoleForDevice(const std::string &deviceName)
{
    if (deviceName == "exhaust_fan" || deviceName == "dehumidifier") {
        return DeviceRole::ShedExcess;
    }
    if (deviceName == "heater" || deviceName == "humidifier") {
        return DeviceRole::CompensateDeficit;
    }
    return DeviceRole::None;
}

inline std::string toProjectStatusString(ProjectStatus status)
{
    switch (status) {
    case ProjectStatus::Active:
        return "active";
    case ProjectStatus::Completed:
        return "completed";
    case ProjectStatus::Archived:
        return "archived";
    }
    return "archived";
}

inline ProjectStatus parseProjectStatus(const std::string &value)
{
    if (value == "active") {
        return ProjectStatus::Active;
    }
    if (value == "completed") {
        return ProjectStatus::Completed;
    }
    return ProjectStatus::Archived;
}

inline nlohmann::json scheduleRuleToJson(const ScheduleRule &rule)
{
    if (const auto *window = std::get_if<TimeWindowRule>(&rule)) {
        return nlohmann::json{{"on", window->on}, {"off", window->off}};
    }
    if (const auto *cycle = std::get_if<DutyCycleRule>(&rule)) {
        return nlohmann::json{{"duration", cycle->durationMinutes},
                              {"interval", cycle->intervalMinutes}};
    }
    const auto &pulse = std::get<PulseAtRule>(rule);
    return nlohmann::json{{"time", pulse.time}, {"duration", pulse.durationMinutes}};
}

// Schedule durations and intervals are whole minutes, at most one week.
constexpr std::int64_t kMaxScheduleMinutes = 7 * 24 * 60;

inline std::optional<int> scheduleMinutes(const nlohmann::json &value)
{
    if (!value.is_number_integer()) {
        return std::nullopt;
    }
    const auto minutes = value.get<std::int64_t>();
    if (minutes < 0 || minutes > kMaxScheduleMinutes) {
        return std::nullopt;
    }
    return static_cast<int>(minutes);
}

// Decodes the persisted schedule array. Entries with an unknown shape or
// wrongly typed fields are dropped and described in *errors.
inline std::vector<ScheduleRule> scheduleFromJson(const nlohmann::json &j,
                                                  std::vector<std::string> *errors)
{
    std::vector<ScheduleRule> rules;
    if (j.is_null()) {
        return rules;
    }
    if (!j.is_array()) {
        if (errors) {
            errors->push_back("schedule is not an array");
        }
        return rules;
    }

    for (const auto &entry : j) {
        if (!entry.is_object()) {
            if (errors) {
                errors->push_back("schedule entry is not an object: " + entry.dump());
            }
            continue;
        }

        if (entry.contains("on") && entry.contains("off")) {
            if (!entry.at("on").is_string() || !entry.at("off").is_string()) {
                if (errors) {
                    errors->push_back("time window needs string on/off: " + entry.dump());
                }
                continue;
            }
            rules.push_back(TimeWindowRule{entry.at("on").get<std::string>(),
                                           entry.at("off").get<std::string>()});
        } else if (entry.contains("duration") && entry.contains("interval")) {
            const auto duration = scheduleMinutes(entry.at("duration"));
            const auto interval = scheduleMinutes(entry.at("interval"));
            if (!duration || !interval) {
                if (errors) {
                    errors->push_back("duty cycle needs whole-minute duration/interval: "
                                      + entry.dump());
                }
                continue;
            }
            rules.push_back(DutyCycleRule{*duration, *interval});
        } else if (entry.contains("time") && entry.contains("duration")) {
            const auto duration = scheduleMinutes(entry.at("duration"));
            if (!entry.at("time").is_string() || !duration) {
                if (errors) {
                    errors->push_back("pulse needs string time and whole-minute duration: "
                                      + entry.dump());
                }
                continue;
            }
            rules.push_back(PulseAtRule{entry.at("time").get<std::string>(), *duration});
        } else if (errors) {
            errors->push_back("unrecognized schedule entry: " + entry.dump());
        }
    }
    return rules;
}

inline nlohmann::json scheduleToJson(const std::vector<ScheduleRule> &rules)
{
    nlohmann::json out = nlohmann::json::array();
    for (const auto &rule : rules) {
        out.push_back(scheduleRuleToJson(rule));
    }
    return out;
}

inline nlohmann::json thresholdsToJson(const DeviceThresholds &thresholds)
{
    nlohmann::json out = nlohmann::json::object();
    if (thresholds.temperature.has_value()) {
        out["temp_threshold"] = *thresholds.temperature;
    }
    if (thresholds.humidity.has_value()) {
        out["humidity_threshold"] = *thresholds.humidity;
    }
    return out;
}

inline DeviceThresholds thresholdsFromJson(const nlohmann::json &j,
                                           std::vector<std::string> *errors)
{
    DeviceThresholds thresholds;
    if (!j.is_object()) {
        if (!j.is_null() && errors) {
            errors->push_back("thresholds is not an object");
        }
        return thresholds;
    }
    auto readValue = [&](const char *key, std::optional<double> &out) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) {
            return;
        }
        if (!it->is_number()) {
            if (errors) {
                errors->push_back(std::string(key) + " is not a number");
            }
            return;
        }
        out = it->get<double>();
    };
    readValue("temp_threshold", thresholds.temperature);
    readValue("humidity_threshold", thresholds.humidity);
    return thresholds;
}

inline nlohmann::json deviceConfigToJson(const DeviceConfig &config)
{
    return nlohmann::json{
        {"name", config.name},
        {"enabled", config.enabled},
        {"mode", toDeviceModeString(config.mode)},
        {"schedule", scheduleToJson(config.schedule)},
        {"thresholds", thresholdsToJson(config.thresholds)},
        {"role", toDeviceRoleString(config.role)}
    };
}

// Builds a device configuration from its settings object. An unknown mode
// falls back to Manual so the device is left alone.
inline DeviceConfig deviceConfigFromJson(const std::string &name,
                                         const nlohmann::json &j,
                                         std::vector<std::string> *errors)
{
    DeviceConfig config;
    config.name = name;
    config.role = defaultRoleForDevice(name);
    if (!j.is_object()) {
        if (errors) {
            errors->push_back("device settings are not an object");
        }
        return config;
    }

    if (j.contains("enabled")) {
        const auto &enabled = j.at("enabled");
        if (enabled.is_boolean()) {
            config.enabled = enabled.get<bool>();
        } else if (enabled.is_number()) {
            config.enabled = enabled.get<double>() != 0.0;
        }
    }

    std::string modeText = "schedule";
    if (j.contains("mode") && j.at("mode").is_string()) {
        modeText = j.at("mode").get<std::string>();
    }
    if (const auto mode = parseDeviceMode(modeText)) {
        config.mode = *mode;
    } else {
        config.mode = DeviceMode::Manual;
        if (errors) {
            errors->push_back("unknown mode '" + modeText + "'");
        }
    }

    config.schedule = scheduleFromJson(j.value("schedule", nlohmann::json::array()), errors);
    config.thresholds = thresholdsFromJson(j.value("thresholds", nlohmann::json::object()),
                                           errors);

    if (j.contains("role") && j.at("role").is_string()) {
        if (const auto role = parseDeviceRole(j.at("role").get<std::string>())) {
            config.role = *role;
        } else if (errors) {
            errors->push_back("unknown role '" + j.at("role").get<std::string>() + "'");
        }
    }
    return config;
}

inline void to_json(nlohmann::json &j, const EnvironmentReading &reading)
{
    j = nlohmann::json{
        {"temperature", reading.temperature},
        {"humidity", reading.humidity},
        {"pressure", reading.pressure},
        {"gasResistance", reading.gasResistance},
        {"capturedAt", toIso8601Utc(reading.capturedAt)}
    };
}

inline void from_json(const nlohmann::json &j, EnvironmentReading &reading)
{
    reading.temperature = j.value("temperature", 0.0);
    reading.humidity = j.value("humidity", 0.0);
    reading.pressure = j.value("pressure", 0.0);
    reading.gasResistance = j.value("gasResistance", 0.0);
    reading.capturedAt = fromIso8601Utc(j.value("capturedAt", ""));
}

inline void to_json(nlohmann::json &j, const Project &project)
{
    j = nlohmann::json{
        {"id", project.id},
        {"name", project.name},
        {"notes", project.notes},
        {"status", toProjectStatusString(project.status)},
        {"startDate", toIso8601Utc(project.startDate)},
        {"endDate", project.endDate ? nlohmann::json(toIso8601Utc(*project.endDate))
                                    : nlohmann::json()},
        {"timelapseEnabled", project.timelapseEnabled},
        {"timelapseInterval", project.timelapseIntervalSeconds},
        {"timelapseLastCapture", project.lastCaptureAt
                                     ? nlohmann::json(toIso8601Utc(*project.lastCaptureAt))
                                     : nlohmann::json()}
    };
}

inline void from_json(const nlohmann::json &j, Project &project)
{
    project.id = j.value("id", static_cast<std::int64_t>(0));
    project.name = j.value("name", "");
    project.notes = j.value("notes", "");
    project.status = parseProjectStatus(j.value("status", "active"));
    project.startDate = fromIso8601Utc(j.value("startDate", ""));
    if (j.contains("endDate") && j.at("endDate").is_string()) {
        project.endDate = fromIso8601Utc(j.at("endDate").get<std::string>());
    } else {
        project.endDate.reset();
    }
    project.timelapseEnabled = j.value("timelapseEnabled", true);
    project.timelapseIntervalSeconds = j.value("timelapseInterval", 300);
    if (j.contains("timelapseLastCapture") && j.at("timelapseLastCapture").is_string()) {
        project.lastCaptureAt = fromIso8601Utc(j.at("timelapseLastCapture").get<std::string>());
    } else {
        project.lastCaptureAt.reset();
    }
}

inline nlohmann::json optionalToJson(const std::optional<double> &value)
{
    return value ? nlohmann::json(*value) : nlohmann::json();
}

inline std::optional<double> optionalFromJson(const nlohmann::json &j, const char *key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>();
}

// Alert settings use the persisted snake_case keys of the alert_settings row.
inline void to_json(nlohmann::json &j, const AlertConfig &config)
{
    j = nlohmann::json{
        {"enabled", config.enabled},
        {"temp_min", optionalToJson(config.tempMin)},
        {"temp_max", optionalToJson(config.tempMax)},
        {"humidity_min", optionalToJson(config.humidityMin)},
        {"humidity_max", optionalToJson(config.humidityMax)},
        {"notification_interval", config.notificationIntervalSeconds}
    };
}

inline void from_json(const nlohmann::json &j, AlertConfig &config)
{
    config.enabled = j.value("enabled", true);
    config.tempMin = optionalFromJson(j, "temp_min");
    config.tempMax = optionalFromJson(j, "temp_max");
    config.humidityMin = optionalFromJson(j, "humidity_min");
    config.humidityMax = optionalFromJson(j, "humidity_max");
    config.notificationIntervalSeconds = j.value("notification_interval", 300);
}

inline void to_json(nlohmann::json &j, const AlertCondition &condition)
{
    j = nlohmann::json{{"key", condition.key}, {"message", condition.message}};
}

inline void to_json(nlohmann::json &j, const TimelapseImage &image)
{
    j = nlohmann::json{
        {"id", image.id},
        {"projectId", image.projectId},
        {"timestamp", toIso8601Utc(image.timestamp)},
        {"filepath", image.filepath}
    };
}

inline void to_json(nlohmann::json &j, const SensorLogEntry &entry)
{
    j = entry.reading;
    j["id"] = entry.id;
    j["projectId"] = entry.projectId ? nlohmann::json(*entry.projectId) : nlohmann::json();
}

inline void to_json(nlohmann::json &j, const HealthStatus &health)
{
    j = nlohmann::json{
        {"running", health.running},
        {"hardware", {
            {"relay", health.actuatorOk},
            {"sensor", health.sensorOk},
            {"camera", health.cameraOk}
        }},
        {"simulated", {
            {"relay", health.actuatorSimulated},
            {"sensor", health.sensorSimulated},
            {"camera", health.cameraSimulated}
        }},
        {"lastTickAt", health.lastTickAt ? nlohmann::json(toIso8601Utc(*health.lastTickAt))
                                         : nlohmann::json()},
        {"consecutiveFailures", health.consecutiveFailures},
        {"totalTicks", health.totalTicks}
    };
}

} // namespace sprout
