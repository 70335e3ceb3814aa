#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "common/enums.hpp"

namespace sprout {

struct TimeWindowRule {
    std::string on;
    std::string off;
};

struct DutyCycleRule {
    int durationMinutes = 0;
    int intervalMinutes = 0;
};

struct PulseAtRule {
    std::string time;
    int durationMinutes = 0;
};

using ScheduleRule = std::variant<TimeWindowRule, DutyCycleRule, PulseAtRule>;

struct DeviceThresholds {
    std::optional<double> temperature;
    std::optional<double> humidity;
};

struct DeviceConfig {
    std::string name;
    bool enabled = true;
    DeviceMode mode = DeviceMode::Manual;
    std::vector<ScheduleRule> schedule;
    DeviceThresholds thresholds;
    DeviceRole role = DeviceRole::None;
};

struct EnvironmentReading {
    double temperature = 0.0;
    double humidity = 0.0;
    double pressure = 0.0;
    double gasResistance = 0.0;
    std::chrono::system_clock::time_point capturedAt;
};

struct Project {
    std::int64_t id = 0;
    std::string name;
    std::string notes;
    ProjectStatus status = ProjectStatus::Active;
    std::chrono::system_clock::time_point startDate;
    std::optional<std::chrono::system_clock::time_point> endDate;
    bool timelapseEnabled = true;
    int timelapseIntervalSeconds = 300;
    std::optional<std::chrono::system_clock::time_point> lastCaptureAt;
};

struct AlertConfig {
    bool enabled = true;
    std::optional<double> tempMin;
    std::optional<double> tempMax;
    std::optional<double> humidityMin;
    std::optional<double> humidityMax;
    int notificationIntervalSeconds = 300;
};

struct AlertCondition {
    std::string key;
    std::string message;
};

struct SensorLogEntry {
    std::int64_t id = 0;
    std::optional<std::int64_t> projectId;
    EnvironmentReading reading;
};

struct TimelapseImage {
    std::int64_t id = 0;
    std::int64_t projectId = 0;
    std::chrono::system_clock::time_point timestamp;
    std::string filepath;
};

struct HealthStatus {
    bool running = false;
    bool actuatorOk = false;
    bool sensorOk = false;
    bool cameraOk = false;
    bool actuatorSimulated = false;
    bool sensorSimulated = false;
    bool cameraSimulated = false;
    std::optional<std::chrono::system_clock::time_point> lastTickAt;
    int consecutiveFailures = 0;
    std::uint64_t totalTicks = 0;
};

} // namespace sprout
