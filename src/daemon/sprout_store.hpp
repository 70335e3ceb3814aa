#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace sprout {

// SproutStore is the SQLite access layer for all persistent data: projects,
// sensor history, device settings and states, alert settings, time-lapse
// images and free-form settings.
//
// One instance wraps one connection and must only be used from one thread.
// The control loop and the API server each open their own.
class SproutStore {
public:
    SproutStore();
    explicit SproutStore(const std::string &dbPath);
    ~SproutStore();

    std::string databasePath() const;

    // Projects. At most one project is active at a time.
    Project createProject(const std::string &name,
                          const std::string &notes,
                          bool timelapseEnabled,
                          int timelapseIntervalSeconds,
                          std::chrono::system_clock::time_point now);
    std::optional<Project> getActiveProject() const;
    std::optional<Project> getProject(std::int64_t id) const;
    std::vector<Project> listProjects() const;
    bool endProject(std::int64_t id, std::chrono::system_clock::time_point now);
    bool archiveProject(std::int64_t id);
    bool setProjectTimelapse(std::int64_t id,
                             bool enabled,
                             std::optional<int> intervalSeconds);
    bool updateTimelapseCapture(std::int64_t id,
                                std::chrono::system_clock::time_point capturedAt);
    std::vector<Project> projectsNeedingTimelapse() const;

    // Sensor history.
    std::int64_t logSensorReading(const EnvironmentReading &reading,
                                  std::optional<std::int64_t> projectId);
    std::optional<SensorLogEntry> latestSensorReading() const;
    std::vector<SensorLogEntry> sensorReadingsBetween(
        std::chrono::system_clock::time_point from,
        std::chrono::system_clock::time_point to,
        std::optional<std::int64_t> projectId = std::nullopt,
        int limit = 1000) const;

    // Device configuration and last driven state.
    std::optional<DeviceConfig> getDeviceConfig(const std::string &deviceName) const;
    void saveDeviceConfig(const DeviceConfig &config,
                          std::chrono::system_clock::time_point now);
    std::vector<DeviceConfig> listDeviceConfigs() const;

    void setDeviceState(const std::string &deviceName,
                        bool on,
                        std::chrono::system_clock::time_point now);
    std::optional<bool> getDeviceState(const std::string &deviceName) const;
    std::map<std::string, bool> listDeviceStates() const;

    // Global alert settings (a single row).
    std::optional<AlertConfig> getAlertConfig() const;
    void saveAlertConfig(const AlertConfig &config,
                         std::chrono::system_clock::time_point now);

    // Time-lapse images, append-only.
    std::int64_t addTimelapseImage(std::int64_t projectId,
                                   std::chrono::system_clock::time_point timestamp,
                                   const std::string &filepath);
    std::vector<TimelapseImage> listTimelapseImages(std::int64_t projectId,
                                                    int limit = 0) const;
    int countTimelapseImages(std::int64_t projectId) const;

    std::optional<std::string> getSetting(const std::string &key) const;
    void setSetting(const std::string &key,
                    const std::string &value,
                    std::chrono::system_clock::time_point now);

    bool integrityCheck(std::string *message) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace sprout
