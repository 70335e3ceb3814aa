#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace sprout {

struct LoopSettings {
    int pollIntervalSeconds = 30;
    int logIntervalSeconds = 60;
    int alertCheckIntervalSeconds = 60;
    int maxConsecutiveFailures = 10;
    int failureBackoffSeconds = 60;
    int stopTimeoutSeconds = 10;
    // Local "HH:MM" for the daily report; empty disables it.
    std::string dailyReportTime = "08:00";
};

struct GpioSettings {
    std::string sysfsRoot = "/sys/class/gpio";
    // Relay boards on the tent are wired active-low: LOW energizes the relay.
    bool activeLow = true;
    // Added to every pin to get the sysfs GPIO number (gpiochip base).
    int pinOffset = 0;
    // BCM pin per device, in configuration order.
    std::vector<std::pair<std::string, int>> pins;
};

struct SensorSettings {
    // Empty: search /sys/bus/iio/devices for a device named `iioName`.
    std::string iioDevicePath;
    std::string iioName = "bme680";
};

struct CameraSettings {
    std::string command = "rpicam-still";
    int width = 1920;
    int height = 1080;
    int rotation = 0;
    int timeoutSeconds = 15;
};

struct TelegramSettings {
    std::string botToken;
    std::string chatId;
    int timeoutSeconds = 10;
};

struct SproutConfig {
    std::string dataDir;
    bool simulate = false;
    std::string logLevel = "INFO";
    LoopSettings loop;
    GpioSettings gpio;
    SensorSettings sensor;
    CameraSettings camera;
    TelegramSettings telegram;
    AlertConfig defaultAlerts;
    std::map<std::string, nlohmann::json> defaultDeviceSettings;
    std::map<std::string, DeviceRole> roleOverrides;

    std::vector<std::string> deviceNames() const;
    std::string databasePath() const;
    std::string photosDir() const;
    std::string projectTimelapseDir(std::int64_t projectId) const;
};

// Built-in configuration used when no settings file is present.
SproutConfig defaultConfig();

std::string defaultConfigPath();
std::string defaultDataDir();

// Loads the settings file at `path` on top of the defaults. A missing file
// yields the defaults; a malformed file is logged and ignored.
SproutConfig loadConfig(const std::string &path);
SproutConfig configFromJson(const nlohmann::json &j);

void applyEnvironmentOverrides(SproutConfig &config);

// Default device configuration for `deviceName`, with any configured role
// override applied.
DeviceConfig defaultDeviceConfig(const SproutConfig &config, const std::string &deviceName);

} // namespace sprout
