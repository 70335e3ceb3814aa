#include "common/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <QString>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace sprout {

namespace {

std::string homeDir()
{
    const char *home = std::getenv("HOME");
    return home ? home : ".";
}

nlohmann::json builtinDeviceSettings()
{
    return nlohmann::json{
        {"lights", {
            {"enabled", true},
            {"mode", "schedule"},
            {"schedule", {{{"on", "06:00"}, {"off", "22:00"}}}}
        }},
        {"air_pump", {
            {"enabled", true},
            {"mode", "schedule"},
            {"schedule", {{{"on", "00:00"}, {"off", "23:59"}}}}
        }},
        {"nutrient_pump", {
            {"enabled", true},
            {"mode", "schedule"},
            {"schedule", {{{"time", "08:00"}, {"duration", 5}},
                          {{"time", "20:00"}, {"duration", 5}}}}
        }},
        {"circulatory_fan_1", {
            {"enabled", true},
            {"mode", "schedule"},
            {"schedule", {{{"on", "00:00"}, {"off", "23:59"}}}}
        }},
        {"circulatory_fan_2", {
            {"enabled", true},
            {"mode", "schedule"},
            {"schedule", {{{"on", "00:00"}, {"off", "23:59"}}}}
        }},
        {"exhaust_fan", {
            {"enabled", true},
            {"mode", "auto"},
            {"schedule", {{{"duration", 15}, {"interval", 60}}}},
            {"thresholds", {{"temp_threshold", 28.0}, {"humidity_threshold", 75.0}}}
        }},
        {"humidifier", {
            {"enabled", true},
            {"mode", "threshold"},
            {"thresholds", {{"humidity_threshold", 50.0}}}
        }},
        {"heater", {
            {"enabled", true},
            {"mode", "threshold"},
            {"thresholds", {{"temp_threshold", 18.0}}}
        }},
        {"dehumidifier", {
            {"enabled", true},
            {"mode", "threshold"},
            {"thresholds", {{"humidity_threshold", 70.0}}}
        }}
    };
}

int positiveOr(const nlohmann::json &j, const char *key, int fallback)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) {
        return fallback;
    }
    const int value = it->get<int>();
    return value > 0 ? value : fallback;
}

void logConfigWarning(const QString &what, const nlohmann::json &context)
{
    SLOG_WARN(QStringLiteral("Config"),
              QStringLiteral("loadConfig"),
              what,
              QStringLiteral("config_load"),
              QStringLiteral("json_parse"),
              logging::defaultWho(),
              QString(),
              context);
}

} // namespace

std::vector<std::string> SproutConfig::deviceNames() const
{
    std::vector<std::string> names;
    names.reserve(gpio.pins.size());
    for (const auto &pin : gpio.pins) {
        names.push_back(pin.first);
    }
    return names;
}

std::string SproutConfig::databasePath() const
{
    return (std::filesystem::path(dataDir) / "sprout.db").string();
}

std::string SproutConfig::photosDir() const
{
    return (std::filesystem::path(dataDir) / "photos").string();
}

std::string SproutConfig::projectTimelapseDir(std::int64_t projectId) const
{
    return (std::filesystem::path(dataDir) / "projects" / std::to_string(projectId)
            / "timelapse").string();
}

std::string defaultDataDir()
{
    return homeDir() + "/.local/share/sprout";
}

std::string defaultConfigPath()
{
    const char *xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig) {
        return std::string(xdgConfig) + "/sprout/settings.json";
    }
    return homeDir() + "/.config/sprout/settings.json";
}

SproutConfig defaultConfig()
{
    SproutConfig config;
    config.dataDir = defaultDataDir();
    config.gpio.pins = {
        {"lights", 5},
        {"air_pump", 6},
        {"nutrient_pump", 13},
        {"circulatory_fan_1", 16},
        {"circulatory_fan_2", 19},
        {"exhaust_fan", 20},
        {"humidifier", 21},
        {"heater", 23},
        {"dehumidifier", 24},
    };

    config.defaultAlerts.enabled = true;
    config.defaultAlerts.tempMin = 15.0;
    config.defaultAlerts.tempMax = 32.0;
    config.defaultAlerts.humidityMin = 40.0;
    config.defaultAlerts.humidityMax = 80.0;
    config.defaultAlerts.notificationIntervalSeconds = 300;

    for (const auto &item : builtinDeviceSettings().items()) {
        config.defaultDeviceSettings[item.key()] = item.value();
    }
    return config;
}

SproutConfig configFromJson(const nlohmann::json &j)
{
    SproutConfig config = defaultConfig();
    if (!j.is_object()) {
        return config;
    }

    if (j.contains("data_dir") && j.at("data_dir").is_string()) {
        config.dataDir = j.at("data_dir").get<std::string>();
    }
    config.simulate = j.value("simulate", config.simulate);

    if (j.contains("logging") && j.at("logging").is_object()) {
        config.logLevel = j.at("logging").value("level", config.logLevel);
    }

    if (j.contains("loop") && j.at("loop").is_object()) {
        const auto &loop = j.at("loop");
        config.loop.pollIntervalSeconds =
            positiveOr(loop, "poll_interval", config.loop.pollIntervalSeconds);
        config.loop.logIntervalSeconds =
            positiveOr(loop, "log_interval", config.loop.logIntervalSeconds);
        config.loop.alertCheckIntervalSeconds =
            positiveOr(loop, "alert_check_interval", config.loop.alertCheckIntervalSeconds);
        config.loop.maxConsecutiveFailures =
            positiveOr(loop, "max_consecutive_failures", config.loop.maxConsecutiveFailures);
        config.loop.failureBackoffSeconds =
            positiveOr(loop, "failure_backoff", config.loop.failureBackoffSeconds);
        config.loop.stopTimeoutSeconds =
            positiveOr(loop, "stop_timeout", config.loop.stopTimeoutSeconds);
        if (loop.contains("daily_report_time")) {
            const auto &reportTime = loop.at("daily_report_time");
            if (reportTime.is_string()) {
                config.loop.dailyReportTime = reportTime.get<std::string>();
            } else if (reportTime.is_null()) {
                config.loop.dailyReportTime.clear();
            } else {
                logConfigWarning(QStringLiteral("config_daily_report_time_ignored"),
                                 nlohmann::json{{"value", reportTime}});
            }
        }
    }

    if (j.contains("gpio") && j.at("gpio").is_object()) {
        const auto &gpio = j.at("gpio");
        config.gpio.sysfsRoot = gpio.value("sysfs_root", config.gpio.sysfsRoot);
        config.gpio.activeLow = gpio.value("active_low", config.gpio.activeLow);
        config.gpio.pinOffset = gpio.value("pin_offset", config.gpio.pinOffset);
        if (gpio.contains("pins") && gpio.at("pins").is_object()) {
            config.gpio.pins.clear();
            for (const auto &item : gpio.at("pins").items()) {
                if (!item.value().is_number_integer()) {
                    logConfigWarning(QStringLiteral("config_pin_ignored"),
                                     nlohmann::json{{"device", item.key()}});
                    continue;
                }
                config.gpio.pins.emplace_back(item.key(), item.value().get<int>());
            }
        }
    }

    if (j.contains("sensor") && j.at("sensor").is_object()) {
        const auto &sensor = j.at("sensor");
        config.sensor.iioDevicePath = sensor.value("iio_device", config.sensor.iioDevicePath);
        config.sensor.iioName = sensor.value("iio_name", config.sensor.iioName);
    }

    if (j.contains("camera") && j.at("camera").is_object()) {
        const auto &camera = j.at("camera");
        config.camera.command = camera.value("command", config.camera.command);
        config.camera.width = positiveOr(camera, "width", config.camera.width);
        config.camera.height = positiveOr(camera, "height", config.camera.height);
        config.camera.rotation = camera.value("rotation", config.camera.rotation);
        config.camera.timeoutSeconds =
            positiveOr(camera, "timeout", config.camera.timeoutSeconds);
    }

    if (j.contains("telegram") && j.at("telegram").is_object()) {
        const auto &telegram = j.at("telegram");
        config.telegram.botToken = telegram.value("bot_token", config.telegram.botToken);
        config.telegram.chatId = telegram.value("chat_id", config.telegram.chatId);
        config.telegram.timeoutSeconds =
            positiveOr(telegram, "timeout", config.telegram.timeoutSeconds);
    }

    if (j.contains("alerts") && j.at("alerts").is_object()) {
        config.defaultAlerts = j.at("alerts").get<AlertConfig>();
    }

    if (j.contains("devices") && j.at("devices").is_object()) {
        for (const auto &item : j.at("devices").items()) {
            config.defaultDeviceSettings[item.key()] = item.value();
        }
    }

    if (j.contains("device_roles") && j.at("device_roles").is_object()) {
        for (const auto &item : j.at("device_roles").items()) {
            const auto role = item.value().is_string()
                ? parseDeviceRole(item.value().get<std::string>())
                : std::nullopt;
            if (!role) {
                logConfigWarning(QStringLiteral("config_role_ignored"),
                                 nlohmann::json{{"device", item.key()},
                                                {"value", item.value()}});
                continue;
            }
            config.roleOverrides[item.key()] = *role;
        }
    }

    return config;
}

SproutConfig loadConfig(const std::string &path)
{
    const std::string configPath = path.empty() ? defaultConfigPath() : path;
    std::ifstream in(configPath);
    if (!in) {
        SLOG_INFO(QStringLiteral("Config"),
                  QStringLiteral("loadConfig"),
                  QStringLiteral("config_defaults"),
                  QStringLiteral("no_settings_file"),
                  QStringLiteral("builtin_defaults"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"path", configPath}});
        return defaultConfig();
    }

    const auto parsed = nlohmann::json::parse(in, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        logConfigWarning(QStringLiteral("config_malformed"),
                         nlohmann::json{{"path", configPath}});
        return defaultConfig();
    }

    try {
        return configFromJson(parsed);
    } catch (const nlohmann::json::exception &ex) {
        logConfigWarning(QStringLiteral("config_malformed"),
                         nlohmann::json{{"path", configPath}, {"error", ex.what()}});
        return defaultConfig();
    }
}

void applyEnvironmentOverrides(SproutConfig &config)
{
    const QString dataDir = qEnvironmentVariable("SPROUT_DATA_DIR");
    if (!dataDir.isEmpty()) {
        config.dataDir = dataDir.toStdString();
    }

    bool ok = false;
    const int poll = qEnvironmentVariableIntValue("SPROUT_POLL_INTERVAL", &ok);
    if (ok && poll > 0) {
        config.loop.pollIntervalSeconds = poll;
    }

    const QString token = qEnvironmentVariable("SPROUT_TELEGRAM_TOKEN");
    if (!token.isEmpty()) {
        config.telegram.botToken = token.toStdString();
    }
    const QString chatId = qEnvironmentVariable("SPROUT_TELEGRAM_CHAT_ID");
    if (!chatId.isEmpty()) {
        config.telegram.chatId = chatId.toStdString();
    }

    if (qEnvironmentVariableIntValue("SPROUT_SIMULATE") == 1) {
        config.simulate = true;
    }
}

DeviceConfig defaultDeviceConfig(const SproutConfig &config, const std::string &deviceName)
{
    nlohmann::json settings = nlohmann::json{{"enabled", true}, {"mode", "manual"}};
    auto it = config.defaultDeviceSettings.find(deviceName);
    if (it != config.defaultDeviceSettings.end()) {
        settings = it->second;
    }

    std::vector<std::string> errors;
    DeviceConfig device = deviceConfigFromJson(deviceName, settings, &errors);
    for (const auto &error : errors) {
        logConfigWarning(QStringLiteral("config_device_default_invalid"),
                         nlohmann::json{{"device", deviceName}, {"error", error}});
    }

    auto role = config.roleOverrides.find(deviceName);
    if (role != config.roleOverrides.end()) {
        device.role = role->second;
    }
    return device;
}

} // namespace sprout
