#include "daemon/sprout_daemon.hpp"

#include <chrono>

#include <QDebug>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "daemon/actuator_accessor.hpp"
#include "daemon/control_loop.hpp"
#include "daemon/sprout_api_server.hpp"
#include "hardware/command_camera.hpp"
#include "hardware/gpio_relay_actuator.hpp"
#include "hardware/iio_environment_sensor.hpp"
#include "hardware/log_notification_sink.hpp"
#include "hardware/simulated_actuator.hpp"
#include "hardware/simulated_camera.hpp"
#include "hardware/simulated_environment_sensor.hpp"
#include "hardware/telegram_notification_sink.hpp"

namespace sprout {

namespace {

ControlLoopOptions loopOptions(const SproutConfig &config)
{
    ControlLoopOptions options;
    options.pollInterval = std::chrono::seconds(config.loop.pollIntervalSeconds);
    options.logInterval = std::chrono::seconds(config.loop.logIntervalSeconds);
    options.alertCheckInterval = std::chrono::seconds(config.loop.alertCheckIntervalSeconds);
    options.maxConsecutiveFailures = config.loop.maxConsecutiveFailures;
    options.failureBackoff = std::chrono::seconds(config.loop.failureBackoffSeconds);
    options.stopTimeout = std::chrono::seconds(config.loop.stopTimeoutSeconds);
    options.dataDir = config.dataDir;
    options.devices = config.deviceNames();
    if (!config.loop.dailyReportTime.empty()) {
        options.dailyReportAt = parseTimeOfDay(config.loop.dailyReportTime);
        if (!options.dailyReportAt) {
            qWarning() << "Sprout: invalid daily report time"
                       << QString::fromStdString(config.loop.dailyReportTime);
            SLOG_WARN(QStringLiteral("SproutDaemon"),
                      QStringLiteral("loopOptions"),
                      QStringLiteral("daily_report_disabled"),
                      QStringLiteral("invalid_daily_report_time"),
                      QStringLiteral("skip_report"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"value", config.loop.dailyReportTime}}));
        }
    }
    return options;
}

void logFallback(const QString &what, const QString &why)
{
    qWarning() << "Sprout:" << what << "unavailable, using simulated" << why;
    SLOG_WARN(QStringLiteral("SproutDaemon"),
              QStringLiteral("buildHardware"),
              QStringLiteral("hardware_fallback"),
              why,
              QStringLiteral("simulated"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"device", what.toStdString()}}));
}

} // namespace

SproutDaemon::SproutDaemon(SproutConfig config, QObject *parent)
    : QObject(parent)
    , m_config(std::move(config))
    , m_apiStore(std::make_unique<SproutStore>(m_config.databasePath()))
    , m_loopStore(std::make_unique<SproutStore>(m_config.databasePath()))
{
    std::string integrityMessage;
    if (!m_apiStore->integrityCheck(&integrityMessage)) {
        qWarning() << "Sprout: SQLite integrity check failed, database may be corrupt:"
                   << QString::fromStdString(integrityMessage);
    }

    seedDefaults();
    buildHardware();

    m_loop = std::make_unique<ControlLoop>(*m_loopStore, *m_actuator, *m_sensor, *m_camera,
                                           *m_notifier, loopOptions(m_config));
    m_apiServer = std::make_unique<SproutApiServer>(*m_apiStore, *m_actuator, *m_loop);
}

SproutDaemon::~SproutDaemon()
{
    if (m_loop && m_loop->isRunning()) {
        m_loop->stop();
    }
}

bool SproutDaemon::start()
{
    qInfo() << "Sprout: daemon starting, data in" << QString::fromStdString(m_config.dataDir);

    if (!m_loop->start()) {
        if (m_actuator->isSimulated()) {
            return false;
        }
        logFallback(QStringLiteral("relay board"), QStringLiteral("actuator_init_failed"));
        m_actuator->replace(std::make_unique<SimulatedActuator>(m_config.deviceNames()));
        if (!m_loop->start()) {
            qWarning() << "Sprout: simulated relays failed to start";
            return false;
        }
    }

    if (!m_apiServer->start()) {
        qWarning() << "Sprout: API server unavailable, control loop keeps running";
    }

    SLOG_INFO(QStringLiteral("SproutDaemon"),
              QStringLiteral("start"),
              QStringLiteral("daemon_started"),
              QStringLiteral("user_start"),
              QStringLiteral("control_loop_and_api"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"devices", m_config.deviceNames()},
                             {"relaySimulated", m_actuator->isSimulated()},
                             {"sensorSimulated", m_sensor->isSimulated()},
                             {"cameraSimulated", m_camera->isSimulated()}}));
    return true;
}

void SproutDaemon::stop()
{
    if (m_loop->isRunning()) {
        m_loop->stop();
    }
    qInfo() << "Sprout: daemon stopped";
}

void SproutDaemon::seedDefaults()
{
    const auto now = std::chrono::system_clock::now();
    int seeded = 0;
    for (const auto &device : m_config.deviceNames()) {
        const auto existing = m_apiStore->getDeviceConfig(device);
        if (!existing) {
            m_apiStore->saveDeviceConfig(defaultDeviceConfig(m_config, device), now);
            ++seeded;
            continue;
        }
        // Configured role overrides win over whatever was stored before.
        const auto role = m_config.roleOverrides.find(device);
        if (role != m_config.roleOverrides.end() && existing->role != role->second) {
            DeviceConfig updated = *existing;
            updated.role = role->second;
            m_apiStore->saveDeviceConfig(updated, now);
        }
    }

    if (!m_apiStore->getAlertConfig()) {
        m_apiStore->saveAlertConfig(m_config.defaultAlerts, now);
    }

    SLOG_INFO(QStringLiteral("SproutDaemon"),
              QStringLiteral("seedDefaults"),
              QStringLiteral("defaults_seeded"),
              QStringLiteral("startup"),
              QStringLiteral("insert_missing"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"devicesSeeded", seeded}}));
}

void SproutDaemon::buildHardware()
{
    const bool simulate = m_config.simulate;

    if (simulate) {
        m_actuator = std::make_unique<ActuatorAccessor>(
            std::make_unique<SimulatedActuator>(m_config.deviceNames()));
    } else {
        m_actuator = std::make_unique<ActuatorAccessor>(
            std::make_unique<GpioRelayActuator>(m_config.gpio));
    }

    if (!simulate) {
        auto sensor = std::make_unique<IioEnvironmentSensor>(m_config.sensor);
        if (sensor->initialize()) {
            m_sensor = std::move(sensor);
        } else {
            logFallback(QStringLiteral("sensor"), QStringLiteral("sensor_init_failed"));
        }
    }
    if (!m_sensor) {
        m_sensor = std::make_unique<SimulatedEnvironmentSensor>();
        m_sensor->initialize();
    }

    if (!simulate) {
        auto camera = std::make_unique<CommandCamera>(m_config.camera);
        if (camera->initialize()) {
            m_camera = std::move(camera);
        } else {
            logFallback(QStringLiteral("camera"), QStringLiteral("camera_init_failed"));
        }
    }
    if (!m_camera) {
        m_camera = std::make_unique<SimulatedCamera>();
        m_camera->initialize();
    }

    auto telegram = std::make_unique<TelegramNotificationSink>(m_config.telegram);
    if (telegram->isConfigured()) {
        m_notifier = std::move(telegram);
    } else {
        m_notifier = std::make_unique<LogNotificationSink>();
    }
}

} // namespace sprout
