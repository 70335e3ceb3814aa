#include "daemon/control_loop.hpp"

#include <algorithm>
#include <ctime>
#include <exception>
#include <filesystem>

#include <QDebug>
#include <QString>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace sprout {

namespace {

std::string localTimestamp(std::chrono::system_clock::time_point t)
{
    std::time_t raw = std::chrono::system_clock::to_time_t(t);
    std::tm localTime{};
    localtime_r(&raw, &localTime);
    char buffer[32] = {};
    std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &localTime);
    return buffer;
}

constexpr const char *kLastReportDateKey = "daily_report_last_date";

std::tm toLocalTm(std::chrono::system_clock::time_point t)
{
    std::time_t raw = std::chrono::system_clock::to_time_t(t);
    std::tm localTime{};
    localtime_r(&raw, &localTime);
    return localTime;
}

std::string localDate(std::chrono::system_clock::time_point t)
{
    const std::tm localTime = toLocalTm(t);
    char buffer[16] = {};
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &localTime);
    return buffer;
}

std::chrono::system_clock::time_point localMidnight(std::chrono::system_clock::time_point t)
{
    std::tm midnight = toLocalTm(t);
    midnight.tm_hour = 0;
    midnight.tm_min = 0;
    midnight.tm_sec = 0;
    midnight.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&midnight));
}

struct ValueSummary {
    double min = 0.0;
    double max = 0.0;
    double average = 0.0;
};

template <typename Getter>
ValueSummary summarize(const std::vector<SensorLogEntry> &entries, Getter value)
{
    ValueSummary summary;
    summary.min = value(entries.front());
    summary.max = summary.min;
    double total = 0.0;
    for (const auto &entry : entries) {
        const double v = value(entry);
        summary.min = std::min(summary.min, v);
        summary.max = std::max(summary.max, v);
        total += v;
    }
    summary.average = total / static_cast<double>(entries.size());
    return summary;
}

std::string formatSummary(const ValueSummary &summary, const std::string &unit)
{
    auto oneDecimal = [](double v) { return QString::number(v, 'f', 1).toStdString(); };
    return "  Min: " + oneDecimal(summary.min) + unit + "\n"
        + "  Max: " + oneDecimal(summary.max) + unit + "\n"
        + "  Avg: " + oneDecimal(summary.average) + unit + "\n";
}

void logStepFailure(const QString &where, const std::exception &ex, nlohmann::json context)
{
    context["error"] = ex.what();
    SLOG_ERROR(QStringLiteral("ControlLoop"),
               where,
               QStringLiteral("tick_step_failed"),
               QStringLiteral("control_tick"),
               QStringLiteral("catch_and_continue"),
               logging::defaultWho(),
               QString(),
               context);
}

} // namespace

ControlLoop::ControlLoop(SproutStore &store,
                         ActuatorAccessor &actuator,
                         SensorSource &sensor,
                         Capturer &camera,
                         NotificationSink &notifier,
                         ControlLoopOptions options,
                         Clock clock)
    : m_store(store)
    , m_actuator(actuator)
    , m_sensor(sensor)
    , m_camera(camera)
    , m_notifier(notifier)
    , m_options(std::move(options))
    , m_clock(std::move(clock))
{
    m_health.actuatorSimulated = m_actuator.isSimulated();
    m_health.sensorSimulated = m_sensor.isSimulated();
    m_health.cameraSimulated = m_camera.isSimulated();
    m_health.cameraOk = true;
}

ControlLoop::~ControlLoop()
{
    if (m_running) {
        stop();
    }
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

bool ControlLoop::start()
{
    if (m_running) {
        SLOG_WARN(QStringLiteral("ControlLoop"),
                  QStringLiteral("start"),
                  QStringLiteral("already_running"),
                  QStringLiteral("start_requested"),
                  QStringLiteral("ignore"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json::object());
        return true;
    }

    if (!m_actuator.isAvailable() && !m_actuator.initialize()) {
        SLOG_ERROR(QStringLiteral("ControlLoop"),
                   QStringLiteral("start"),
                   QStringLiteral("actuator_init_failed"),
                   QStringLiteral("start_requested"),
                   QStringLiteral("refuse_start"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_health.actuatorOk = false;
        return false;
    }

    // A previous stop() may have timed out waiting for the thread.
    if (m_thread.joinable()) {
        m_thread.join();
    }

    {
        std::lock_guard<std::mutex> tickLock(m_tickMutex);
        m_lastLogAt.reset();
        m_lastAlertCheckAt.reset();
    }
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_health.running = true;
        m_health.actuatorOk = true;
        m_health.actuatorSimulated = m_actuator.isSimulated();
        m_health.consecutiveFailures = 0;
    }
    {
        std::lock_guard<std::mutex> lock(m_wakeMutex);
        m_stopRequested = false;
        m_threadExited = false;
        m_cameraReleasePending = false;
    }

    m_running = true;
    m_thread = std::thread(&ControlLoop::run, this);

    SLOG_INFO(QStringLiteral("ControlLoop"),
              QStringLiteral("start"),
              QStringLiteral("control_loop_started"),
              QStringLiteral("start_requested"),
              QStringLiteral("dedicated_thread"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"pollIntervalSeconds", m_options.pollInterval.count()},
                             {"logIntervalSeconds", m_options.logInterval.count()},
                             {"alertCheckIntervalSeconds",
                              m_options.alertCheckInterval.count()},
                             {"actuatorSimulated", m_actuator.isSimulated()},
                             {"sensorSimulated", m_sensor.isSimulated()},
                             {"cameraSimulated", m_camera.isSimulated()}});
    return true;
}

void ControlLoop::stop()
{
    if (!m_running) {
        SLOG_WARN(QStringLiteral("ControlLoop"),
                  QStringLiteral("stop"),
                  QStringLiteral("not_running"),
                  QStringLiteral("stop_requested"),
                  QStringLiteral("ignore"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json::object());
        return;
    }
    m_running = false;

    bool exited = false;
    {
        std::unique_lock<std::mutex> lock(m_wakeMutex);
        m_stopRequested = true;
        m_wakeCv.notify_all();
        exited = m_wakeCv.wait_for(lock, m_options.stopTimeout, [this] {
            return m_threadExited;
        });
        if (!exited) {
            m_cameraReleasePending = true;
        }
    }

    if (exited) {
        m_thread.join();
    } else {
        SLOG_WARN(QStringLiteral("ControlLoop"),
                  QStringLiteral("stop"),
                  QStringLiteral("tick_still_running"),
                  QStringLiteral("stop_requested"),
                  QStringLiteral("release_without_join"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"stopTimeoutSeconds", m_options.stopTimeout.count()}});
    }

    releaseResources(exited);

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_health.running = false;
        m_health.actuatorOk = false;
    }

    SLOG_INFO(QStringLiteral("ControlLoop"),
              QStringLiteral("stop"),
              QStringLiteral("control_loop_stopped"),
              QStringLiteral("stop_requested"),
              QStringLiteral("relays_off"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"joined", exited}});
}

bool ControlLoop::isRunning() const
{
    return m_running;
}

void ControlLoop::run()
{
    while (true) {
        {
            std::lock_guard<std::mutex> lock(m_wakeMutex);
            if (m_stopRequested) {
                break;
            }
        }

        runTick();

        bool backoff = false;
        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            if (m_health.consecutiveFailures >= m_options.maxConsecutiveFailures) {
                backoff = true;
                m_health.consecutiveFailures = 0;
            }
        }

        if (backoff) {
            qWarning() << "Sprout: control loop failed repeatedly, backing off.";
            SLOG_ERROR(QStringLiteral("ControlLoop"),
                       QStringLiteral("run"),
                       QStringLiteral("tick_failure_backoff"),
                       QStringLiteral("consecutive_tick_failures"),
                       QStringLiteral("extended_sleep"),
                       logging::defaultWho(),
                       QString(),
                       nlohmann::json{{"maxConsecutiveFailures",
                                       m_options.maxConsecutiveFailures},
                                      {"backoffSeconds", m_options.failureBackoff.count()}});
        }

        if (!sleepFor(backoff ? m_options.failureBackoff : m_options.pollInterval)) {
            break;
        }
    }

    // capturePhoto() may be using the camera from an API thread.
    std::lock_guard<std::mutex> tickLock(m_tickMutex);
    std::lock_guard<std::mutex> lock(m_wakeMutex);
    if (m_cameraReleasePending) {
        m_camera.release();
        m_cameraReleasePending = false;
    }
    m_threadExited = true;
    m_wakeCv.notify_all();
}

bool ControlLoop::sleepFor(std::chrono::seconds duration)
{
    std::unique_lock<std::mutex> lock(m_wakeMutex);
    m_wakeCv.wait_for(lock, duration, [this] { return m_stopRequested; });
    return !m_stopRequested;
}

void ControlLoop::releaseResources(bool releaseCamera)
{
    m_actuator.turnAllOff();
    m_actuator.release();
    if (releaseCamera) {
        m_camera.release();
    }
}

TickReport ControlLoop::runTick()
{
    std::lock_guard<std::mutex> tickLock(m_tickMutex);
    const auto now = m_clock();

    std::uint64_t tickNumber = 0;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        tickNumber = m_health.totalTicks + 1;
    }
    logging::CorrelationScope scope(QStringLiteral("tick-%1").arg(tickNumber));

    TickReport report;
    try {
        report = tick(now);
    } catch (const std::exception &ex) {
        report.at = now;
        report.aborted = true;
        logStepFailure(QStringLiteral("runTick"), ex, nlohmann::json::object());
    }

    const bool failed = report.failed();
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_health.lastTickAt = now;
        m_health.totalTicks = tickNumber;
        m_health.consecutiveFailures = failed ? m_health.consecutiveFailures + 1 : 0;
        m_health.actuatorOk = m_actuator.isAvailable();
    }

    SLOG_DEBUG(QStringLiteral("ControlLoop"),
               QStringLiteral("runTick"),
               QStringLiteral("tick_complete"),
               QStringLiteral("poll_interval"),
               QStringLiteral("sequential_steps"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"readingOk", report.readingOk},
                              {"readingLogged", report.readingLogged},
                              {"deviceChanges", report.deviceChanges.size()},
                              {"alertsSent", report.alertsSent.size()},
                              {"captures", report.captures.size()},
                              {"stepsRun", report.stepsRun},
                              {"stepsFailed", report.stepsFailed}});
    return report;
}

TickReport ControlLoop::tick(std::chrono::system_clock::time_point now)
{
    TickReport report;
    report.at = now;

    std::optional<EnvironmentReading> reading;
    ++report.stepsRun;
    try {
        reading = m_sensor.read();
    } catch (const std::exception &ex) {
        ++report.stepsFailed;
        logStepFailure(QStringLiteral("readSensor"), ex, nlohmann::json::object());
    }

    if (reading) {
        reading->capturedAt = now;
        report.readingOk = true;
        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            m_lastReading = reading;
            m_health.sensorOk = true;
        }

        ++report.stepsRun;
        if (!logReading(*reading, now, report)) {
            ++report.stepsFailed;
        }
        ++report.stepsRun;
        if (!reconcileDevices(*reading, now, report)) {
            ++report.stepsFailed;
        }
        ++report.stepsRun;
        if (!checkAlerts(*reading, now, report)) {
            ++report.stepsFailed;
        }
    } else {
        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            m_health.sensorOk = false;
        }
        SLOG_WARN(QStringLiteral("ControlLoop"),
                  QStringLiteral("tick"),
                  QStringLiteral("sensor_reading_unavailable"),
                  QStringLiteral("control_tick"),
                  QStringLiteral("skip_sensor_steps"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"sensorSimulated", m_sensor.isSimulated()}});
    }

    ++report.stepsRun;
    if (!captureTimelapses(now, report)) {
        ++report.stepsFailed;
    }

    if (dailyReportDue(now)) {
        ++report.stepsRun;
        if (!sendDailyReport(now, report)) {
            ++report.stepsFailed;
        }
    }

    return report;
}

bool ControlLoop::logReading(const EnvironmentReading &reading,
                             std::chrono::system_clock::time_point now,
                             TickReport &report)
{
    if (m_lastLogAt && now - *m_lastLogAt < m_options.logInterval) {
        return true;
    }

    try {
        const auto active = m_store.getActiveProject();
        const std::optional<std::int64_t> projectId =
            active ? std::optional<std::int64_t>(active->id) : std::nullopt;
        m_store.logSensorReading(reading, projectId);
        m_lastLogAt = now;
        report.readingLogged = true;

        SLOG_INFO(QStringLiteral("ControlLoop"),
                  QStringLiteral("logReading"),
                  QStringLiteral("sensor_reading_logged"),
                  QStringLiteral("log_interval_elapsed"),
                  QStringLiteral("sqlite_insert"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"reading", reading},
                                 {"projectId", projectId ? nlohmann::json(*projectId)
                                                         : nlohmann::json()}});
    } catch (const std::exception &ex) {
        logStepFailure(QStringLiteral("logReading"), ex, nlohmann::json::object());
        return false;
    }
    return true;
}

bool ControlLoop::reconcileDevices(const EnvironmentReading &reading,
                                   std::chrono::system_clock::time_point now,
                                   TickReport &report)
{
    bool ok = true;
    for (const auto &name : deviceNames()) {
        try {
            const auto config = m_store.getDeviceConfig(name);
            if (!config) {
                continue;
            }

            // Restart duty cycles whenever the device's settings change.
            const std::string fingerprint = deviceConfigToJson(*config).dump();
            auto seen = m_seenDeviceConfigs.find(name);
            if (seen != m_seenDeviceConfigs.end() && seen->second != fingerprint) {
                m_evaluator.forgetDevice(name);
            }
            m_seenDeviceConfigs[name] = fingerprint;

            const DeviceDecision decision =
                m_evaluator.evaluate(*config, now, reading.temperature, reading.humidity);
            if (decision == DeviceDecision::NoOpinion) {
                continue;
            }

            const bool desired = decision == DeviceDecision::On;
            const auto current = m_actuator.state(name);
            if (current && *current == desired) {
                continue;
            }

            if (!m_actuator.set(name, desired)) {
                SLOG_WARN(QStringLiteral("ControlLoop"),
                          QStringLiteral("reconcileDevices"),
                          QStringLiteral("device_set_failed"),
                          QStringLiteral("rule_decision"),
                          QString::fromStdString(toDeviceModeString(config->mode)),
                          logging::defaultWho(),
                          QString(),
                          nlohmann::json{{"device", name}, {"on", desired}});
                continue;
            }
            report.deviceChanges.emplace_back(name, desired);

            SLOG_INFO(QStringLiteral("ControlLoop"),
                      QStringLiteral("reconcileDevices"),
                      desired ? QStringLiteral("device_turned_on")
                              : QStringLiteral("device_turned_off"),
                      QStringLiteral("rule_decision"),
                      QString::fromStdString(toDeviceModeString(config->mode)),
                      logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"device", name},
                                     {"temperature", reading.temperature},
                                     {"humidity", reading.humidity}});

            // Hardware already switched; a failed write only delays the record.
            m_store.setDeviceState(name, desired, now);
        } catch (const std::exception &ex) {
            ok = false;
            logStepFailure(QStringLiteral("reconcileDevices"), ex,
                           nlohmann::json{{"device", name}});
        }
    }
    return ok;
}

bool ControlLoop::checkAlerts(const EnvironmentReading &reading,
                              std::chrono::system_clock::time_point now,
                              TickReport &report)
{
    if (m_lastAlertCheckAt && now - *m_lastAlertCheckAt < m_options.alertCheckInterval) {
        return true;
    }
    m_lastAlertCheckAt = now;
    report.alertsChecked = true;

    try {
        const auto config = m_store.getAlertConfig();
        if (!config) {
            return true;
        }

        for (const auto &condition : m_throttler.check(reading, *config, now)) {
            SLOG_WARN(QStringLiteral("ControlLoop"),
                      QStringLiteral("checkAlerts"),
                      QStringLiteral("alert_fired"),
                      QStringLiteral("reading_out_of_bounds"),
                      QStringLiteral("notification_sink"),
                      logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"key", condition.key},
                                     {"message", condition.message}});
            if (!m_notifier.send(condition.message)) {
                SLOG_WARN(QStringLiteral("ControlLoop"),
                          QStringLiteral("checkAlerts"),
                          QStringLiteral("alert_not_delivered"),
                          QStringLiteral("notification_sink"),
                          QStringLiteral("best_effort"),
                          logging::defaultWho(),
                          QString(),
                          nlohmann::json{{"key", condition.key}});
            }
            report.alertsSent.push_back(condition);
        }
    } catch (const std::exception &ex) {
        logStepFailure(QStringLiteral("checkAlerts"), ex, nlohmann::json::object());
        return false;
    }
    return true;
}

bool ControlLoop::captureTimelapses(std::chrono::system_clock::time_point now,
                                    TickReport &report)
{
    std::vector<Project> projects;
    try {
        projects = m_store.projectsNeedingTimelapse();
    } catch (const std::exception &ex) {
        logStepFailure(QStringLiteral("captureTimelapses"), ex, nlohmann::json::object());
        return false;
    }

    std::vector<std::int64_t> ids;
    ids.reserve(projects.size());
    for (const auto &project : projects) {
        ids.push_back(project.id);
    }
    m_captureTracker.retain(ids);

    bool ok = true;
    for (const auto &project : projects) {
        try {
            if (!m_captureTracker.due(project, now)) {
                continue;
            }

            const std::filesystem::path path =
                std::filesystem::path(m_options.dataDir) / "projects"
                / std::to_string(project.id) / "timelapse"
                / ("timelapse_" + localTimestamp(now) + ".jpg");
            const auto captured = m_camera.capture(path.string());
            {
                std::lock_guard<std::mutex> lock(m_stateMutex);
                m_health.cameraOk = captured.has_value();
            }
            if (!captured) {
                // The timer is not advanced, so the next tick retries.
                SLOG_WARN(QStringLiteral("ControlLoop"),
                          QStringLiteral("captureTimelapses"),
                          QStringLiteral("timelapse_capture_failed"),
                          QStringLiteral("capture_due"),
                          QStringLiteral("retry_next_tick"),
                          logging::defaultWho(),
                          QString(),
                          nlohmann::json{{"projectId", project.id}});
                continue;
            }

            // The image row comes first so a photo on disk is never unrecorded.
            m_captureTracker.record(project.id, now);
            report.captures.push_back(*captured);
            m_store.addTimelapseImage(project.id, now, *captured);
            m_store.updateTimelapseCapture(project.id, now);

            SLOG_INFO(QStringLiteral("ControlLoop"),
                      QStringLiteral("captureTimelapses"),
                      QStringLiteral("timelapse_captured"),
                      QStringLiteral("capture_due"),
                      QStringLiteral("camera_capture"),
                      logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"projectId", project.id},
                                     {"projectName", project.name},
                                     {"path", *captured}});
        } catch (const std::exception &ex) {
            ok = false;
            logStepFailure(QStringLiteral("captureTimelapses"), ex,
                           nlohmann::json{{"projectId", project.id}});
        }
    }
    return ok;
}

bool ControlLoop::dailyReportDue(std::chrono::system_clock::time_point now) const
{
    if (!m_options.dailyReportAt) {
        return false;
    }
    const std::tm localTime = toLocalTm(now);
    const int secondsToday = localTime.tm_hour * 3600 + localTime.tm_min * 60 + localTime.tm_sec;
    if (secondsToday < *m_options.dailyReportAt) {
        return false;
    }
    return !m_lastReportDate || *m_lastReportDate != localDate(now);
}

bool ControlLoop::sendDailyReport(std::chrono::system_clock::time_point now,
                                  TickReport &report)
{
    const std::string today = localDate(now);
    try {
        if (!m_lastReportDate) {
            m_lastReportDate = m_store.getSetting(kLastReportDateKey).value_or(std::string());
            if (*m_lastReportDate == today) {
                return true;
            }
        }

        const auto project = m_store.getActiveProject();
        const auto entries = project
            ? m_store.sensorReadingsBetween(localMidnight(now), now, project->id, 1000)
            : std::vector<SensorLogEntry>();
        if (!project || entries.empty()) {
            SLOG_INFO(QStringLiteral("ControlLoop"),
                      QStringLiteral("sendDailyReport"),
                      QStringLiteral("daily_report_skipped"),
                      QStringLiteral("daily_report_time"),
                      project ? QStringLiteral("no_readings_today")
                              : QStringLiteral("no_active_project"),
                      logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"date", today}});
        } else {
            const auto temperature = summarize(entries, [](const SensorLogEntry &e) {
                return e.reading.temperature;
            });
            const auto humidity = summarize(entries, [](const SensorLogEntry &e) {
                return e.reading.humidity;
            });
            const int images = m_store.countTimelapseImages(project->id);

            const std::string text = "Daily Report - " + today + "\n\n"
                + "Project: " + project->name + "\n\n"
                + "Temperature:\n" + formatSummary(temperature, "°C") + "\n"
                + "Humidity:\n" + formatSummary(humidity, "%") + "\n"
                + "Time-lapse Images: " + std::to_string(images) + "\n";

            if (!m_notifier.send(text)) {
                SLOG_WARN(QStringLiteral("ControlLoop"),
                          QStringLiteral("sendDailyReport"),
                          QStringLiteral("daily_report_not_delivered"),
                          QStringLiteral("notification_sink"),
                          QStringLiteral("best_effort"),
                          logging::defaultWho(),
                          QString(),
                          nlohmann::json{{"date", today}, {"projectId", project->id}});
            }
            report.dailyReportSent = true;

            SLOG_INFO(QStringLiteral("ControlLoop"),
                      QStringLiteral("sendDailyReport"),
                      QStringLiteral("daily_report_sent"),
                      QStringLiteral("daily_report_time"),
                      QStringLiteral("notification_sink"),
                      logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"date", today},
                                     {"projectId", project->id},
                                     {"readings", entries.size()},
                                     {"timelapseImages", images}});
        }

        m_lastReportDate = today;
        m_store.setSetting(kLastReportDateKey, today, now);
    } catch (const std::exception &ex) {
        logStepFailure(QStringLiteral("sendDailyReport"), ex, nlohmann::json{{"date", today}});
        return false;
    }
    return true;
}

HealthStatus ControlLoop::health() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_health;
}

std::optional<EnvironmentReading> ControlLoop::lastReading() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_lastReading;
}

bool ControlLoop::isTrackingTimelapse(std::int64_t projectId) const
{
    std::lock_guard<std::mutex> tickLock(m_tickMutex);
    return m_captureTracker.isTracking(projectId);
}

void ControlLoop::startProjectTimelapse(std::int64_t projectId)
{
    std::lock_guard<std::mutex> tickLock(m_tickMutex);
    m_captureTracker.forceDue(projectId);
    SLOG_INFO(QStringLiteral("ControlLoop"),
              QStringLiteral("startProjectTimelapse"),
              QStringLiteral("timelapse_started"),
              QStringLiteral("api_request"),
              QStringLiteral("capture_next_tick"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"projectId", projectId}});
}

void ControlLoop::stopProjectTimelapse(std::int64_t projectId)
{
    std::lock_guard<std::mutex> tickLock(m_tickMutex);
    m_captureTracker.drop(projectId);
    SLOG_INFO(QStringLiteral("ControlLoop"),
              QStringLiteral("stopProjectTimelapse"),
              QStringLiteral("timelapse_stopped"),
              QStringLiteral("api_request"),
              QStringLiteral("drop_timer"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"projectId", projectId}});
}

std::optional<std::string> ControlLoop::capturePhoto(const std::optional<std::string> &path)
{
    std::lock_guard<std::mutex> tickLock(m_tickMutex);
    const std::string target = path && !path->empty()
        ? *path
        : (std::filesystem::path(m_options.dataDir) / "photos"
           / ("photo_" + localTimestamp(m_clock()) + ".jpg")).string();

    const auto captured = m_camera.capture(target);
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_health.cameraOk = captured.has_value();
    }
    return captured;
}

std::vector<std::string> ControlLoop::deviceNames() const
{
    if (!m_options.devices.empty()) {
        return m_options.devices;
    }
    return m_actuator.deviceNames();
}

} // namespace sprout
