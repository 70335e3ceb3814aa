#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "common/models.hpp"
#include "daemon/actuator_accessor.hpp"
#include "daemon/alert_throttler.hpp"
#include "daemon/capture_cadence_tracker.hpp"
#include "daemon/device_rule_evaluator.hpp"
#include "daemon/sprout_store.hpp"
#include "hardware/capturer.hpp"
#include "hardware/notification_sink.hpp"
#include "hardware/sensor_source.hpp"

namespace sprout {

struct ControlLoopOptions {
    std::chrono::seconds pollInterval{30};
    std::chrono::seconds logInterval{60};
    std::chrono::seconds alertCheckInterval{60};
    int maxConsecutiveFailures = 10;
    std::chrono::seconds failureBackoff{60};
    std::chrono::seconds stopTimeout{10};
    // Seconds after local midnight at which the daily report is sent.
    // Unset disables the report.
    std::optional<int> dailyReportAt;
    // Root for photos and per-project time-lapse directories.
    std::string dataDir;
    // Devices to reconcile, in order. Empty means every actuator device.
    std::vector<std::string> devices;
};

// What one tick did. Used for logging and by tests.
struct TickReport {
    std::chrono::system_clock::time_point at;
    bool readingOk = false;
    bool readingLogged = false;
    bool alertsChecked = false;
    std::vector<std::pair<std::string, bool>> deviceChanges;
    std::vector<AlertCondition> alertsSent;
    std::vector<std::string> captures;
    bool dailyReportSent = false;
    int stepsRun = 0;
    int stepsFailed = 0;
    bool aborted = false;

    bool failed() const { return aborted || (stepsRun > 0 && stepsFailed == stepsRun); }
};

// ControlLoop is the device-control decision loop. Every poll interval it reads
// the sensor, logs the reading, reconciles each device against the rule
// evaluator, checks alerts and takes due time-lapse photos. Once a day it also
// sends a summary of the active project through the notification sink.
//
// It runs on its own thread. `store` must not be shared with other threads.
// The remaining collaborators are only used from the loop thread, except the
// ActuatorAccessor which is internally synchronized and the camera which is
// shared with capturePhoto() under the tick lock.
class ControlLoop {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    ControlLoop(SproutStore &store,
                ActuatorAccessor &actuator,
                SensorSource &sensor,
                Capturer &camera,
                NotificationSink &notifier,
                ControlLoopOptions options,
                Clock clock = [] { return std::chrono::system_clock::now(); });
    ~ControlLoop();

    ControlLoop(const ControlLoop &) = delete;
    ControlLoop &operator=(const ControlLoop &) = delete;

    // Returns false only when the actuator cannot be initialized.
    bool start();
    void stop();
    bool isRunning() const;

    // Runs one tick synchronously at the clock's current time.
    TickReport runTick();

    HealthStatus health() const;
    std::optional<EnvironmentReading> lastReading() const;
    bool isTrackingTimelapse(std::int64_t projectId) const;

    void startProjectTimelapse(std::int64_t projectId);
    void stopProjectTimelapse(std::int64_t projectId);
    // Manual photo; defaults to <dataDir>/photos/photo_<timestamp>.jpg.
    std::optional<std::string> capturePhoto(const std::optional<std::string> &path);

private:
    SproutStore &m_store;
    ActuatorAccessor &m_actuator;
    SensorSource &m_sensor;
    Capturer &m_camera;
    NotificationSink &m_notifier;
    ControlLoopOptions m_options;
    Clock m_clock;

    // Held for the whole of a tick and by API calls touching loop state.
    mutable std::mutex m_tickMutex;
    DeviceRuleEvaluator m_evaluator;
    AlertThrottler m_throttler;
    CaptureCadenceTracker m_captureTracker;
    std::optional<std::chrono::system_clock::time_point> m_lastLogAt;
    std::optional<std::chrono::system_clock::time_point> m_lastAlertCheckAt;
    std::map<std::string, std::string> m_seenDeviceConfigs;
    // Local date (YYYY-MM-DD) of the last daily report, loaded lazily from
    // system settings so a restart does not repeat it.
    std::optional<std::string> m_lastReportDate;

    mutable std::mutex m_stateMutex;
    HealthStatus m_health;
    std::optional<EnvironmentReading> m_lastReading;

    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::mutex m_wakeMutex;
    std::condition_variable m_wakeCv;
    bool m_stopRequested = false;
    bool m_threadExited = true;
    bool m_cameraReleasePending = false;

    void run();
    bool sleepFor(std::chrono::seconds duration);
    void releaseResources(bool releaseCamera);

    TickReport tick(std::chrono::system_clock::time_point now);
    bool logReading(const EnvironmentReading &reading,
                    std::chrono::system_clock::time_point now,
                    TickReport &report);
    bool reconcileDevices(const EnvironmentReading &reading,
                          std::chrono::system_clock::time_point now,
                          TickReport &report);
    bool checkAlerts(const EnvironmentReading &reading,
                     std::chrono::system_clock::time_point now,
                     TickReport &report);
    bool captureTimelapses(std::chrono::system_clock::time_point now,
                           TickReport &report);
    bool dailyReportDue(std::chrono::system_clock::time_point now) const;
    bool sendDailyReport(std::chrono::system_clock::time_point now,
                         TickReport &report);

    std::vector<std::string> deviceNames() const;
};

} // namespace sprout
