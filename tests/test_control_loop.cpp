#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <atomic>
#include <ctime>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>

#include <sqlite3.h>

#include "daemon/control_loop.hpp"
#include "hardware/simulated_actuator.hpp"

namespace {

class ScriptedSensor : public sprout::SensorSource
{
public:
    bool initialize() override { return true; }
    std::optional<sprout::EnvironmentReading> read() override
    {
        ++reads;
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        if (failWithException) {
            throw std::runtime_error("i2c read failed");
        }
        return next;
    }
    bool isSimulated() const override { return false; }

    void set(double temperature, double humidity)
    {
        sprout::EnvironmentReading reading;
        reading.temperature = temperature;
        reading.humidity = humidity;
        reading.pressure = 1012.0;
        reading.gasResistance = 42000.0;
        next = reading;
    }

    std::optional<sprout::EnvironmentReading> next;
    bool failWithException = false;
    std::chrono::milliseconds delay{0};
    std::atomic<int> reads{0};
};

class FakeCamera : public sprout::Capturer
{
public:
    bool initialize() override { return true; }
    std::optional<std::string> capture(const std::string &path) override
    {
        capturing = true;
        attempts.push_back(path);
        if (captureDelay.count() > 0) {
            std::this_thread::sleep_for(captureDelay);
        }
        capturing = false;
        if (fail) {
            return std::nullopt;
        }
        return path;
    }
    void release() override
    {
        if (capturing) {
            releasedWhileCapturing = true;
        }
        ++releases;
    }
    bool isSimulated() const override { return false; }

    std::vector<std::string> attempts;
    bool fail = false;
    std::chrono::milliseconds captureDelay{0};
    std::atomic<bool> capturing{false};
    std::atomic<bool> releasedWhileCapturing{false};
    std::atomic<int> releases{0};
};

class RecordingNotifier : public sprout::NotificationSink
{
public:
    bool send(const std::string &text) override
    {
        messages.push_back(text);
        return true;
    }
    bool isConfigured() const override { return true; }

    std::vector<std::string> messages;
};

sprout::ControlLoopOptions loopOptions(const QString &dataDir)
{
    sprout::ControlLoopOptions options;
    options.pollInterval = std::chrono::seconds(1);
    options.logInterval = std::chrono::seconds(60);
    options.alertCheckInterval = std::chrono::seconds(60);
    options.stopTimeout = std::chrono::seconds(5);
    options.dataDir = dataDir.toStdString();
    return options;
}

// Runs raw SQL on a second connection to the loop's database.
bool execSql(const QString &dbPath, const char *sql)
{
    sqlite3 *db = nullptr;
    if (sqlite3_open(dbPath.toUtf8().constData(), &db) != SQLITE_OK) {
        sqlite3_close(db);
        return false;
    }
    const bool ok = sqlite3_exec(db, sql, nullptr, nullptr, nullptr) == SQLITE_OK;
    sqlite3_close(db);
    return ok;
}

struct LoopHarness {
    LoopHarness(const QString &dataDir, const std::chrono::system_clock::time_point *now)
        : LoopHarness(dataDir, now, loopOptions(dataDir))
    {
    }

    LoopHarness(const QString &dataDir,
                const std::chrono::system_clock::time_point *now,
                sprout::ControlLoopOptions options)
        : store((dataDir + QStringLiteral("/sprout.db")).toStdString())
        , actuator(std::make_unique<sprout::SimulatedActuator>(
              std::vector<std::string>{"lights", "exhaust_fan", "heater"}))
        , loop(store, actuator, sensor, camera, notifier, std::move(options),
               [now] { return *now; })
    {
    }

    sprout::SproutStore store;
    sprout::ActuatorAccessor actuator;
    ScriptedSensor sensor;
    FakeCamera camera;
    RecordingNotifier notifier;
    sprout::ControlLoop loop;
};

sprout::DeviceConfig device(const std::string &name,
                            sprout::DeviceMode mode,
                            sprout::DeviceRole role,
                            std::optional<double> tempThreshold)
{
    sprout::DeviceConfig config;
    config.name = name;
    config.enabled = true;
    config.mode = mode;
    config.role = role;
    config.thresholds.temperature = tempThreshold;
    return config;
}

} // namespace

class ControlLoopTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void testThresholdDevicesFollowReading();
    void testManualDevicesAreLeftAlone();
    void testDisabledDeviceForcedOff();
    void testLogAndAlertIntervals();
    void testAlertsAreThrottled();
    void testMissingReadingIsNotAFailure();
    void testSensorExceptionFailsOnlyThatStep();
    void testFailedCaptureRetriedNextTick();
    void testStartTimelapseCapturesOnNextTick();
    void testEndedProjectIsNoLongerTracked();
    void testReenabledTimelapseReseedsFromStore();
    void testImageRecordedWhenCaptureUpdateFails();
    void testDailyReportSentOncePerDay();
    void testDailyReportSkippedWithoutProject();
    void testCapturePhoto();
    void testStartRefusedWithoutActuator();
    void testStartAndStop();
    void testRepeatedFailuresBackOff();
    void testCameraReleasedAfterSlowTick();

private:
    void seedDevices(sprout::SproutStore &store);
    QString dbPath() const { return m_dir->filePath(QStringLiteral("sprout.db")); }

    QByteArray m_prevTz;
    std::unique_ptr<QTemporaryDir> m_dir;
    std::chrono::system_clock::time_point m_now;
};

void ControlLoopTests::initTestCase()
{
    m_prevTz = qgetenv("TZ");
    qputenv("TZ", "UTC");
    tzset();
}

void ControlLoopTests::cleanupTestCase()
{
    if (m_prevTz.isEmpty()) {
        qunsetenv("TZ");
    } else {
        qputenv("TZ", m_prevTz);
    }
    tzset();
}

void ControlLoopTests::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    qputenv("HOME", m_dir->path().toUtf8());
    m_now = std::chrono::system_clock::from_time_t(1718445600);
}

void ControlLoopTests::seedDevices(sprout::SproutStore &store)
{
    store.saveDeviceConfig(device("lights", sprout::DeviceMode::Manual,
                                  sprout::DeviceRole::None, std::nullopt), m_now);
    store.saveDeviceConfig(device("exhaust_fan", sprout::DeviceMode::Threshold,
                                  sprout::DeviceRole::ShedExcess, 28.0), m_now);
    store.saveDeviceConfig(device("heater", sprout::DeviceMode::Threshold,
                                  sprout::DeviceRole::CompensateDeficit, 18.0), m_now);
}

void ControlLoopTests::testThresholdDevicesFollowReading()
{
    LoopHarness h(m_dir->path(), &m_now);
    seedDevices(h.store);
    QVERIFY(h.actuator.initialize());

    h.sensor.set(30.0, 55.0);
    auto report = h.loop.runTick();
    QVERIFY(report.readingOk);
    QCOMPARE(static_cast<int>(report.deviceChanges.size()), 1);
    QCOMPARE(QString::fromStdString(report.deviceChanges[0].first), QStringLiteral("exhaust_fan"));
    QVERIFY(report.deviceChanges[0].second);
    QVERIFY(h.actuator.state("exhaust_fan") == true);
    QVERIFY(h.actuator.state("heater") == false);
    QVERIFY(h.store.getDeviceState("exhaust_fan") == true);

    // Already in the desired state: nothing is switched again.
    m_now += std::chrono::seconds(30);
    report = h.loop.runTick();
    QVERIFY(report.deviceChanges.empty());

    m_now += std::chrono::seconds(30);
    h.sensor.set(15.0, 55.0);
    report = h.loop.runTick();
    QCOMPARE(static_cast<int>(report.deviceChanges.size()), 2);
    QVERIFY(h.actuator.state("exhaust_fan") == false);
    QVERIFY(h.actuator.state("heater") == true);
    QVERIFY(h.store.getDeviceState("heater") == true);
}

void ControlLoopTests::testManualDevicesAreLeftAlone()
{
    LoopHarness h(m_dir->path(), &m_now);
    seedDevices(h.store);
    QVERIFY(h.actuator.initialize());
    h.sensor.set(22.0, 55.0);

    QVERIFY(h.actuator.set("lights", true));
    const auto report = h.loop.runTick();
    for (const auto &change : report.deviceChanges) {
        QVERIFY(change.first != "lights");
    }
    QVERIFY(h.actuator.state("lights") == true);

    // Switching a device to manual keeps whatever state it was left in.
    h.store.saveDeviceConfig(device("exhaust_fan", sprout::DeviceMode::Manual,
                                    sprout::DeviceRole::ShedExcess, 28.0), m_now);
    QVERIFY(h.actuator.set("exhaust_fan", true));
    m_now += std::chrono::seconds(30);
    h.sensor.set(20.0, 55.0);
    QVERIFY(h.loop.runTick().deviceChanges.empty());
    QVERIFY(h.actuator.state("exhaust_fan") == true);
}

void ControlLoopTests::testDisabledDeviceForcedOff()
{
    LoopHarness h(m_dir->path(), &m_now);
    seedDevices(h.store);
    QVERIFY(h.actuator.initialize());
    QVERIFY(h.actuator.set("heater", true));

    auto heater = device("heater", sprout::DeviceMode::Threshold,
                         sprout::DeviceRole::CompensateDeficit, 18.0);
    heater.enabled = false;
    h.store.saveDeviceConfig(heater, m_now);

    h.sensor.set(10.0, 55.0);
    const auto report = h.loop.runTick();
    QCOMPARE(static_cast<int>(report.deviceChanges.size()), 1);
    QVERIFY(!report.deviceChanges[0].second);
    QVERIFY(h.actuator.state("heater") == false);
}

void ControlLoopTests::testLogAndAlertIntervals()
{
    LoopHarness h(m_dir->path(), &m_now);
    QVERIFY(h.actuator.initialize());
    h.sensor.set(22.0, 55.0);
    const auto start = m_now;

    auto report = h.loop.runTick();
    QVERIFY(report.readingLogged);
    QVERIFY(report.alertsChecked);

    m_now = start + std::chrono::seconds(30);
    report = h.loop.runTick();
    QVERIFY(!report.readingLogged);
    QVERIFY(!report.alertsChecked);

    m_now = start + std::chrono::seconds(60);
    report = h.loop.runTick();
    QVERIFY(report.readingLogged);
    QVERIFY(report.alertsChecked);

    const auto logged = h.store.sensorReadingsBetween(start, m_now);
    QCOMPARE(static_cast<int>(logged.size()), 2);
    QCOMPARE(logged.front().reading.temperature, 22.0);

    // The latest reading is kept even when it was not logged.
    QVERIFY(h.loop.lastReading().has_value());
    QCOMPARE(h.loop.lastReading()->humidity, 55.0);
}

void ControlLoopTests::testAlertsAreThrottled()
{
    LoopHarness h(m_dir->path(), &m_now);
    QVERIFY(h.actuator.initialize());

    sprout::AlertConfig alerts;
    alerts.tempMax = 28.0;
    alerts.notificationIntervalSeconds = 300;
    h.store.saveAlertConfig(alerts, m_now);

    const auto start = m_now;
    h.sensor.set(31.0, 55.0);
    auto report = h.loop.runTick();
    QCOMPARE(static_cast<int>(report.alertsSent.size()), 1);
    QCOMPARE(static_cast<int>(h.notifier.messages.size()), 1);
    QCOMPARE(QString::fromUtf8(h.notifier.messages[0].c_str()),
             QString::fromUtf8("Temperature too HIGH: 31.0°C (max: 28.0°C)"));

    m_now = start + std::chrono::seconds(60);
    report = h.loop.runTick();
    QVERIFY(report.alertsChecked);
    QVERIFY(report.alertsSent.empty());

    m_now = start + std::chrono::seconds(360);
    report = h.loop.runTick();
    QCOMPARE(static_cast<int>(report.alertsSent.size()), 1);
    QCOMPARE(static_cast<int>(h.notifier.messages.size()), 2);
}

void ControlLoopTests::testMissingReadingIsNotAFailure()
{
    LoopHarness h(m_dir->path(), &m_now);
    seedDevices(h.store);
    QVERIFY(h.actuator.initialize());

    const auto report = h.loop.runTick();
    QVERIFY(!report.readingOk);
    QVERIFY(!report.readingLogged);
    QVERIFY(report.deviceChanges.empty());
    QVERIFY(!report.failed());
    QCOMPARE(h.sensor.reads.load(), 1);

    const auto health = h.loop.health();
    QVERIFY(!health.sensorOk);
    QCOMPARE(health.consecutiveFailures, 0);
    QCOMPARE(health.totalTicks, static_cast<std::uint64_t>(1));
    QVERIFY(health.lastTickAt == m_now);
    QVERIFY(health.actuatorSimulated);
    QVERIFY(!health.sensorSimulated);
}

void ControlLoopTests::testSensorExceptionFailsOnlyThatStep()
{
    LoopHarness h(m_dir->path(), &m_now);
    QVERIFY(h.actuator.initialize());
    h.sensor.failWithException = true;

    const auto report = h.loop.runTick();
    QCOMPARE(report.stepsRun, 2);
    QCOMPARE(report.stepsFailed, 1);
    QVERIFY(!report.failed());
    QCOMPARE(h.loop.health().consecutiveFailures, 0);

    h.sensor.failWithException = false;
    h.sensor.set(21.0, 50.0);
    m_now += std::chrono::seconds(30);
    QVERIFY(h.loop.runTick().readingOk);
    QCOMPARE(h.loop.health().totalTicks, static_cast<std::uint64_t>(2));
}

void ControlLoopTests::testFailedCaptureRetriedNextTick()
{
    LoopHarness h(m_dir->path(), &m_now);
    QVERIFY(h.actuator.initialize());
    const auto project = h.store.createProject("Basil", "", true, 60, m_now);
    const auto start = m_now;

    h.camera.fail = true;
    auto report = h.loop.runTick();
    QVERIFY(report.captures.empty());
    QCOMPARE(static_cast<int>(h.camera.attempts.size()), 1);
    QVERIFY(!h.loop.health().cameraOk);
    QVERIFY(!h.store.getProject(project.id)->lastCaptureAt.has_value());

    m_now = start + std::chrono::seconds(10);
    h.camera.fail = false;
    report = h.loop.runTick();
    QCOMPARE(static_cast<int>(report.captures.size()), 1);
    QCOMPARE(static_cast<int>(h.camera.attempts.size()), 2);
    QVERIFY(h.loop.health().cameraOk);

    const QString path = QString::fromStdString(report.captures[0]);
    QVERIFY(path.startsWith(m_dir->path() + QStringLiteral("/projects/%1/timelapse/timelapse_")
                                                .arg(project.id)));
    QVERIFY(path.endsWith(QStringLiteral(".jpg")));
    QCOMPARE(h.store.countTimelapseImages(project.id), 1);
    QVERIFY(h.store.getProject(project.id)->lastCaptureAt == m_now);

    // The interval restarts from the successful capture.
    m_now = start + std::chrono::seconds(60);
    QVERIFY(h.loop.runTick().captures.empty());
    m_now = start + std::chrono::seconds(70);
    QCOMPARE(static_cast<int>(h.loop.runTick().captures.size()), 1);
}

void ControlLoopTests::testStartTimelapseCapturesOnNextTick()
{
    LoopHarness h(m_dir->path(), &m_now);
    QVERIFY(h.actuator.initialize());
    const auto project = h.store.createProject("Chili", "", true, 3600, m_now);

    QCOMPARE(static_cast<int>(h.loop.runTick().captures.size()), 1);
    m_now += std::chrono::seconds(30);
    QVERIFY(h.loop.runTick().captures.empty());

    h.loop.startProjectTimelapse(project.id);
    m_now += std::chrono::seconds(30);
    QCOMPARE(static_cast<int>(h.loop.runTick().captures.size()), 1);

    // Ended projects are no longer captured.
    QVERIFY(h.store.endProject(project.id, m_now));
    h.loop.stopProjectTimelapse(project.id);
    m_now += std::chrono::seconds(7200);
    QVERIFY(h.loop.runTick().captures.empty());
    QCOMPARE(h.store.countTimelapseImages(project.id), 2);
}

void ControlLoopTests::testEndedProjectIsNoLongerTracked()
{
    LoopHarness h(m_dir->path(), &m_now);
    QVERIFY(h.actuator.initialize());
    const auto project = h.store.createProject("Chili", "", true, 3600, m_now);

    QCOMPARE(static_cast<int>(h.loop.runTick().captures.size()), 1);
    QVERIFY(h.loop.isTrackingTimelapse(project.id));

    // Ended behind the loop's back: the next tick forgets the project.
    m_now += std::chrono::seconds(60);
    QVERIFY(h.store.endProject(project.id, m_now));
    QVERIFY(h.loop.runTick().captures.empty());
    QVERIFY(!h.loop.isTrackingTimelapse(project.id));

    m_now += std::chrono::seconds(7200);
    QVERIFY(h.loop.runTick().captures.empty());
    QCOMPARE(static_cast<int>(h.camera.attempts.size()), 1);
    QCOMPARE(h.store.countTimelapseImages(project.id), 1);
}

void ControlLoopTests::testReenabledTimelapseReseedsFromStore()
{
    LoopHarness h(m_dir->path(), &m_now);
    QVERIFY(h.actuator.initialize());
    const auto project = h.store.createProject("Basil", "", true, 3600, m_now);
    const auto start = m_now;

    QCOMPARE(static_cast<int>(h.loop.runTick().captures.size()), 1);

    m_now = start + std::chrono::seconds(60);
    QVERIFY(h.store.setProjectTimelapse(project.id, false, std::nullopt));
    QVERIFY(h.loop.runTick().captures.empty());
    QVERIFY(!h.loop.isTrackingTimelapse(project.id));

    // The timer is seeded again from the persisted last capture, not from
    // the instant the loop last saw the project.
    QVERIFY(h.store.updateTimelapseCapture(project.id, start - std::chrono::seconds(3600)));
    m_now = start + std::chrono::seconds(120);
    QVERIFY(h.store.setProjectTimelapse(project.id, true, std::nullopt));
    QCOMPARE(static_cast<int>(h.loop.runTick().captures.size()), 1);
    QVERIFY(h.loop.isTrackingTimelapse(project.id));
    QCOMPARE(h.store.countTimelapseImages(project.id), 2);
}

void ControlLoopTests::testImageRecordedWhenCaptureUpdateFails()
{
    LoopHarness h(m_dir->path(), &m_now);
    QVERIFY(h.actuator.initialize());
    const auto project = h.store.createProject("Mint", "", true, 600, m_now);
    QVERIFY(execSql(dbPath(),
                    "CREATE TRIGGER reject_capture_update "
                    "BEFORE UPDATE OF timelapse_last_capture ON projects "
                    "BEGIN SELECT RAISE(ABORT, 'capture update rejected'); END;"));

    const auto report = h.loop.runTick();
    QCOMPARE(static_cast<int>(report.captures.size()), 1);
    QCOMPARE(report.stepsFailed, 1);
    QCOMPARE(h.store.countTimelapseImages(project.id), 1);
    QVERIFY(!h.store.getProject(project.id)->lastCaptureAt.has_value());
}

void ControlLoopTests::testDailyReportSentOncePerDay()
{
    // 2024-06-15 07:58:00 UTC.
    m_now = std::chrono::system_clock::from_time_t(1718445600 - 7200 - 120);
    auto options = loopOptions(m_dir->path());
    options.dailyReportAt = 8 * 3600;
    LoopHarness h(m_dir->path(), &m_now, options);
    QVERIFY(h.actuator.initialize());
    h.store.createProject("Basil", "", true, 3600, m_now);

    h.sensor.set(22.0, 50.0);
    auto report = h.loop.runTick();
    QVERIFY(report.readingLogged);
    QVERIFY(!report.dailyReportSent);

    m_now += std::chrono::seconds(60);
    h.sensor.set(26.0, 60.0);
    QVERIFY(!h.loop.runTick().dailyReportSent);
    QVERIFY(h.notifier.messages.empty());

    m_now += std::chrono::seconds(60);
    h.sensor.set(24.0, 55.0);
    report = h.loop.runTick();
    QVERIFY(report.readingLogged);
    QVERIFY(report.dailyReportSent);
    QCOMPARE(static_cast<int>(h.notifier.messages.size()), 1);

    const QString text = QString::fromUtf8(h.notifier.messages[0].c_str());
    QVERIFY(text.startsWith(QStringLiteral("Daily Report - 2024-06-15\n")));
    QVERIFY(text.contains(QStringLiteral("Project: Basil")));
    QVERIFY(text.contains(QString::fromUtf8("  Min: 22.0°C\n  Max: 26.0°C\n  Avg: 24.0°C")));
    QVERIFY(text.contains(QStringLiteral("  Min: 50.0%\n  Max: 60.0%\n  Avg: 55.0%")));
    QVERIFY(text.contains(QStringLiteral("Time-lapse Images: 1")));

    m_now += std::chrono::seconds(60);
    QVERIFY(!h.loop.runTick().dailyReportSent);
    QCOMPARE(QString::fromStdString(*h.store.getSetting("daily_report_last_date")),
             QStringLiteral("2024-06-15"));

    // A restarted loop remembers that today's report went out.
    sprout::ControlLoop restarted(h.store, h.actuator, h.sensor, h.camera, h.notifier, options,
                                  [this] { return m_now; });
    m_now += std::chrono::seconds(3600);
    QVERIFY(!restarted.runTick().dailyReportSent);
    QCOMPARE(static_cast<int>(h.notifier.messages.size()), 1);

    // The next day only summarizes readings taken since midnight.
    m_now = std::chrono::system_clock::from_time_t(1718445600 - 7200 + 86400 + 30);
    report = restarted.runTick();
    QVERIFY(report.dailyReportSent);
    QCOMPARE(static_cast<int>(h.notifier.messages.size()), 2);
    const QString nextDay = QString::fromUtf8(h.notifier.messages[1].c_str());
    QVERIFY(nextDay.startsWith(QStringLiteral("Daily Report - 2024-06-16\n")));
    QVERIFY(nextDay.contains(QString::fromUtf8("  Min: 24.0°C\n  Max: 24.0°C")));
}

void ControlLoopTests::testDailyReportSkippedWithoutProject()
{
    // 2024-06-15 08:30:00 UTC.
    m_now = std::chrono::system_clock::from_time_t(1718445600 - 5400);
    auto options = loopOptions(m_dir->path());
    options.dailyReportAt = 8 * 3600;
    LoopHarness h(m_dir->path(), &m_now, options);
    QVERIFY(h.actuator.initialize());

    auto report = h.loop.runTick();
    QCOMPARE(report.stepsRun, 3);
    QCOMPARE(report.stepsFailed, 0);
    QVERIFY(!report.dailyReportSent);
    QVERIFY(h.notifier.messages.empty());
    QCOMPARE(QString::fromStdString(*h.store.getSetting("daily_report_last_date")),
             QStringLiteral("2024-06-15"));

    m_now += std::chrono::seconds(60);
    QCOMPARE(h.loop.runTick().stepsRun, 2);
}

void ControlLoopTests::testCapturePhoto()
{
    LoopHarness h(m_dir->path(), &m_now);

    const auto explicitPath = h.loop.capturePhoto(std::string("/tmp/sprout-test.jpg"));
    QVERIFY(explicitPath.has_value());
    QCOMPARE(QString::fromStdString(*explicitPath), QStringLiteral("/tmp/sprout-test.jpg"));

    const auto defaultPath = h.loop.capturePhoto(std::nullopt);
    QVERIFY(defaultPath.has_value());
    QVERIFY(QString::fromStdString(*defaultPath)
                .startsWith(m_dir->path() + QStringLiteral("/photos/photo_")));

    h.camera.fail = true;
    QVERIFY(!h.loop.capturePhoto(std::nullopt).has_value());
    QVERIFY(!h.loop.health().cameraOk);
}

void ControlLoopTests::testStartRefusedWithoutActuator()
{
    sprout::SproutStore store(m_dir->filePath(QStringLiteral("sprout.db")).toStdString());
    sprout::ActuatorAccessor actuator(nullptr);
    ScriptedSensor sensor;
    FakeCamera camera;
    RecordingNotifier notifier;
    sprout::ControlLoop loop(store, actuator, sensor, camera, notifier,
                             loopOptions(m_dir->path()), [this] { return m_now; });

    QVERIFY(!loop.start());
    QVERIFY(!loop.isRunning());
    QVERIFY(!loop.health().actuatorOk);
}

void ControlLoopTests::testStartAndStop()
{
    LoopHarness h(m_dir->path(), &m_now);
    seedDevices(h.store);
    h.sensor.set(30.0, 55.0);

    QVERIFY(h.loop.start());
    QVERIFY(h.loop.isRunning());
    QVERIFY(h.loop.health().running);
    QTRY_VERIFY(h.loop.health().totalTicks >= 1);
    QTRY_VERIFY(h.actuator.state("exhaust_fan") == true);

    h.loop.stop();
    QVERIFY(!h.loop.isRunning());
    QVERIFY(!h.loop.health().running);
    QVERIFY(!h.actuator.isAvailable());
    QVERIFY(h.actuator.state("exhaust_fan") == false);
    QCOMPARE(h.camera.releases.load(), 1);

    // Stopping again is harmless.
    h.loop.stop();
    QCOMPARE(h.camera.releases.load(), 1);
}

void ControlLoopTests::testRepeatedFailuresBackOff()
{
    auto options = loopOptions(m_dir->path());
    options.maxConsecutiveFailures = 2;
    options.failureBackoff = std::chrono::seconds(60);
    LoopHarness h(m_dir->path(), &m_now, options);

    // Every step of every tick fails: the sensor throws and the store has
    // lost its projects table.
    h.sensor.failWithException = true;
    QVERIFY(execSql(dbPath(), "DROP TABLE timelapse_images; DROP TABLE projects;"));

    QVERIFY(h.loop.start());
    QTRY_COMPARE(h.loop.health().consecutiveFailures, 1);

    // The second failure reaches the limit: the counter resets and the loop
    // sleeps for the backoff instead of the poll interval.
    QTRY_VERIFY(h.loop.health().totalTicks >= 2 && h.loop.health().consecutiveFailures == 0);
    QTest::qWait(2500);
    QCOMPARE(h.loop.health().totalTicks, static_cast<std::uint64_t>(2));
    QCOMPARE(h.loop.health().consecutiveFailures, 0);

    h.loop.stop();
    QVERIFY(!h.loop.isRunning());
}

void ControlLoopTests::testCameraReleasedAfterSlowTick()
{
    auto options = loopOptions(m_dir->path());
    options.stopTimeout = std::chrono::seconds(1);
    LoopHarness h(m_dir->path(), &m_now, options);
    h.sensor.delay = std::chrono::milliseconds(2500);
    h.camera.captureDelay = std::chrono::milliseconds(500);

    QVERIFY(h.loop.start());
    QTRY_COMPARE(h.sensor.reads.load(), 1);

    // The tick outlives the stop timeout: relays are released at once, the
    // camera only once the tick has finished.
    h.loop.stop();
    QVERIFY(!h.loop.isRunning());
    QVERIFY(!h.actuator.isAvailable());
    QCOMPARE(h.camera.releases.load(), 0);

    // A manual photo taken meanwhile never overlaps the deferred release.
    const auto photo = h.loop.capturePhoto(
        m_dir->filePath(QStringLiteral("manual.jpg")).toStdString());
    QVERIFY(photo.has_value());
    QTRY_COMPARE(h.camera.releases.load(), 1);
    QVERIFY(!h.camera.releasedWhileCapturing);
}

QTEST_MAIN(ControlLoopTests)
#include "test_control_loop.moc"
