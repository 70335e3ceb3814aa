#include <QtTest/QtTest>

#include <QCoreApplication>
#include <QDir>
#include <QLocalSocket>
#include <QTemporaryDir>

#include <memory>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "daemon/sprout_api_server.hpp"
#include "hardware/simulated_actuator.hpp"
#include "hardware/simulated_environment_sensor.hpp"

namespace {

class StubCamera : public sprout::Capturer
{
public:
    bool initialize() override { return true; }
    std::optional<std::string> capture(const std::string &path) override
    {
        if (fail) {
            return std::nullopt;
        }
        return path;
    }
    void release() override {}
    bool isSimulated() const override { return true; }

    bool fail = false;
};

class SilentNotifier : public sprout::NotificationSink
{
public:
    bool send(const std::string &) override { return true; }
    bool isConfigured() const override { return false; }
};

struct ApiHarness {
    explicit ApiHarness(const QString &dataDir)
        : store((dataDir + QStringLiteral("/sprout.db")).toStdString())
        , actuator(std::make_unique<sprout::SimulatedActuator>(
              std::vector<std::string>{"lights", "exhaust_fan"}))
        , loop(store, actuator, sensor, camera, notifier, options(dataDir))
        , server(store, actuator, loop)
    {
    }

    static sprout::ControlLoopOptions options(const QString &dataDir)
    {
        sprout::ControlLoopOptions value;
        value.dataDir = dataDir.toStdString();
        return value;
    }

    sprout::SproutStore store;
    sprout::ActuatorAccessor actuator;
    sprout::SimulatedEnvironmentSensor sensor;
    StubCamera camera;
    SilentNotifier notifier;
    sprout::ControlLoop loop;
    sprout::SproutApiServer server;
};

} // namespace

class ApiServerTests : public QObject
{
    Q_OBJECT
private slots:
    void init();

    void testErrorHandling();
    void testSwitchPersistsState();
    void testStatusAndDevices();
    void testDeviceSettings();
    void testAlertSettings();
    void testReadings();
    void testProjects();
    void testCapturePhoto();
    void testSystemSettings();
    void testSocketRoundTrip();

private:
    std::unique_ptr<QTemporaryDir> m_tempDir;

    static nlohmann::json call(sprout::SproutApiServer &server,
                               const std::string &method,
                               const nlohmann::json &params = nlohmann::json::object());
    static QString errorOf(const nlohmann::json &response)
    {
        return QString::fromStdString(response.value("error", ""));
    }
};

void ApiServerTests::init()
{
    m_tempDir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_tempDir->isValid());
    qputenv("HOME", m_tempDir->path().toUtf8());
    qputenv("XDG_RUNTIME_DIR", m_tempDir->path().toUtf8());
    qunsetenv("SPROUT_SOCKET_NAME");
}

nlohmann::json ApiServerTests::call(sprout::SproutApiServer &server,
                                    const std::string &method,
                                    const nlohmann::json &params)
{
    const nlohmann::json request{{"id", 7}, {"method", method}, {"params", params}};
    const QByteArray response =
        server.handleRequestPayload(QByteArray::fromStdString(request.dump()));
    return nlohmann::json::parse(response.toStdString(), nullptr, false);
}

void ApiServerTests::testErrorHandling()
{
    ApiHarness h(m_tempDir->path());

    auto response = nlohmann::json::parse(
        h.server.handleRequestPayload(QByteArrayLiteral("not json")).toStdString());
    QCOMPARE(errorOf(response), QStringLiteral("Invalid JSON payload"));
    QCOMPARE(response.value("id", 0), -1);

    response = nlohmann::json::parse(
        h.server.handleRequestPayload(QByteArrayLiteral("{\"id\": 3}")).toStdString());
    QCOMPARE(errorOf(response), QStringLiteral("Missing method"));
    QCOMPARE(response.value("id", 0), 3);

    response = nlohmann::json::parse(h.server.handleRequestPayload(
        QByteArrayLiteral("{\"id\": 4, \"method\": \"get_status\", \"params\": [1]}"))
                                         .toStdString());
    QCOMPARE(errorOf(response), QStringLiteral("Invalid params"));

    response = call(h.server, "water_plants");
    QCOMPARE(errorOf(response), QStringLiteral("Unknown method"));
    QCOMPARE(response.value("id", 0), 7);
}

void ApiServerTests::testSwitchPersistsState()
{
    ApiHarness h(m_tempDir->path());
    QVERIFY(h.actuator.initialize());

    auto response = call(h.server, "turn_on", {{"device", "lights"}});
    QVERIFY(response.contains("result"));
    QCOMPARE(QString::fromStdString(response["result"].value("device", "")),
             QStringLiteral("lights"));
    QVERIFY(response["result"].value("on", false));
    QVERIFY(h.actuator.state("lights") == true);
    QVERIFY(h.store.getDeviceState("lights") == true);

    response = call(h.server, "toggle", {{"device", "lights"}});
    QVERIFY(!response["result"].value("on", true));
    QVERIFY(h.store.getDeviceState("lights") == false);

    response = call(h.server, "turn_off", {{"device", "exhaust_fan"}});
    QVERIFY(!response["result"].value("on", true));

    const auto recorded = call(h.server, "get_status")["result"]["recordedDeviceStates"];
    QVERIFY(recorded.is_object());
    QCOMPARE(static_cast<int>(recorded.size()), 2);
    QVERIFY(!recorded.value("lights", true));
    QVERIFY(!recorded.value("exhaust_fan", true));

    QCOMPARE(errorOf(call(h.server, "turn_on")), QStringLiteral("Missing device"));
    QCOMPARE(errorOf(call(h.server, "turn_on", {{"device", "sprinkler"}})),
             QStringLiteral("Unknown device"));
    QVERIFY(!h.store.getDeviceState("sprinkler").has_value());
}

void ApiServerTests::testStatusAndDevices()
{
    ApiHarness h(m_tempDir->path());
    QVERIFY(h.actuator.initialize());
    h.store.saveDeviceConfig(sprout::deviceConfigFromJson(
                                 "exhaust_fan",
                                 nlohmann::json{{"mode", "threshold"},
                                                {"thresholds", {{"temp_threshold", 28.0}}}},
                                 nullptr),
                             std::chrono::system_clock::now());

    const auto status = call(h.server, "get_status")["result"];
    QVERIFY(!status["health"].value("running", true));
    QVERIFY(status["health"]["simulated"].value("relay", false));
    QVERIFY(status["devices"].is_object());
    QVERIFY(!status["devices"].value("lights", true));
    QVERIFY(status["latestReading"].is_null());
    QVERIFY(status["activeProject"].is_null());

    const auto devices = call(h.server, "get_devices")["result"]["devices"];
    QCOMPARE(static_cast<int>(devices.size()), 2);
    for (const auto &device : devices) {
        const std::string name = device.value("name", "");
        if (name == "exhaust_fan") {
            QCOMPARE(QString::fromStdString(device.value("mode", "")), QStringLiteral("threshold"));
            QCOMPARE(QString::fromStdString(device.value("role", "")),
                     QStringLiteral("shed_excess"));
        } else {
            QCOMPARE(QString::fromStdString(name), QStringLiteral("lights"));
            QCOMPARE(QString::fromStdString(device.value("mode", "")), QStringLiteral("manual"));
        }
        QVERIFY(device["on"].is_boolean());
    }
}

void ApiServerTests::testDeviceSettings()
{
    ApiHarness h(m_tempDir->path());
    const auto now = std::chrono::system_clock::now();

    auto existing = sprout::deviceConfigFromJson("exhaust_fan",
                                                 nlohmann::json{{"mode", "manual"}}, nullptr);
    existing.role = sprout::DeviceRole::CompensateDeficit;
    h.store.saveDeviceConfig(existing, now);

    auto response = call(h.server, "save_device_settings", {
        {"device", "exhaust_fan"},
        {"settings", {{"enabled", true},
                      {"mode", "auto"},
                      {"schedule", {{{"duration", 10}, {"interval", 30}}}},
                      {"thresholds", {{"temp_threshold", 26.5}}}}}
    });
    QVERIFY(response.contains("result"));

    // The role survives a settings update that does not name one.
    const auto saved = h.store.getDeviceConfig("exhaust_fan");
    QVERIFY(saved.has_value());
    QCOMPARE(saved->mode, sprout::DeviceMode::Auto);
    QCOMPARE(saved->role, sprout::DeviceRole::CompensateDeficit);
    QCOMPARE(*saved->thresholds.temperature, 26.5);
    QCOMPARE(static_cast<int>(saved->schedule.size()), 1);

    response = call(h.server, "save_device_settings", {
        {"device", "exhaust_fan"},
        {"settings", {{"mode", "whenever"}}}
    });
    QVERIFY(errorOf(response).startsWith(QStringLiteral("Invalid device settings: ")));
    QCOMPARE(h.store.getDeviceConfig("exhaust_fan")->mode, sprout::DeviceMode::Auto);

    QCOMPARE(errorOf(call(h.server, "save_device_settings", {{"settings", {{"mode", "auto"}}}})),
             QStringLiteral("Missing device"));

    response = call(h.server, "get_device_settings", {{"device", "exhaust_fan"}});
    QCOMPARE(QString::fromStdString(response["result"]["settings"].value("role", "")),
             QStringLiteral("compensate_deficit"));
    QCOMPARE(errorOf(call(h.server, "get_device_settings", {{"device", "lights"}})),
             QStringLiteral("Device settings not found"));

    const auto all = call(h.server, "get_device_settings")["result"]["settings"];
    QVERIFY(all.contains("exhaust_fan"));
    QCOMPARE(static_cast<int>(all.size()), 1);
}

void ApiServerTests::testAlertSettings()
{
    ApiHarness h(m_tempDir->path());

    auto response = call(h.server, "get_alert_settings");
    QVERIFY(response["result"]["settings"].value("enabled", false));
    QVERIFY(response["result"]["settings"]["temp_min"].is_null());

    response = call(h.server, "save_alert_settings", {
        {"settings", {{"temp_min", 30.0}, {"temp_max", 20.0}}}
    });
    QCOMPARE(errorOf(response), QStringLiteral("Alert minimum exceeds maximum"));
    QVERIFY(!h.store.getAlertConfig().has_value());

    response = call(h.server, "save_alert_settings", {
        {"settings", {{"enabled", true}, {"temp_min", 16.0}, {"temp_max", 30.0},
                      {"humidity_max", 85.0}, {"notification_interval", 900}}}
    });
    QVERIFY(response.contains("result"));
    const auto stored = h.store.getAlertConfig();
    QVERIFY(stored.has_value());
    QCOMPARE(*stored->tempMax, 30.0);
    QVERIFY(!stored->humidityMin.has_value());
    QCOMPARE(stored->notificationIntervalSeconds, 900);
}

void ApiServerTests::testReadings()
{
    ApiHarness h(m_tempDir->path());
    const auto now = std::chrono::system_clock::now();

    QVERIFY(call(h.server, "get_latest_reading")["result"]["reading"].is_null());

    sprout::EnvironmentReading reading;
    reading.temperature = 24.5;
    reading.humidity = 61.0;
    reading.capturedAt = now - std::chrono::hours(1);
    h.store.logSensorReading(reading, std::nullopt);
    reading.temperature = 25.0;
    reading.capturedAt = now - std::chrono::hours(30);
    h.store.logSensorReading(reading, std::nullopt);

    auto response = call(h.server, "get_latest_reading");
    QCOMPARE(response["result"]["reading"].value("temperature", 0.0), 24.5);

    response = call(h.server, "get_readings");
    QCOMPARE(static_cast<int>(response["result"]["readings"].size()), 1);

    response = call(h.server, "get_readings", {
        {"from", sprout::toIso8601Utc(now - std::chrono::hours(48))},
        {"to", sprout::toIso8601Utc(now)}
    });
    QCOMPARE(static_cast<int>(response["result"]["readings"].size()), 2);

    QCOMPARE(errorOf(call(h.server, "get_readings", {{"limit", 0}})),
             QStringLiteral("Invalid limit"));
    QCOMPARE(errorOf(call(h.server, "get_readings", {{"from", "yesterday"}})),
             QStringLiteral("Invalid from timestamp"));
}

void ApiServerTests::testProjects()
{
    ApiHarness h(m_tempDir->path());

    QCOMPARE(errorOf(call(h.server, "create_project")), QStringLiteral("Missing project name"));

    auto response = call(h.server, "create_project", {{"name", "Tomatoes"},
                                                      {"notes", "cherry"},
                                                      {"timelapseInterval", 120}});
    const auto project = response["result"]["project"];
    const std::int64_t id = project.value("id", std::int64_t(0));
    QVERIFY(id > 0);
    QCOMPARE(QString::fromStdString(project.value("status", "")), QStringLiteral("active"));
    QVERIFY(project.value("timelapseEnabled", false));
    QCOMPARE(project.value("timelapseInterval", 0), 120);
    QCOMPARE(project.value("imageCount", -1), 0);
    QVERIFY(project.value("timelapseScheduled", false));

    QCOMPARE(errorOf(call(h.server, "create_project", {{"name", "Peppers"}})),
             QStringLiteral("A project is already active"));

    response = call(h.server, "list_projects");
    QCOMPARE(static_cast<int>(response["result"]["projects"].size()), 1);
    response = call(h.server, "get_active_project");
    QCOMPARE(response["result"]["project"].value("id", std::int64_t(0)), id);

    response = call(h.server, "set_project_timelapse", {{"id", id}, {"enabled", true},
                                                        {"interval", 600}});
    QCOMPARE(response["result"]["project"].value("timelapseInterval", 0), 600);
    QVERIFY(response["result"]["project"].value("timelapseScheduled", false));
    QCOMPARE(errorOf(call(h.server, "set_project_timelapse", {{"id", id}})),
             QStringLiteral("Missing enabled flag"));
    QCOMPARE(errorOf(call(h.server, "set_project_timelapse",
                          {{"id", id}, {"enabled", true}, {"interval", 10}})),
             QStringLiteral("timelapse interval must be at least 30 seconds"));

    h.store.addTimelapseImage(id, std::chrono::system_clock::now(), "/tmp/frame.jpg");
    response = call(h.server, "get_timelapse_images", {{"projectId", id}});
    QCOMPARE(static_cast<int>(response["result"]["images"].size()), 1);

    QCOMPARE(errorOf(call(h.server, "end_project")), QStringLiteral("Missing project id"));
    response = call(h.server, "end_project", {{"id", id}});
    QCOMPARE(QString::fromStdString(response["result"]["project"].value("status", "")),
             QStringLiteral("completed"));
    QVERIFY(!response["result"]["project"].value("timelapseEnabled", true));
    QCOMPARE(response["result"]["project"].value("imageCount", 0), 1);
    QVERIFY(!response["result"]["project"].value("timelapseScheduled", true));
    QCOMPARE(errorOf(call(h.server, "end_project", {{"id", id}})),
             QStringLiteral("Project not found or not in a valid state"));

    response = call(h.server, "archive_project", {{"id", id}});
    QCOMPARE(QString::fromStdString(response["result"]["project"].value("status", "")),
             QStringLiteral("archived"));
    QVERIFY(call(h.server, "get_active_project")["result"]["project"].is_null());
}

void ApiServerTests::testCapturePhoto()
{
    ApiHarness h(m_tempDir->path());
    const std::string target = m_tempDir->filePath(QStringLiteral("shot.jpg")).toStdString();

    auto response = call(h.server, "capture_photo", {{"path", target}});
    QCOMPARE(QString::fromStdString(response["result"].value("path", "")),
             QString::fromStdString(target));

    h.camera.fail = true;
    QCOMPARE(errorOf(call(h.server, "capture_photo")), QStringLiteral("Photo capture failed"));
}

void ApiServerTests::testSystemSettings()
{
    ApiHarness h(m_tempDir->path());

    auto response = call(h.server, "get_setting", {{"key", "camera_rotation"}});
    QCOMPARE(QString::fromStdString(response["result"].value("key", "")),
             QStringLiteral("camera_rotation"));
    QVERIFY(response["result"]["value"].is_null());

    response = call(h.server, "set_setting", {{"key", "camera_rotation"}, {"value", "180"}});
    QCOMPARE(QString::fromStdString(response["result"].value("value", "")), QStringLiteral("180"));
    QCOMPARE(QString::fromStdString(*h.store.getSetting("camera_rotation")), QStringLiteral("180"));

    response = call(h.server, "get_setting", {{"key", "camera_rotation"}});
    QCOMPARE(QString::fromStdString(response["result"].value("value", "")), QStringLiteral("180"));

    QCOMPARE(errorOf(call(h.server, "get_setting")), QStringLiteral("Missing setting key"));
    QCOMPARE(errorOf(call(h.server, "set_setting", {{"value", "1"}})),
             QStringLiteral("Missing setting key"));
    QCOMPARE(errorOf(call(h.server, "set_setting", {{"key", "camera_rotation"}, {"value", 90}})),
             QStringLiteral("Invalid setting value"));
    QCOMPARE(QString::fromStdString(*h.store.getSetting("camera_rotation")), QStringLiteral("180"));
}

void ApiServerTests::testSocketRoundTrip()
{
    ApiHarness h(m_tempDir->path());
    QVERIFY(h.actuator.initialize());
    QVERIFY(h.server.start());

    QLocalSocket socket;
    socket.connectToServer(m_tempDir->path() + QStringLiteral("/sprout.sock"));
    QVERIFY(socket.waitForConnected(1000));

    const nlohmann::json request{{"id", 1}, {"method", "get_devices"}};
    socket.write(QByteArray::fromStdString(request.dump()));
    QVERIFY(socket.waitForBytesWritten(1000));
    QTRY_VERIFY(socket.bytesAvailable() > 0);

    const auto response = nlohmann::json::parse(socket.readAll().toStdString(), nullptr, false);
    QVERIFY(!response.is_discarded());
    QCOMPARE(response.value("id", 0), 1);
    QCOMPARE(static_cast<int>(response["result"]["devices"].size()), 2);
}

QTEST_MAIN(ApiServerTests)
#include "test_api_server.moc"
