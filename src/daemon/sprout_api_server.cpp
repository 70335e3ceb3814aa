#include "daemon/sprout_api_server.hpp"

#include <chrono>
#include <optional>
#include <vector>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QDebug>
#include <QUuid>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"

namespace sprout {

namespace {

std::optional<std::int64_t> projectIdParam(const nlohmann::json &params, const char *key)
{
    auto it = params.find(key);
    if (it == params.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    return it->get<std::int64_t>();
}

std::string joinErrors(const std::vector<std::string> &errors)
{
    std::string joined;
    for (const auto &error : errors) {
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += error;
    }
    return joined;
}

} // namespace

SproutApiServer::SproutApiServer(SproutStore &store,
                                 ActuatorAccessor &actuator,
                                 ControlLoop &loop,
                                 QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_actuator(actuator)
    , m_loop(loop)
{
}

SproutApiServer::~SproutApiServer() = default;

bool SproutApiServer::start()
{
    const QString socketPath = daemonSocketPath();
    if (socketPath.contains('/')) {
        const QFileInfo socketInfo(socketPath);
        if (!QDir().mkpath(socketInfo.absolutePath())) {
            qWarning() << "Failed to create runtime socket directory"
                       << socketInfo.absolutePath();
            return false;
        }

        if (QFile::exists(socketPath)) {
            if (!QLocalServer::removeServer(socketPath)) {
                qWarning() << "Failed to remove existing Sprout socket" << socketPath;
                return false;
            }
        }
    } else {
        QLocalServer::removeServer(socketPath);
    }

    if (!m_server.listen(socketPath)) {
        qWarning() << "Failed to listen on Sprout socket" << socketPath
                   << m_server.errorString();
        return false;
    }

    connect(&m_server, &QLocalServer::newConnection,
            this, &SproutApiServer::handleNewConnection);

    qInfo() << "Sprout API server listening on" << socketPath;
    return true;
}

void SproutApiServer::handleNewConnection()
{
    while (m_server.hasPendingConnections()) {
        QLocalSocket *socket = m_server.nextPendingConnection();
        if (!socket) {
            continue;
        }
        connect(socket, &QLocalSocket::readyRead,
                this, &SproutApiServer::handleClientReadyRead);
        connect(socket, &QLocalSocket::disconnected,
                socket, &QObject::deleteLater);
    }
}

void SproutApiServer::handleClientReadyRead()
{
    auto *socket = qobject_cast<QLocalSocket *>(sender());
    if (!socket) {
        return;
    }

    const QByteArray payload = socket->readAll();
    if (payload.isEmpty()) {
        return;
    }

    const QByteArray response = handleRequestPayload(payload);
    socket->write(response);
    socket->flush();
    socket->disconnectFromServer();
}

QByteArray SproutApiServer::handleRequestPayload(const QByteArray &payload)
{
    // JSON-RPC-style request handler. All requests are local-only via UNIX socket.
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    logging::CorrelationScope corrScope(corrId);
    const auto parsed = nlohmann::json::parse(payload.toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        SLOG_WARN(QStringLiteral("SproutApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_error"),
                  QStringLiteral("parse_payload"),
                  QStringLiteral("json_parse"),
                  logging::defaultWho(),
                  corrId,
                  nlohmann::json::object());
        return makeErrorResponse("Invalid JSON payload");
    }

    int id = -1;
    if (parsed.contains("id") && parsed["id"].is_number_integer()) {
        id = parsed["id"].get<int>();
    }

    if (!parsed.contains("method") || !parsed["method"].is_string()) {
        SLOG_WARN(QStringLiteral("SproutApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_error"),
                  QStringLiteral("missing_method"),
                  QStringLiteral("json_parse"),
                  logging::defaultWho(),
                  corrId,
                  nlohmann::json::object());
        return makeErrorResponse("Missing method", id);
    }

    const std::string method = parsed["method"].get<std::string>();
    nlohmann::json params = nlohmann::json::object();
    if (parsed.contains("params")) {
        if (!parsed["params"].is_object()) {
            return makeErrorResponse("Invalid params", id);
        }
        params = parsed["params"];
    }

    nlohmann::json paramKeys = nlohmann::json::array();
    for (auto it = params.begin(); it != params.end(); ++it) {
        paramKeys.push_back(it.key());
    }
    SLOG_INFO(QStringLiteral("SproutApiServer"),
              QStringLiteral("handleRequest"),
              QStringLiteral("api_request_received"),
              QStringLiteral("client_call"),
              QStringLiteral("json_rpc"),
              logging::defaultWho(),
              corrId,
              (nlohmann::json{{"method", method},
                             {"paramKeys", paramKeys}}));

    const auto start = std::chrono::steady_clock::now();
    try {
        const QByteArray response = handleMethod(method, params, id);
        SLOG_INFO(QStringLiteral("SproutApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_completed"),
                  QStringLiteral("client_call"),
                  QStringLiteral("json_rpc"),
                  logging::defaultWho(),
                  corrId,
                  (nlohmann::json{{"method", method},
                                 {"durationMs",
                                  std::chrono::duration_cast<std::chrono::milliseconds>(
                                      std::chrono::steady_clock::now() - start).count()}}));
        return response;
    } catch (const std::exception &ex) {
        SLOG_ERROR(QStringLiteral("SproutApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_error"),
                   QStringLiteral("exception"),
                   QStringLiteral("json_rpc"),
                   logging::defaultWho(),
                   corrId,
                   (nlohmann::json{{"method", method},
                                  {"error", ex.what()}}));
        return makeErrorResponse(QString::fromStdString(ex.what()), id);
    }
}

QByteArray SproutApiServer::handleMethod(const std::string &method,
                                         const nlohmann::json &params,
                                         int id)
{
    const auto now = std::chrono::system_clock::now();

    if (method == "get_status") {
        nlohmann::json result;
        result["health"] = m_loop.health();
        result["devices"] = m_actuator.states();
        // Last state each device was driven to, as persisted.
        result["recordedDeviceStates"] = m_store.listDeviceStates();
        const auto reading = m_loop.lastReading();
        result["latestReading"] = reading ? nlohmann::json(*reading) : nlohmann::json();
        const auto project = m_store.getActiveProject();
        result["activeProject"] = project ? projectSummary(*project) : nlohmann::json();
        return makeResultResponse(result, id);
    }

    if (method == "get_devices") {
        nlohmann::json devices = nlohmann::json::array();
        for (const auto &device : m_actuator.deviceNames()) {
            devices.push_back(deviceSummary(device));
        }
        return makeResultResponse(nlohmann::json{{"devices", devices}}, id);
    }

    if (method == "turn_on" || method == "turn_off" || method == "toggle") {
        return handleSwitch(method, params, id);
    }

    if (method == "get_device_settings") {
        const std::string device = params.value("device", "");
        if (device.empty()) {
            nlohmann::json settings = nlohmann::json::object();
            for (const auto &config : m_store.listDeviceConfigs()) {
                settings[config.name] = deviceConfigToJson(config);
            }
            return makeResultResponse(nlohmann::json{{"settings", settings}}, id);
        }
        const auto config = m_store.getDeviceConfig(device);
        if (!config) {
            return makeErrorResponse("Device settings not found", id);
        }
        return makeResultResponse(nlohmann::json{{"settings", deviceConfigToJson(*config)}}, id);
    }

    if (method == "save_device_settings") {
        return handleSaveDeviceSettings(params, id);
    }

    if (method == "get_alert_settings") {
        const auto config = m_store.getAlertConfig().value_or(AlertConfig{});
        return makeResultResponse(nlohmann::json{{"settings", config}}, id);
    }

    if (method == "save_alert_settings") {
        const auto settings = params.value("settings", nlohmann::json::object());
        if (!settings.is_object()) {
            return makeErrorResponse("Invalid alert settings", id);
        }
        const auto config = settings.get<AlertConfig>();
        if ((config.tempMin && config.tempMax && *config.tempMin > *config.tempMax)
            || (config.humidityMin && config.humidityMax
                && *config.humidityMin > *config.humidityMax)) {
            return makeErrorResponse("Alert minimum exceeds maximum", id);
        }
        m_store.saveAlertConfig(config, now);
        return makeResultResponse(nlohmann::json{{"settings", config}}, id);
    }

    if (method == "get_latest_reading") {
        if (const auto reading = m_loop.lastReading()) {
            return makeResultResponse(nlohmann::json{{"reading", *reading}}, id);
        }
        const auto entry = m_store.latestSensorReading();
        return makeResultResponse(
            nlohmann::json{{"reading", entry ? nlohmann::json(entry->reading)
                                             : nlohmann::json()}},
            id);
    }

    if (method == "get_readings") {
        auto to = now;
        auto from = now - std::chrono::hours(24);
        if (params.contains("from")) {
            from = fromIso8601Utc(params.value("from", ""));
            if (from == std::chrono::system_clock::time_point{}) {
                return makeErrorResponse("Invalid from timestamp", id);
            }
        }
        if (params.contains("to")) {
            to = fromIso8601Utc(params.value("to", ""));
            if (to == std::chrono::system_clock::time_point{}) {
                return makeErrorResponse("Invalid to timestamp", id);
            }
        }
        const int limit = params.value("limit", 1000);
        if (limit <= 0) {
            return makeErrorResponse("Invalid limit", id);
        }
        const auto readings = m_store.sensorReadingsBetween(
            from, to, projectIdParam(params, "projectId"), limit);
        return makeResultResponse(nlohmann::json{{"readings", readings}}, id);
    }

    if (method == "list_projects") {
        nlohmann::json projects = nlohmann::json::array();
        for (const auto &project : m_store.listProjects()) {
            projects.push_back(projectSummary(project));
        }
        return makeResultResponse(nlohmann::json{{"projects", projects}}, id);
    }

    if (method == "get_active_project") {
        const auto project = m_store.getActiveProject();
        return makeResultResponse(
            nlohmann::json{{"project", project ? projectSummary(*project) : nlohmann::json()}},
            id);
    }

    if (method == "create_project") {
        return handleCreateProject(params, id);
    }

    if (method == "end_project" || method == "archive_project") {
        const auto projectId = projectIdParam(params, "id");
        if (!projectId) {
            return makeErrorResponse("Missing project id", id);
        }
        const bool changed = method == "end_project"
            ? m_store.endProject(*projectId, now)
            : m_store.archiveProject(*projectId);
        if (!changed) {
            return makeErrorResponse("Project not found or not in a valid state", id);
        }
        m_loop.stopProjectTimelapse(*projectId);
        return makeResultResponse(
            nlohmann::json{{"project", projectSummary(*m_store.getProject(*projectId))}}, id);
    }

    if (method == "set_project_timelapse") {
        const auto projectId = projectIdParam(params, "id");
        if (!projectId) {
            return makeErrorResponse("Missing project id", id);
        }
        if (!params.contains("enabled") || !params["enabled"].is_boolean()) {
            return makeErrorResponse("Missing enabled flag", id);
        }
        const bool enabled = params["enabled"].get<bool>();
        std::optional<int> interval;
        if (params.contains("interval")) {
            if (!params["interval"].is_number_integer()) {
                return makeErrorResponse("Invalid interval", id);
            }
            interval = params["interval"].get<int>();
        }
        if (!m_store.setProjectTimelapse(*projectId, enabled, interval)) {
            return makeErrorResponse("Project not found", id);
        }
        if (enabled) {
            m_loop.startProjectTimelapse(*projectId);
        } else {
            m_loop.stopProjectTimelapse(*projectId);
        }
        return makeResultResponse(
            nlohmann::json{{"project", projectSummary(*m_store.getProject(*projectId))}}, id);
    }

    if (method == "get_timelapse_images") {
        const auto projectId = projectIdParam(params, "projectId");
        if (!projectId) {
            return makeErrorResponse("Missing project id", id);
        }
        const auto images = m_store.listTimelapseImages(*projectId, params.value("limit", 0));
        return makeResultResponse(nlohmann::json{{"images", images}}, id);
    }

    if (method == "get_setting") {
        const std::string key = params.value("key", "");
        if (key.empty()) {
            return makeErrorResponse("Missing setting key", id);
        }
        const auto value = m_store.getSetting(key);
        return makeResultResponse(
            nlohmann::json{{"key", key}, {"value", value ? nlohmann::json(*value) : nlohmann::json()}},
            id);
    }

    if (method == "set_setting") {
        const std::string key = params.value("key", "");
        if (key.empty()) {
            return makeErrorResponse("Missing setting key", id);
        }
        if (!params.contains("value") || !params["value"].is_string()) {
            return makeErrorResponse("Invalid setting value", id);
        }
        const std::string value = params["value"].get<std::string>();
        m_store.setSetting(key, value, now);
        return makeResultResponse(nlohmann::json{{"key", key}, {"value", value}}, id);
    }

    if (method == "capture_photo") {
        std::optional<std::string> path;
        if (params.contains("path") && params["path"].is_string()) {
            path = params["path"].get<std::string>();
        }
        const auto saved = m_loop.capturePhoto(path);
        if (!saved) {
            return makeErrorResponse("Photo capture failed", id);
        }
        return makeResultResponse(nlohmann::json{{"path", *saved}}, id);
    }

    return makeErrorResponse("Unknown method", id);
}

QByteArray SproutApiServer::handleSwitch(const std::string &method,
                                         const nlohmann::json &params,
                                         int id)
{
    const std::string device = params.value("device", "");
    if (device.empty()) {
        return makeErrorResponse("Missing device", id);
    }
    if (!m_actuator.hasDevice(device)) {
        return makeErrorResponse("Unknown device", id);
    }

    std::optional<bool> state;
    if (method == "toggle") {
        state = m_actuator.toggle(device);
    } else {
        const bool on = method == "turn_on";
        if (m_actuator.set(device, on)) {
            state = on;
        }
    }
    if (!state) {
        return makeErrorResponse("Failed to switch device", id);
    }

    m_store.setDeviceState(device, *state, std::chrono::system_clock::now());
    SLOG_INFO(QStringLiteral("SproutApiServer"),
              QStringLiteral("handleSwitch"),
              QStringLiteral("device_switched"),
              QStringLiteral("manual_control"),
              QStringLiteral("actuator"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"device", device}, {"on", *state}}));
    return makeResultResponse(nlohmann::json{{"device", device}, {"on", *state}}, id);
}

QByteArray SproutApiServer::handleSaveDeviceSettings(const nlohmann::json &params, int id)
{
    const std::string device = params.value("device", "");
    if (device.empty()) {
        return makeErrorResponse("Missing device", id);
    }
    const auto settings = params.value("settings", nlohmann::json::object());
    if (!settings.is_object()) {
        return makeErrorResponse("Invalid device settings", id);
    }

    std::vector<std::string> errors;
    DeviceConfig config = deviceConfigFromJson(device, settings, &errors);
    if (!errors.empty()) {
        return makeErrorResponse(
            QStringLiteral("Invalid device settings: %1")
                .arg(QString::fromStdString(joinErrors(errors))),
            id);
    }
    if (!settings.contains("role")) {
        if (const auto existing = m_store.getDeviceConfig(device)) {
            config.role = existing->role;
        }
    }

    m_store.saveDeviceConfig(config, std::chrono::system_clock::now());
    return makeResultResponse(nlohmann::json{{"settings", deviceConfigToJson(config)}}, id);
}

QByteArray SproutApiServer::handleCreateProject(const nlohmann::json &params, int id)
{
    const std::string name = params.value("name", "");
    if (name.empty()) {
        return makeErrorResponse("Missing project name", id);
    }
    if (m_store.getActiveProject()) {
        return makeErrorResponse("A project is already active", id);
    }

    const Project project = m_store.createProject(name,
                                                  params.value("notes", ""),
                                                  params.value("timelapseEnabled", true),
                                                  params.value("timelapseInterval", 300),
                                                  std::chrono::system_clock::now());
    if (project.timelapseEnabled) {
        m_loop.startProjectTimelapse(project.id);
    }
    return makeResultResponse(nlohmann::json{{"project", projectSummary(project)}}, id);
}

nlohmann::json SproutApiServer::deviceSummary(const std::string &device) const
{
    nlohmann::json summary;
    summary["name"] = device;
    const auto state = m_actuator.state(device);
    summary["on"] = state ? nlohmann::json(*state) : nlohmann::json();
    if (const auto config = m_store.getDeviceConfig(device)) {
        summary["mode"] = toDeviceModeString(config->mode);
        summary["enabled"] = config->enabled;
        summary["role"] = toDeviceRoleString(config->role);
    } else {
        summary["mode"] = toDeviceModeString(DeviceMode::Manual);
        summary["enabled"] = true;
        summary["role"] = toDeviceRoleString(defaultRoleForDevice(device));
    }
    return summary;
}

nlohmann::json SproutApiServer::projectSummary(const Project &project) const
{
    nlohmann::json summary = project;
    summary["imageCount"] = m_store.countTimelapseImages(project.id);
    // Whether the control loop currently holds a capture timer for it.
    summary["timelapseScheduled"] = m_loop.isTrackingTimelapse(project.id);
    return summary;
}

QByteArray SproutApiServer::makeErrorResponse(const QString &message, int id) const
{
    nlohmann::json response;
    response["error"] = message.toStdString();
    response["id"] = id;
    return QByteArray::fromStdString(response.dump());
}

QByteArray SproutApiServer::makeResultResponse(const nlohmann::json &result, int id) const
{
    nlohmann::json response;
    response["result"] = result;
    response["id"] = id;
    return QByteArray::fromStdString(response.dump());
}

} // namespace sprout
