#include "daemon/sprout_store.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

#include <sqlite3.h>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace sprout {

namespace {

constexpr int kBusyTimeoutMs = 5000;
constexpr int kMinTimelapseIntervalSeconds = 30;

constexpr const char *kCreateProjectsTable =
    "CREATE TABLE IF NOT EXISTS projects ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    name TEXT NOT NULL,"
    "    notes TEXT,"
    "    status TEXT NOT NULL DEFAULT 'active',"
    "    start_date INTEGER NOT NULL,"
    "    end_date INTEGER,"
    "    timelapse_enabled INTEGER NOT NULL DEFAULT 1,"
    "    timelapse_interval INTEGER NOT NULL DEFAULT 300,"
    "    timelapse_last_capture INTEGER"
    ");";

constexpr const char *kCreateSensorLogsTable =
    "CREATE TABLE IF NOT EXISTS sensor_logs ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    project_id INTEGER REFERENCES projects(id),"
    "    timestamp INTEGER NOT NULL,"
    "    temperature REAL,"
    "    humidity REAL,"
    "    pressure REAL,"
    "    gas_resistance REAL"
    ");";

constexpr const char *kCreateSensorLogIndexes =
    "CREATE INDEX IF NOT EXISTS idx_sensor_logs_timestamp ON sensor_logs(timestamp);"
    "CREATE INDEX IF NOT EXISTS idx_sensor_logs_project ON sensor_logs(project_id);";

constexpr const char *kCreateDeviceSettingsTable =
    "CREATE TABLE IF NOT EXISTS device_settings ("
    "    device_name TEXT PRIMARY KEY,"
    "    mode TEXT NOT NULL DEFAULT 'manual',"
    "    enabled INTEGER NOT NULL DEFAULT 1,"
    "    schedule_json TEXT,"
    "    thresholds_json TEXT,"
    "    role TEXT,"
    "    updated_at INTEGER NOT NULL"
    ");";

constexpr const char *kCreateDeviceStatesTable =
    "CREATE TABLE IF NOT EXISTS device_states ("
    "    device_name TEXT PRIMARY KEY,"
    "    state INTEGER NOT NULL DEFAULT 0,"
    "    last_updated INTEGER NOT NULL"
    ");";

constexpr const char *kCreateAlertSettingsTable =
    "CREATE TABLE IF NOT EXISTS alert_settings ("
    "    id INTEGER PRIMARY KEY CHECK (id = 1),"
    "    enabled INTEGER NOT NULL DEFAULT 1,"
    "    temp_min REAL,"
    "    temp_max REAL,"
    "    humidity_min REAL,"
    "    humidity_max REAL,"
    "    notification_interval INTEGER NOT NULL DEFAULT 300,"
    "    updated_at INTEGER NOT NULL"
    ");";

constexpr const char *kCreateTimelapseImagesTable =
    "CREATE TABLE IF NOT EXISTS timelapse_images ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    project_id INTEGER NOT NULL REFERENCES projects(id),"
    "    timestamp INTEGER NOT NULL,"
    "    filepath TEXT NOT NULL"
    ");";

constexpr const char *kCreateSystemSettingsTable =
    "CREATE TABLE IF NOT EXISTS system_settings ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL,"
    "    updated_at INTEGER NOT NULL"
    ");";

constexpr const char *kProjectColumns =
    "id, name, notes, status, start_date, end_date, timelapse_enabled, "
    "timelapse_interval, timelapse_last_capture";

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("sqlite prepare failed: ")
                                     + sqlite3_errmsg(db));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

std::int64_t toEpochSeconds(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               timestamp.time_since_epoch())
        .count();
}

std::chrono::system_clock::time_point fromEpochSeconds(std::int64_t value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::seconds{value}};
}

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw std::runtime_error(message);
    }
}

void stepDoneOrThrow(sqlite3 *db, sqlite3_stmt *stmt, const char *what)
{
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalDouble(sqlite3_stmt *stmt, int index, const std::optional<double> &value)
{
    if (!value) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    sqlite3_bind_double(stmt, index, *value);
}

void bindOptionalInt64(sqlite3_stmt *stmt, int index, const std::optional<std::int64_t> &value)
{
    if (!value) {
        sqlite3_bind_null(stmt, index);
        return;
    }
    sqlite3_bind_int64(stmt, index, *value);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

std::optional<double> columnOptionalDouble(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_double(stmt, index);
}

std::optional<std::int64_t> columnOptionalInt64(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_int64(stmt, index);
}

nlohmann::json columnJson(sqlite3_stmt *stmt, int index, nlohmann::json fallback)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return fallback;
    }
    try {
        return nlohmann::json::parse(reinterpret_cast<const char *>(text));
    } catch (const nlohmann::json::parse_error &) {
        return fallback;
    }
}

Project readProject(sqlite3_stmt *stmt)
{
    Project project;
    project.id = sqlite3_column_int64(stmt, 0);
    project.name = columnText(stmt, 1);
    project.notes = columnText(stmt, 2);
    project.status = parseProjectStatus(columnText(stmt, 3));
    project.startDate = fromEpochSeconds(sqlite3_column_int64(stmt, 4));
    if (const auto endDate = columnOptionalInt64(stmt, 5)) {
        project.endDate = fromEpochSeconds(*endDate);
    }
    project.timelapseEnabled = sqlite3_column_int(stmt, 6) != 0;
    project.timelapseIntervalSeconds = sqlite3_column_int(stmt, 7);
    if (const auto lastCapture = columnOptionalInt64(stmt, 8)) {
        project.lastCaptureAt = fromEpochSeconds(*lastCapture);
    }
    return project;
}

SensorLogEntry readSensorLog(sqlite3_stmt *stmt)
{
    SensorLogEntry entry;
    entry.id = sqlite3_column_int64(stmt, 0);
    entry.projectId = columnOptionalInt64(stmt, 1);
    entry.reading.capturedAt = fromEpochSeconds(sqlite3_column_int64(stmt, 2));
    entry.reading.temperature = sqlite3_column_double(stmt, 3);
    entry.reading.humidity = sqlite3_column_double(stmt, 4);
    entry.reading.pressure = sqlite3_column_double(stmt, 5);
    entry.reading.gasResistance = sqlite3_column_double(stmt, 6);
    return entry;
}

DeviceConfig readDeviceConfig(sqlite3_stmt *stmt)
{
    const std::string name = columnText(stmt, 0);
    nlohmann::json settings = {
        {"mode", columnText(stmt, 1)},
        {"enabled", sqlite3_column_int(stmt, 2) != 0},
        {"schedule", columnJson(stmt, 3, nlohmann::json::array())},
        {"thresholds", columnJson(stmt, 4, nlohmann::json::object())}
    };
    const std::string role = columnText(stmt, 5);
    if (!role.empty()) {
        settings["role"] = role;
    }

    std::vector<std::string> errors;
    DeviceConfig config = deviceConfigFromJson(name, settings, &errors);
    if (!errors.empty()) {
        SLOG_WARN(QStringLiteral("SproutStore"),
                  QStringLiteral("readDeviceConfig"),
                  QStringLiteral("device_settings_invalid"),
                  QStringLiteral("settings_decode"),
                  QStringLiteral("skip_invalid_entries"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"device", name}, {"errors", errors}});
    }
    return config;
}

void validateInterval(int intervalSeconds)
{
    if (intervalSeconds < kMinTimelapseIntervalSeconds) {
        throw std::invalid_argument("timelapse interval must be at least 30 seconds");
    }
}

} // namespace

struct SproutStore::Impl {
    sqlite3 *db = nullptr;
    std::string path;
};

SproutStore::SproutStore()
    : SproutStore([] {
        const char *home = std::getenv("HOME");
        std::filesystem::path basePath = home ? home : ".";
        basePath /= ".local/share/sprout";
        return (basePath / "sprout.db").string();
    }())
{
}

SproutStore::SproutStore(const std::string &dbPath)
    : impl(std::make_unique<Impl>())
{
    impl->path = dbPath;
    const std::filesystem::path parent = std::filesystem::path(dbPath).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    if (sqlite3_open(dbPath.c_str(), &impl->db) != SQLITE_OK) {
        const std::string message = impl->db ? sqlite3_errmsg(impl->db) : "out of memory";
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw std::runtime_error("failed to open sprout database: " + message);
    }

    // The loop and the API server write through separate connections.
    sqlite3_busy_timeout(impl->db, kBusyTimeoutMs);
    execOrThrow(impl->db, "PRAGMA journal_mode=WAL;");
    execOrThrow(impl->db, "PRAGMA foreign_keys=ON;");

    execOrThrow(impl->db, kCreateProjectsTable);
    execOrThrow(impl->db, kCreateSensorLogsTable);
    execOrThrow(impl->db, kCreateSensorLogIndexes);
    execOrThrow(impl->db, kCreateDeviceSettingsTable);
    execOrThrow(impl->db, kCreateDeviceStatesTable);
    execOrThrow(impl->db, kCreateAlertSettingsTable);
    execOrThrow(impl->db, kCreateTimelapseImagesTable);
    execOrThrow(impl->db, kCreateSystemSettingsTable);
}

SproutStore::~SproutStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

std::string SproutStore::databasePath() const
{
    return impl->path;
}

Project SproutStore::createProject(const std::string &name,
                                   const std::string &notes,
                                   bool timelapseEnabled,
                                   int timelapseIntervalSeconds,
                                   std::chrono::system_clock::time_point now)
{
    if (name.empty()) {
        throw std::invalid_argument("project name must not be empty");
    }
    validateInterval(timelapseIntervalSeconds);

    if (const auto active = getActiveProject()) {
        throw std::runtime_error("project '" + active->name + "' is already active");
    }

    Statement stmt(impl->db,
                   "INSERT INTO projects (name, notes, status, start_date, "
                   "timelapse_enabled, timelapse_interval) "
                   "VALUES (?, ?, 'active', ?, ?, ?);");
    bindText(stmt.get(), 1, name);
    bindText(stmt.get(), 2, notes);
    sqlite3_bind_int64(stmt.get(), 3, toEpochSeconds(now));
    sqlite3_bind_int(stmt.get(), 4, timelapseEnabled ? 1 : 0);
    sqlite3_bind_int(stmt.get(), 5, timelapseIntervalSeconds);
    stepDoneOrThrow(impl->db, stmt.get(), "failed to insert project");

    Project project;
    project.id = sqlite3_last_insert_rowid(impl->db);
    project.name = name;
    project.notes = notes;
    project.status = ProjectStatus::Active;
    project.startDate = fromEpochSeconds(toEpochSeconds(now));
    project.timelapseEnabled = timelapseEnabled;
    project.timelapseIntervalSeconds = timelapseIntervalSeconds;
    return project;
}

std::optional<Project> SproutStore::getActiveProject() const
{
    const std::string sql = std::string("SELECT ") + kProjectColumns
        + " FROM projects WHERE status = 'active' ORDER BY start_date DESC, id DESC LIMIT 1;";
    Statement stmt(impl->db, sql.c_str());
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return readProject(stmt.get());
}

std::optional<Project> SproutStore::getProject(std::int64_t id) const
{
    const std::string sql = std::string("SELECT ") + kProjectColumns
        + " FROM projects WHERE id = ? LIMIT 1;";
    Statement stmt(impl->db, sql.c_str());
    sqlite3_bind_int64(stmt.get(), 1, id);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return readProject(stmt.get());
}

std::vector<Project> SproutStore::listProjects() const
{
    const std::string sql = std::string("SELECT ") + kProjectColumns
        + " FROM projects ORDER BY start_date DESC, id DESC;";
    Statement stmt(impl->db, sql.c_str());
    std::vector<Project> projects;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        projects.push_back(readProject(stmt.get()));
    }
    return projects;
}

bool SproutStore::endProject(std::int64_t id, std::chrono::system_clock::time_point now)
{
    Statement stmt(impl->db,
                   "UPDATE projects SET status = 'completed', end_date = ?, "
                   "timelapse_enabled = 0 WHERE id = ? AND status = 'active';");
    sqlite3_bind_int64(stmt.get(), 1, toEpochSeconds(now));
    sqlite3_bind_int64(stmt.get(), 2, id);
    stepDoneOrThrow(impl->db, stmt.get(), "failed to end project");
    return sqlite3_changes(impl->db) > 0;
}

bool SproutStore::archiveProject(std::int64_t id)
{
    Statement stmt(impl->db,
                   "UPDATE projects SET status = 'archived', timelapse_enabled = 0 "
                   "WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, id);
    stepDoneOrThrow(impl->db, stmt.get(), "failed to archive project");
    return sqlite3_changes(impl->db) > 0;
}

bool SproutStore::setProjectTimelapse(std::int64_t id,
                                      bool enabled,
                                      std::optional<int> intervalSeconds)
{
    if (intervalSeconds) {
        validateInterval(*intervalSeconds);
    }

    Statement stmt(impl->db,
                   "UPDATE projects SET timelapse_enabled = ?, "
                   "timelapse_interval = COALESCE(?, timelapse_interval) "
                   "WHERE id = ?;");
    sqlite3_bind_int(stmt.get(), 1, enabled ? 1 : 0);
    if (intervalSeconds) {
        sqlite3_bind_int(stmt.get(), 2, *intervalSeconds);
    } else {
        sqlite3_bind_null(stmt.get(), 2);
    }
    sqlite3_bind_int64(stmt.get(), 3, id);
    stepDoneOrThrow(impl->db, stmt.get(), "failed to update project timelapse");
    return sqlite3_changes(impl->db) > 0;
}

bool SproutStore::updateTimelapseCapture(std::int64_t id,
                                         std::chrono::system_clock::time_point capturedAt)
{
    Statement stmt(impl->db,
                   "UPDATE projects SET timelapse_last_capture = ? WHERE id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, toEpochSeconds(capturedAt));
    sqlite3_bind_int64(stmt.get(), 2, id);
    stepDoneOrThrow(impl->db, stmt.get(), "failed to update timelapse capture");
    return sqlite3_changes(impl->db) > 0;
}

std::vector<Project> SproutStore::projectsNeedingTimelapse() const
{
    const std::string sql = std::string("SELECT ") + kProjectColumns
        + " FROM projects WHERE status = 'active' AND timelapse_enabled = 1 ORDER BY id;";
    Statement stmt(impl->db, sql.c_str());
    std::vector<Project> projects;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        projects.push_back(readProject(stmt.get()));
    }
    return projects;
}

std::int64_t SproutStore::logSensorReading(const EnvironmentReading &reading,
                                           std::optional<std::int64_t> projectId)
{
    Statement stmt(impl->db,
                   "INSERT INTO sensor_logs (project_id, timestamp, temperature, "
                   "humidity, pressure, gas_resistance) VALUES (?, ?, ?, ?, ?, ?);");
    bindOptionalInt64(stmt.get(), 1, projectId);
    sqlite3_bind_int64(stmt.get(), 2, toEpochSeconds(reading.capturedAt));
    sqlite3_bind_double(stmt.get(), 3, reading.temperature);
    sqlite3_bind_double(stmt.get(), 4, reading.humidity);
    sqlite3_bind_double(stmt.get(), 5, reading.pressure);
    sqlite3_bind_double(stmt.get(), 6, reading.gasResistance);
    stepDoneOrThrow(impl->db, stmt.get(), "failed to insert sensor reading");
    return sqlite3_last_insert_rowid(impl->db);
}

std::optional<SensorLogEntry> SproutStore::latestSensorReading() const
{
    Statement stmt(impl->db,
                   "SELECT id, project_id, timestamp, temperature, humidity, pressure, "
                   "gas_resistance FROM sensor_logs ORDER BY timestamp DESC, id DESC LIMIT 1;");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return readSensorLog(stmt.get());
}

std::vector<SensorLogEntry> SproutStore::sensorReadingsBetween(
    std::chrono::system_clock::time_point from,
    std::chrono::system_clock::time_point to,
    std::optional<std::int64_t> projectId,
    int limit) const
{
    Statement stmt(impl->db,
                   "SELECT id, project_id, timestamp, temperature, humidity, pressure, "
                   "gas_resistance FROM sensor_logs "
                   "WHERE timestamp >= ? AND timestamp <= ? "
                   "AND (? IS NULL OR project_id = ?) "
                   "ORDER BY timestamp ASC, id ASC LIMIT ?;");
    sqlite3_bind_int64(stmt.get(), 1, toEpochSeconds(from));
    sqlite3_bind_int64(stmt.get(), 2, toEpochSeconds(to));
    bindOptionalInt64(stmt.get(), 3, projectId);
    bindOptionalInt64(stmt.get(), 4, projectId);
    sqlite3_bind_int(stmt.get(), 5, limit > 0 ? limit : -1);

    std::vector<SensorLogEntry> entries;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        entries.push_back(readSensorLog(stmt.get()));
    }
    return entries;
}

std::optional<DeviceConfig> SproutStore::getDeviceConfig(const std::string &deviceName) const
{
    Statement stmt(impl->db,
                   "SELECT device_name, mode, enabled, schedule_json, thresholds_json, role "
                   "FROM device_settings WHERE device_name = ? LIMIT 1;");
    bindText(stmt.get(), 1, deviceName);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return readDeviceConfig(stmt.get());
}

void SproutStore::saveDeviceConfig(const DeviceConfig &config,
                                   std::chrono::system_clock::time_point now)
{
    if (config.name.empty()) {
        throw std::invalid_argument("device name must not be empty");
    }

    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO device_settings (device_name, mode, enabled, "
                   "schedule_json, thresholds_json, role, updated_at) "
                   "VALUES (?, ?, ?, ?, ?, ?, ?);");
    bindText(stmt.get(), 1, config.name);
    bindText(stmt.get(), 2, toDeviceModeString(config.mode));
    sqlite3_bind_int(stmt.get(), 3, config.enabled ? 1 : 0);
    bindText(stmt.get(), 4, scheduleToJson(config.schedule).dump());
    bindText(stmt.get(), 5, thresholdsToJson(config.thresholds).dump());
    bindText(stmt.get(), 6, toDeviceRoleString(config.role));
    sqlite3_bind_int64(stmt.get(), 7, toEpochSeconds(now));
    stepDoneOrThrow(impl->db, stmt.get(), "failed to save device settings");
}

std::vector<DeviceConfig> SproutStore::listDeviceConfigs() const
{
    Statement stmt(impl->db,
                   "SELECT device_name, mode, enabled, schedule_json, thresholds_json, role "
                   "FROM device_settings ORDER BY device_name;");
    std::vector<DeviceConfig> configs;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        configs.push_back(readDeviceConfig(stmt.get()));
    }
    return configs;
}

void SproutStore::setDeviceState(const std::string &deviceName,
                                 bool on,
                                 std::chrono::system_clock::time_point now)
{
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO device_states (device_name, state, last_updated) "
                   "VALUES (?, ?, ?);");
    bindText(stmt.get(), 1, deviceName);
    sqlite3_bind_int(stmt.get(), 2, on ? 1 : 0);
    sqlite3_bind_int64(stmt.get(), 3, toEpochSeconds(now));
    stepDoneOrThrow(impl->db, stmt.get(), "failed to save device state");
}

std::optional<bool> SproutStore::getDeviceState(const std::string &deviceName) const
{
    Statement stmt(impl->db,
                   "SELECT state FROM device_states WHERE device_name = ? LIMIT 1;");
    bindText(stmt.get(), 1, deviceName);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    return sqlite3_column_int(stmt.get(), 0) != 0;
}

std::map<std::string, bool> SproutStore::listDeviceStates() const
{
    Statement stmt(impl->db, "SELECT device_name, state FROM device_states;");
    std::map<std::string, bool> states;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        states[columnText(stmt.get(), 0)] = sqlite3_column_int(stmt.get(), 1) != 0;
    }
    return states;
}

std::optional<AlertConfig> SproutStore::getAlertConfig() const
{
    Statement stmt(impl->db,
                   "SELECT enabled, temp_min, temp_max, humidity_min, humidity_max, "
                   "notification_interval FROM alert_settings WHERE id = 1;");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    AlertConfig config;
    config.enabled = sqlite3_column_int(stmt.get(), 0) != 0;
    config.tempMin = columnOptionalDouble(stmt.get(), 1);
    config.tempMax = columnOptionalDouble(stmt.get(), 2);
    config.humidityMin = columnOptionalDouble(stmt.get(), 3);
    config.humidityMax = columnOptionalDouble(stmt.get(), 4);
    config.notificationIntervalSeconds = sqlite3_column_int(stmt.get(), 5);
    return config;
}

void SproutStore::saveAlertConfig(const AlertConfig &config,
                                  std::chrono::system_clock::time_point now)
{
    if (config.notificationIntervalSeconds < 0) {
        throw std::invalid_argument("notification interval must not be negative");
    }

    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO alert_settings (id, enabled, temp_min, temp_max, "
                   "humidity_min, humidity_max, notification_interval, updated_at) "
                   "VALUES (1, ?, ?, ?, ?, ?, ?, ?);");
    sqlite3_bind_int(stmt.get(), 1, config.enabled ? 1 : 0);
    bindOptionalDouble(stmt.get(), 2, config.tempMin);
    bindOptionalDouble(stmt.get(), 3, config.tempMax);
    bindOptionalDouble(stmt.get(), 4, config.humidityMin);
    bindOptionalDouble(stmt.get(), 5, config.humidityMax);
    sqlite3_bind_int(stmt.get(), 6, config.notificationIntervalSeconds);
    sqlite3_bind_int64(stmt.get(), 7, toEpochSeconds(now));
    stepDoneOrThrow(impl->db, stmt.get(), "failed to save alert settings");
}

std::int64_t SproutStore::addTimelapseImage(std::int64_t projectId,
                                            std::chrono::system_clock::time_point timestamp,
                                            const std::string &filepath)
{
    Statement stmt(impl->db,
                   "INSERT INTO timelapse_images (project_id, timestamp, filepath) "
                   "VALUES (?, ?, ?);");
    sqlite3_bind_int64(stmt.get(), 1, projectId);
    sqlite3_bind_int64(stmt.get(), 2, toEpochSeconds(timestamp));
    bindText(stmt.get(), 3, filepath);
    stepDoneOrThrow(impl->db, stmt.get(), "failed to insert timelapse image");
    return sqlite3_last_insert_rowid(impl->db);
}

std::vector<TimelapseImage> SproutStore::listTimelapseImages(std::int64_t projectId,
                                                             int limit) const
{
    Statement stmt(impl->db,
                   "SELECT id, project_id, timestamp, filepath FROM timelapse_images "
                   "WHERE project_id = ? ORDER BY timestamp ASC, id ASC LIMIT ?;");
    sqlite3_bind_int64(stmt.get(), 1, projectId);
    sqlite3_bind_int(stmt.get(), 2, limit > 0 ? limit : -1);

    std::vector<TimelapseImage> images;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        TimelapseImage image;
        image.id = sqlite3_column_int64(stmt.get(), 0);
        image.projectId = sqlite3_column_int64(stmt.get(), 1);
        image.timestamp = fromEpochSeconds(sqlite3_column_int64(stmt.get(), 2));
        image.filepath = columnText(stmt.get(), 3);
        images.push_back(std::move(image));
    }
    return images;
}

int SproutStore::countTimelapseImages(std::int64_t projectId) const
{
    Statement stmt(impl->db,
                   "SELECT COUNT(*) FROM timelapse_images WHERE project_id = ?;");
    sqlite3_bind_int64(stmt.get(), 1, projectId);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return 0;
    }
    return sqlite3_column_int(stmt.get(), 0);
}

std::optional<std::string> SproutStore::getSetting(const std::string &key) const
{
    Statement stmt(impl->db,
                   "SELECT value FROM system_settings WHERE key = ? LIMIT 1;");
    bindText(stmt.get(), 1, key);

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }

    return columnText(stmt.get(), 0);
}

void SproutStore::setSetting(const std::string &key,
                             const std::string &value,
                             std::chrono::system_clock::time_point now)
{
    Statement stmt(impl->db,
                   "INSERT OR REPLACE INTO system_settings (key, value, updated_at) "
                   "VALUES (?, ?, ?);");
    bindText(stmt.get(), 1, key);
    bindText(stmt.get(), 2, value);
    sqlite3_bind_int64(stmt.get(), 3, toEpochSeconds(now));
    stepDoneOrThrow(impl->db, stmt.get(), "failed to set setting");
}

bool SproutStore::integrityCheck(std::string *message) const
{
    Statement stmt(impl->db, "PRAGMA integrity_check;");

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        if (message) {
            *message = "integrity_check failed to return a result";
        }
        return false;
    }

    const std::string result = columnText(stmt.get(), 0);
    if (message) {
        *message = result;
    }
    return result == "ok";
}

} // namespace sprout
