#include "ctl/SproutCtl.hpp"

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <QElapsedTimer>
#include <QLocalSocket>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"

namespace sprout {

namespace {

constexpr int kConnectTimeoutMs = 1000;
// capture_photo waits for the camera command on the daemon side.
constexpr int kResponseTimeoutMs = 30000;

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  sprout-ctl status [--json]\n"
        "  sprout-ctl devices [--json]\n"
        "  sprout-ctl on|off|toggle DEVICE [--json]\n"
        "  sprout-ctl reading [--json]\n"
        "  sprout-ctl projects [--json]\n"
        "  sprout-ctl project-start NAME [--interval SECONDS] [--no-timelapse] [--json]\n"
        "  sprout-ctl project-end ID [--json]\n"
        "  sprout-ctl photo [--out PATH] [--json]\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

std::string formatNumber(const nlohmann::json &value, const char *unit)
{
    if (!value.is_number()) {
        return "n/a";
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value.get<double>() << unit;
    return out.str();
}

std::string onOff(const nlohmann::json &value)
{
    if (!value.is_boolean()) {
        return "unknown";
    }
    return value.get<bool>() ? "ON" : "OFF";
}

void renderReading(std::ostream &out, const nlohmann::json &reading)
{
    if (!reading.is_object()) {
        out << "No sensor reading yet.\n";
        return;
    }
    out << "Temperature: " << formatNumber(reading.value("temperature", nlohmann::json()), " C")
        << "\n";
    out << "Humidity:    " << formatNumber(reading.value("humidity", nlohmann::json()), " %")
        << "\n";
    out << "Pressure:    " << formatNumber(reading.value("pressure", nlohmann::json()), " hPa")
        << "\n";
    out << "Gas:         "
        << formatNumber(reading.value("gasResistance", nlohmann::json()), " ohm") << "\n";
    if (reading.contains("capturedAt") && reading["capturedAt"].is_string()) {
        out << "Captured at: " << reading["capturedAt"].get<std::string>() << "\n";
    }
}

void renderProject(std::ostream &out, const nlohmann::json &project)
{
    out << "#" << project.value("id", 0) << " " << project.value("name", std::string())
        << " [" << project.value("status", std::string()) << "]";
    if (project.value("timelapseEnabled", false)) {
        out << " timelapse every " << project.value("timelapseInterval", 0) << "s";
    }
    if (project.contains("imageCount")) {
        out << ", " << project.value("imageCount", 0) << " images";
    }
    out << "\n";
}

} // namespace

std::optional<CtlRequest> SproutCtl::parseCommand(const QStringList &args, QString *error)
{
    if (args.size() < 2) {
        if (error) {
            *error = usageText();
        }
        return std::nullopt;
    }

    CtlRequest request;
    request.command = args.at(1);
    request.rawJson = args.contains(QStringLiteral("--json"));
    const QString &command = request.command;

    auto positional = [&args](int index) -> QString {
        if (index >= args.size() || args.at(index).startsWith(QStringLiteral("--"))) {
            return {};
        }
        return args.at(index);
    };

    if (command == QStringLiteral("status")) {
        request.method = "get_status";
    } else if (command == QStringLiteral("devices")) {
        request.method = "get_devices";
    } else if (command == QStringLiteral("on") || command == QStringLiteral("off")
               || command == QStringLiteral("toggle")) {
        const QString device = positional(2);
        if (device.isEmpty()) {
            if (error) {
                *error = QStringLiteral("Missing device name.\n") + usageText();
            }
            return std::nullopt;
        }
        request.method = command == QStringLiteral("on") ? "turn_on"
            : command == QStringLiteral("off")           ? "turn_off"
                                                         : "toggle";
        request.params["device"] = device.toStdString();
    } else if (command == QStringLiteral("reading")) {
        request.method = "get_latest_reading";
    } else if (command == QStringLiteral("projects")) {
        request.method = "list_projects";
    } else if (command == QStringLiteral("project-start")) {
        const QString name = positional(2);
        if (name.isEmpty()) {
            if (error) {
                *error = QStringLiteral("Missing project name.\n") + usageText();
            }
            return std::nullopt;
        }
        request.method = "create_project";
        request.params["name"] = name.toStdString();
        request.params["timelapseEnabled"] = !args.contains(QStringLiteral("--no-timelapse"));
        const QString interval = getArgValue(args, QStringLiteral("--interval"));
        if (!interval.isEmpty()) {
            bool ok = false;
            const int seconds = interval.toInt(&ok);
            if (!ok) {
                if (error) {
                    *error = QStringLiteral("Invalid interval: %1\n").arg(interval);
                }
                return std::nullopt;
            }
            request.params["timelapseInterval"] = seconds;
        }
    } else if (command == QStringLiteral("project-end")) {
        bool ok = false;
        const qlonglong id = positional(2).toLongLong(&ok);
        if (!ok) {
            if (error) {
                *error = QStringLiteral("Missing or invalid project id.\n") + usageText();
            }
            return std::nullopt;
        }
        request.method = "end_project";
        request.params["id"] = static_cast<std::int64_t>(id);
    } else if (command == QStringLiteral("photo")) {
        request.method = "capture_photo";
        const QString out = getArgValue(args, QStringLiteral("--out"));
        if (!out.isEmpty()) {
            request.params["path"] = out.toStdString();
        }
    } else {
        if (error) {
            *error = usageText();
        }
        return std::nullopt;
    }
    return request;
}

std::string SproutCtl::renderResult(const CtlRequest &request, const nlohmann::json &result)
{
    if (request.rawJson) {
        return result.dump(2) + "\n";
    }

    std::ostringstream out;
    const std::string &method = request.method;
    if (method == "get_status") {
        const auto health = result.value("health", nlohmann::json::object());
        out << "Control loop: " << (health.value("running", false) ? "running" : "stopped")
            << "\n";
        const auto simulated = health.value("simulated", nlohmann::json::object());
        out << "Hardware:     relay " << (simulated.value("relay", false) ? "simulated" : "real")
            << ", sensor " << (simulated.value("sensor", false) ? "simulated" : "real")
            << ", camera " << (simulated.value("camera", false) ? "simulated" : "real") << "\n";
        out << "Failures:     " << health.value("consecutiveFailures", 0) << " consecutive\n";
        out << "\nDevices:\n";
        const auto devices = result.value("devices", nlohmann::json::object());
        for (const auto &device : devices.items()) {
            out << "  " << std::left << std::setw(14) << device.key() << onOff(device.value())
                << "\n";
        }
        out << "\n";
        renderReading(out, result.value("latestReading", nlohmann::json()));
        const auto project = result.value("activeProject", nlohmann::json());
        out << "\nActive project: ";
        if (project.is_object()) {
            renderProject(out, project);
        } else {
            out << "none\n";
        }
    } else if (method == "get_devices") {
        const auto devices = result.value("devices", nlohmann::json::array());
        for (const auto &device : devices) {
            out << std::left << std::setw(14) << device.value("name", std::string())
                << std::setw(8) << onOff(device.value("on", nlohmann::json()))
                << device.value("mode", std::string())
                << (device.value("enabled", true) ? "" : " (disabled)") << "\n";
        }
    } else if (method == "turn_on" || method == "turn_off" || method == "toggle") {
        out << result.value("device", std::string()) << " is now "
            << onOff(result.value("on", nlohmann::json())) << "\n";
    } else if (method == "get_latest_reading") {
        renderReading(out, result.value("reading", nlohmann::json()));
    } else if (method == "list_projects") {
        const auto projects = result.value("projects", nlohmann::json::array());
        if (projects.empty()) {
            out << "No projects.\n";
        }
        for (const auto &project : projects) {
            renderProject(out, project);
        }
    } else if (method == "create_project" || method == "end_project") {
        renderProject(out, result.value("project", nlohmann::json::object()));
    } else if (method == "capture_photo") {
        out << "Saved " << result.value("path", std::string()) << "\n";
    } else {
        out << result.dump(2) << "\n";
    }
    return out.str();
}

int SproutCtl::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    QString error;
    const auto request = parseCommand(args, &error);
    if (!request) {
        std::cerr << error.toStdString();
        return 1;
    }

    SLOG_INFO(QStringLiteral("SproutCtl"),
              QStringLiteral("run"),
              QStringLiteral("ctl_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("json_rpc"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"command", request->command.toStdString()},
                             {"method", request->method}});

    const auto response = sendRequest(*request, &error);
    if (!response) {
        std::cerr << error.toStdString() << std::endl;
        return 1;
    }
    if (response->contains("error")) {
        const auto &message = (*response)["error"];
        std::cerr << "Error: "
                  << (message.is_string() ? message.get<std::string>() : message.dump())
                  << std::endl;
        return 1;
    }

    std::cout << renderResult(*request, response->value("result", nlohmann::json()));
    return 0;
}

std::optional<nlohmann::json> SproutCtl::sendRequest(const CtlRequest &request,
                                                     QString *error) const
{
    QLocalSocket socket;
    socket.connectToServer(daemonSocketPath());
    if (!socket.waitForConnected(kConnectTimeoutMs)) {
        *error = QStringLiteral("Cannot reach sprout-daemon at %1: %2")
                     .arg(daemonSocketPath(), socket.errorString());
        return std::nullopt;
    }

    const nlohmann::json payload = {
        {"id", 1},
        {"method", request.method},
        {"params", request.params}
    };
    socket.write(QByteArray::fromStdString(payload.dump()));
    if (!socket.waitForBytesWritten(kConnectTimeoutMs)) {
        *error = QStringLiteral("Failed to send request: %1").arg(socket.errorString());
        return std::nullopt;
    }

    // The daemon answers once and disconnects.
    QByteArray data;
    QElapsedTimer timer;
    timer.start();
    while (socket.state() == QLocalSocket::ConnectedState
           && timer.elapsed() < kResponseTimeoutMs) {
        if (socket.waitForReadyRead(100)) {
            data += socket.readAll();
        }
    }
    data += socket.readAll();

    const auto response = nlohmann::json::parse(data.toStdString(), nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        *error = data.isEmpty() ? QStringLiteral("No response from sprout-daemon")
                                : QStringLiteral("Malformed response from sprout-daemon");
        return std::nullopt;
    }
    return response;
}

} // namespace sprout
