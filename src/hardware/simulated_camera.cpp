#include "hardware/simulated_camera.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include "common/logging.hpp"

namespace sprout {

bool SimulatedCamera::initialize()
{
    SLOG_WARN(QStringLiteral("SimulatedCamera"),
              QStringLiteral("initialize"),
              QStringLiteral("camera_simulation_mode"),
              QStringLiteral("daemon_start"),
              QStringLiteral("placeholder_file"),
              logging::defaultWho(),
              QString(),
              nlohmann::json::object());
    return true;
}

std::optional<std::string> SimulatedCamera::capture(const std::string &path)
{
    const QString target = QString::fromStdString(path);
    QDir().mkpath(QFileInfo(target).absolutePath());

    QFile file(target);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        SLOG_WARN(QStringLiteral("SimulatedCamera"),
                  QStringLiteral("capture"),
                  QStringLiteral("capture_failed"),
                  QStringLiteral("photo_capture"),
                  QStringLiteral("placeholder_file"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"path", path},
                                 {"error", file.errorString().toStdString()}});
        return std::nullopt;
    }
    file.write(QStringLiteral("Simulation %1\n")
                   .arg(QDateTime::currentDateTime().toString(Qt::ISODate))
                   .toUtf8());
    return path;
}

} // namespace sprout
