#include "hardware/command_camera.hpp"

#include <QDir>
#include <QFileInfo>

#include <utility>

#include "common/logging.hpp"
#include "common/process_utils.hpp"

namespace sprout {

CommandCamera::CommandCamera(CameraSettings settings)
    : m_settings(std::move(settings))
{
}

bool CommandCamera::initialize()
{
    m_program = findExecutable(QString::fromStdString(m_settings.command));
    if (m_program.isEmpty()) {
        SLOG_ERROR(QStringLiteral("CommandCamera"),
                   QStringLiteral("initialize"),
                   QStringLiteral("camera_command_missing"),
                   QStringLiteral("daemon_start"),
                   QStringLiteral("path_lookup"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"command", m_settings.command}});
        return false;
    }

    SLOG_INFO(QStringLiteral("CommandCamera"),
              QStringLiteral("initialize"),
              QStringLiteral("camera_initialized"),
              QStringLiteral("daemon_start"),
              QStringLiteral("external_command"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"program", m_program.toStdString()},
                             {"width", m_settings.width},
                             {"height", m_settings.height}});
    return true;
}

std::optional<std::string> CommandCamera::capture(const std::string &path)
{
    if (m_program.isEmpty()) {
        return std::nullopt;
    }

    const QString target = QString::fromStdString(path);
    QDir().mkpath(QFileInfo(target).absolutePath());

    const QStringList arguments = {
        QStringLiteral("--nopreview"),
        QStringLiteral("--immediate"),
        QStringLiteral("--width"), QString::number(m_settings.width),
        QStringLiteral("--height"), QString::number(m_settings.height),
        QStringLiteral("--rotation"), QString::number(m_settings.rotation),
        QStringLiteral("--output"), target,
    };

    const CommandResult result =
        runCommand(m_program, arguments, m_settings.timeoutSeconds * 1000);
    if (!result.ok() || !QFileInfo::exists(target)) {
        SLOG_WARN(QStringLiteral("CommandCamera"),
                  QStringLiteral("capture"),
                  QStringLiteral("capture_failed"),
                  QStringLiteral("photo_capture"),
                  QStringLiteral("external_command"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"path", path},
                                 {"exitCode", result.exitCode},
                                 {"timedOut", result.timedOut},
                                 {"stderr", result.standardError.left(512).toStdString()}});
        return std::nullopt;
    }

    SLOG_INFO(QStringLiteral("CommandCamera"),
              QStringLiteral("capture"),
              QStringLiteral("image_captured"),
              QStringLiteral("photo_capture"),
              QStringLiteral("external_command"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"path", path}});
    return path;
}

void CommandCamera::release()
{
    m_program.clear();
}

} // namespace sprout
