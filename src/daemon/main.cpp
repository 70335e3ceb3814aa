#include <csignal>
#include <exception>
#include <memory>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QSocketNotifier>

#include <sys/socket.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "daemon/sprout_daemon.hpp"

namespace {

int g_signalFds[2] = {-1, -1};

void handleTerminationSignal(int)
{
    const char byte = 1;
    // Only async-signal-safe work here; the event loop does the rest.
    [[maybe_unused]] const ssize_t written = ::write(g_signalFds[0], &byte, sizeof(byte));
}

bool installSignalHandlers()
{
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, g_signalFds) != 0) {
        return false;
    }
    struct sigaction action {};
    action.sa_handler = handleTerminationSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    return ::sigaction(SIGINT, &action, nullptr) == 0
        && ::sigaction(SIGTERM, &action, nullptr) == 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("sprout-daemon"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Grow-tent control daemon"));
    parser.addHelpOption();
    const QCommandLineOption configOption(QStringLiteral("config"),
                                          QStringLiteral("Settings file."),
                                          QStringLiteral("path"));
    const QCommandLineOption traceOption(QStringLiteral("trace"),
                                         QStringLiteral("Write the verbose trace log."));
    const QCommandLineOption simulateOption(QStringLiteral("simulate"),
                                            QStringLiteral("Use simulated hardware."));
    parser.addOption(configOption);
    parser.addOption(traceOption);
    parser.addOption(simulateOption);
    parser.process(app);

    const bool trace = parser.isSet(traceOption)
        || qEnvironmentVariableIntValue("SPROUT_TRACE") == 1;
    sprout::logging::initLogging(QStringLiteral("sprout-daemon"), trace);

    QString configPath = parser.value(configOption);
    if (configPath.isEmpty()) {
        configPath = qEnvironmentVariable("SPROUT_CONFIG");
    }
    if (configPath.isEmpty()) {
        configPath = QString::fromStdString(sprout::defaultConfigPath());
    }

    sprout::SproutConfig config = sprout::loadConfig(configPath.toStdString());
    sprout::applyEnvironmentOverrides(config);
    if (parser.isSet(simulateOption)) {
        config.simulate = true;
    }

    sprout::logging::LogOptions logOptions;
    logOptions.traceEnabled = trace;
    if (const auto level = sprout::logging::parseLogLevel(
            QString::fromStdString(config.logLevel))) {
        logOptions.minimumLevel = *level;
    }
    sprout::logging::initLogging(QStringLiteral("sprout-daemon"), logOptions);
    SLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("daemon_start"),
              QStringLiteral("user_start"),
              QStringLiteral("settings_file"),
              sprout::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"config", configPath.toStdString()},
                             {"simulate", config.simulate}}));
    qInfo() << "Sprout daemon starting...";

    if (!installSignalHandlers()) {
        qWarning() << "Sprout: failed to install signal handlers";
        return 1;
    }
    QSocketNotifier signalNotifier(g_signalFds[1], QSocketNotifier::Read);
    QObject::connect(&signalNotifier, &QSocketNotifier::activated, &app, [&signalNotifier] {
        signalNotifier.setEnabled(false);
        char byte = 0;
        [[maybe_unused]] const ssize_t bytesRead = ::read(g_signalFds[1], &byte, sizeof(byte));
        qInfo() << "Sprout: termination signal received";
        QCoreApplication::quit();
    });

    // A second daemon would fight the first one over the relays.
    if (sprout::isDaemonRunning()) {
        qWarning() << "Sprout: another daemon is already listening on"
                   << sprout::daemonSocketPath();
        return 1;
    }

    // The daemon lives for the lifetime of the process.
    std::unique_ptr<sprout::SproutDaemon> daemon;
    try {
        daemon = std::make_unique<sprout::SproutDaemon>(config);
    } catch (const std::exception &ex) {
        qWarning() << "Sprout: failed to open the database:" << ex.what();
        return 1;
    }
    if (!daemon->start()) {
        qWarning() << "Sprout: control loop failed to start";
        return 1;
    }
    QObject::connect(&app, &QCoreApplication::aboutToQuit,
                     daemon.get(), &sprout::SproutDaemon::stop);

    return app.exec();
}
