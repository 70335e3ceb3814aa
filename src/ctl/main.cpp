#include <QCoreApplication>

#include "ctl/SproutCtl.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    const bool trace = qEnvironmentVariableIntValue("SPROUT_TRACE") == 1;
    sprout::logging::initLogging(QStringLiteral("sprout-ctl"), trace);
    SLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("ctl_start"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              sprout::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"args", argc}}));

    // CLI entry point: delegate to SproutCtl for argument parsing and output.
    sprout::SproutCtl cli;
    return cli.run(argc, argv);
}
