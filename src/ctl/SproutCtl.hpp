#pragma once

#include <optional>
#include <string>

#include <QString>
#include <QStringList>

#include <nlohmann/json.hpp>

namespace sprout {

// One JSON-RPC call derived from the command line.
struct CtlRequest {
    QString command;
    std::string method;
    nlohmann::json params = nlohmann::json::object();
    bool rawJson = false;
};

class SproutCtl
{
public:
    // CLI dispatcher: one request to the daemon, one summary printed.
    // returns exit code
    int run(int argc, char *argv[]);

    // Maps argv (program name first) to a request; nullopt with `error` set
    // on bad usage.
    static std::optional<CtlRequest> parseCommand(const QStringList &args, QString *error);
    // Human-readable rendering of a successful result.
    static std::string renderResult(const CtlRequest &request, const nlohmann::json &result);

private:
    std::optional<nlohmann::json> sendRequest(const CtlRequest &request, QString *error) const;
};

} // namespace sprout
