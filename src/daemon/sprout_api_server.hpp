#pragma once

#include <QObject>
#include <QLocalServer>
#include <QLocalSocket>

#include <nlohmann/json.hpp>

#include "daemon/actuator_accessor.hpp"
#include "daemon/control_loop.hpp"
#include "daemon/sprout_store.hpp"

namespace sprout {

/**
 * SproutApiServer exposes device control, settings, sensor history and
 * projects over a local UNIX socket using a minimal JSON-RPC-like protocol.
 *
 * Manual device control goes through the same ActuatorAccessor the control
 * loop uses. `store` is the main thread's connection.
 */
class SproutApiServer : public QObject
{
    Q_OBJECT
public:
    SproutApiServer(SproutStore &store,
                    ActuatorAccessor &actuator,
                    ControlLoop &loop,
                    QObject *parent = nullptr);
    ~SproutApiServer() override;

    // Start listening on $XDG_RUNTIME_DIR/sprout.sock
    bool start();
    // Process a single JSON-RPC payload without a socket round-trip.
    QByteArray handleRequestPayload(const QByteArray &payload);

private slots:
    void handleNewConnection();
    void handleClientReadyRead();

private:
    QByteArray handleMethod(const std::string &method, const nlohmann::json &params, int id);
    QByteArray handleSwitch(const std::string &method, const nlohmann::json &params, int id);
    QByteArray handleSaveDeviceSettings(const nlohmann::json &params, int id);
    QByteArray handleCreateProject(const nlohmann::json &params, int id);

    nlohmann::json deviceSummary(const std::string &device) const;
    nlohmann::json projectSummary(const Project &project) const;

    QByteArray makeErrorResponse(const QString &message, int id = -1) const;
    QByteArray makeResultResponse(const nlohmann::json &result, int id) const;

    SproutStore &m_store;
    ActuatorAccessor &m_actuator;
    ControlLoop &m_loop;
    QLocalServer m_server;
};

} // namespace sprout
