#pragma once

#include <memory>

#include <QObject>

#include "common/config.hpp"
#include "daemon/sprout_store.hpp"

namespace sprout {

class ActuatorAccessor;
class Capturer;
class ControlLoop;
class NotificationSink;
class SensorSource;
class SproutApiServer;

/**
 * SproutDaemon coordinates:
 * - seeding default device and alert settings into SproutStore
 * - choosing real or simulated hardware
 * - running the ControlLoop on its own thread
 * - serving the local API on the Qt event loop
 *
 * It is designed to be owned from main() and driven by Qt's event loop.
 */
class SproutDaemon : public QObject
{
    Q_OBJECT
public:
    explicit SproutDaemon(SproutConfig config, QObject *parent = nullptr);
    ~SproutDaemon() override;

    // Returns false when neither the real nor the simulated relays start.
    bool start();
    void stop();

private:
    void seedDefaults();
    void buildHardware();

    SproutConfig m_config;
    // The API server and the control loop each get their own connection.
    std::unique_ptr<SproutStore> m_apiStore;
    std::unique_ptr<SproutStore> m_loopStore;
    std::unique_ptr<ActuatorAccessor> m_actuator;
    std::unique_ptr<SensorSource> m_sensor;
    std::unique_ptr<Capturer> m_camera;
    std::unique_ptr<NotificationSink> m_notifier;
    std::unique_ptr<ControlLoop> m_loop;
    std::unique_ptr<SproutApiServer> m_apiServer;
};

} // namespace sprout
