#pragma once

#include <map>
#include <string>
#include <vector>

#include <QString>

#include "common/config.hpp"
#include "hardware/actuator.hpp"

namespace sprout {

// Relay board driven through the sysfs GPIO interface.
class GpioRelayActuator : public Actuator {
public:
    explicit GpioRelayActuator(GpioSettings settings);
    ~GpioRelayActuator() override;

    bool initialize() override;
    std::vector<std::string> deviceNames() const override;
    bool set(const std::string &device, bool on) override;
    std::optional<bool> get(const std::string &device) const override;
    void release() override;
    bool isSimulated() const override { return false; }

private:
    GpioSettings m_settings;
    std::map<std::string, int> m_gpioByDevice;
    std::vector<int> m_exported;
    bool m_initialized = false;

    QString pinPath(int gpio, const QString &leaf) const;
    bool exportPin(int gpio);
    void unexportPin(int gpio);
    bool writeLevel(int gpio, bool on);
};

} // namespace sprout
