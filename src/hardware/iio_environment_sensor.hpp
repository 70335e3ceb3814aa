#pragma once

#include <optional>

#include <QString>

#include "common/config.hpp"
#include "hardware/sensor_source.hpp"

namespace sprout {

// BME680 read through the Linux IIO sysfs interface.
class IioEnvironmentSensor : public SensorSource {
public:
    explicit IioEnvironmentSensor(SensorSettings settings);

    bool initialize() override;
    std::optional<EnvironmentReading> read() override;
    bool isSimulated() const override { return false; }

    QString devicePath() const { return m_devicePath; }

private:
    SensorSettings m_settings;
    QString m_devicePath;

    QString locateDevice() const;
    std::optional<double> readChannel(const QString &channel) const;
};

} // namespace sprout
