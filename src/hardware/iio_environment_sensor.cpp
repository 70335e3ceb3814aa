#include "hardware/iio_environment_sensor.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <utility>

#include "common/logging.hpp"

namespace sprout {

namespace {

const QString kIioDevicesDir = QStringLiteral("/sys/bus/iio/devices");

// IIO units: millidegrees Celsius, milli-percent RH, kilopascal, ohm.
constexpr double kMilli = 1000.0;
constexpr double kKilopascalToHectopascal = 10.0;

} // namespace

IioEnvironmentSensor::IioEnvironmentSensor(SensorSettings settings)
    : m_settings(std::move(settings))
{
}

bool IioEnvironmentSensor::initialize()
{
    m_devicePath = locateDevice();
    if (m_devicePath.isEmpty()) {
        SLOG_ERROR(QStringLiteral("IioEnvironmentSensor"),
                   QStringLiteral("initialize"),
                   QStringLiteral("sensor_not_found"),
                   QStringLiteral("daemon_start"),
                   QStringLiteral("iio_sysfs_scan"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"iioName", m_settings.iioName},
                                  {"configuredPath", m_settings.iioDevicePath}});
        return false;
    }

    SLOG_INFO(QStringLiteral("IioEnvironmentSensor"),
              QStringLiteral("initialize"),
              QStringLiteral("sensor_initialized"),
              QStringLiteral("daemon_start"),
              QStringLiteral("iio_sysfs"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"path", m_devicePath.toStdString()}});
    return true;
}

std::optional<EnvironmentReading> IioEnvironmentSensor::read()
{
    if (m_devicePath.isEmpty()) {
        return std::nullopt;
    }

    const auto temperature = readChannel(QStringLiteral("in_temp_input"));
    const auto humidity = readChannel(QStringLiteral("in_humidityrelative_input"));
    if (!temperature || !humidity) {
        SLOG_WARN(QStringLiteral("IioEnvironmentSensor"),
                  QStringLiteral("read"),
                  QStringLiteral("sensor_read_failed"),
                  QStringLiteral("control_tick"),
                  QStringLiteral("iio_sysfs"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"path", m_devicePath.toStdString()},
                                 {"temperature", temperature.has_value()},
                                 {"humidity", humidity.has_value()}});
        return std::nullopt;
    }

    EnvironmentReading reading;
    reading.temperature = *temperature / kMilli;
    reading.humidity = *humidity / kMilli;
    reading.pressure = readChannel(QStringLiteral("in_pressure_input")).value_or(0.0)
        * kKilopascalToHectopascal;
    reading.gasResistance = readChannel(QStringLiteral("in_resistance_input")).value_or(0.0);
    reading.capturedAt = std::chrono::system_clock::now();
    return reading;
}

QString IioEnvironmentSensor::locateDevice() const
{
    if (!m_settings.iioDevicePath.empty()) {
        const QString configured = QString::fromStdString(m_settings.iioDevicePath);
        return QFileInfo(configured).isDir() ? configured : QString();
    }

    const QDir devices(kIioDevicesDir);
    const QStringList entries = devices.entryList({QStringLiteral("iio:device*")},
                                                  QDir::Dirs | QDir::NoDotAndDotDot,
                                                  QDir::Name);
    for (const QString &entry : entries) {
        QFile nameFile(devices.absoluteFilePath(entry + QStringLiteral("/name")));
        if (!nameFile.open(QIODevice::ReadOnly)) {
            continue;
        }
        const QString name = QString::fromUtf8(nameFile.readAll()).trimmed();
        if (name == QString::fromStdString(m_settings.iioName)) {
            return devices.absoluteFilePath(entry);
        }
    }
    return QString();
}

std::optional<double> IioEnvironmentSensor::readChannel(const QString &channel) const
{
    QFile file(m_devicePath + QLatin1Char('/') + channel);
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }
    bool ok = false;
    const double value = QString::fromUtf8(file.readAll()).trimmed().toDouble(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return value;
}

} // namespace sprout
