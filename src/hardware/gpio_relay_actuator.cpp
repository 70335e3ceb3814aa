#include "hardware/gpio_relay_actuator.hpp"

#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <utility>

#include "common/logging.hpp"

namespace sprout {

namespace {

bool writeSysfs(const QString &path, const QByteArray &value)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    return file.write(value) == value.size();
}

void logGpioFailure(const QString &where, const QString &what, const nlohmann::json &context)
{
    SLOG_ERROR(QStringLiteral("GpioRelayActuator"),
               where,
               what,
               QStringLiteral("relay_control"),
               QStringLiteral("sysfs_gpio"),
               logging::defaultWho(),
               QString(),
               context);
}

} // namespace

GpioRelayActuator::GpioRelayActuator(GpioSettings settings)
    : m_settings(std::move(settings))
{
    for (const auto &pin : m_settings.pins) {
        m_gpioByDevice[pin.first] = pin.second + m_settings.pinOffset;
    }
}

GpioRelayActuator::~GpioRelayActuator()
{
    if (m_initialized) {
        release();
    }
}

bool GpioRelayActuator::initialize()
{
    const QString exportPath = QString::fromStdString(m_settings.sysfsRoot)
        + QStringLiteral("/export");
    if (!QFileInfo::exists(exportPath)) {
        logGpioFailure(QStringLiteral("initialize"),
                       QStringLiteral("gpio_sysfs_missing"),
                       nlohmann::json{{"path", exportPath.toStdString()}});
        return false;
    }

    for (const auto &pin : m_settings.pins) {
        const int gpio = m_gpioByDevice.at(pin.first);
        if (!exportPin(gpio)) {
            logGpioFailure(QStringLiteral("initialize"),
                           QStringLiteral("gpio_export_failed"),
                           nlohmann::json{{"device", pin.first}, {"gpio", gpio}});
            return false;
        }
        // "high"/"low" configure the pin as output with that initial level,
        // so the relay never glitches on.
        const QByteArray direction = m_settings.activeLow ? "high" : "low";
        if (!writeSysfs(pinPath(gpio, QStringLiteral("direction")), direction)) {
            logGpioFailure(QStringLiteral("initialize"),
                           QStringLiteral("gpio_direction_failed"),
                           nlohmann::json{{"device", pin.first}, {"gpio", gpio}});
            return false;
        }
        SLOG_INFO(QStringLiteral("GpioRelayActuator"),
                  QStringLiteral("initialize"),
                  QStringLiteral("relay_initialized"),
                  QStringLiteral("daemon_start"),
                  QStringLiteral("sysfs_gpio"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"device", pin.first},
                                 {"gpio", gpio},
                                 {"activeLow", m_settings.activeLow}});
    }

    m_initialized = true;
    return true;
}

std::vector<std::string> GpioRelayActuator::deviceNames() const
{
    std::vector<std::string> names;
    for (const auto &pin : m_settings.pins) {
        names.push_back(pin.first);
    }
    return names;
}

bool GpioRelayActuator::set(const std::string &device, bool on)
{
    auto it = m_gpioByDevice.find(device);
    if (it == m_gpioByDevice.end() || !m_initialized) {
        logGpioFailure(QStringLiteral("set"),
                       QStringLiteral("relay_unavailable"),
                       nlohmann::json{{"device", device}, {"initialized", m_initialized}});
        return false;
    }

    if (!writeLevel(it->second, on)) {
        logGpioFailure(QStringLiteral("set"),
                       QStringLiteral("relay_write_failed"),
                       nlohmann::json{{"device", device}, {"gpio", it->second}, {"on", on}});
        return false;
    }
    return true;
}

std::optional<bool> GpioRelayActuator::get(const std::string &device) const
{
    auto it = m_gpioByDevice.find(device);
    if (it == m_gpioByDevice.end() || !m_initialized) {
        return std::nullopt;
    }

    QFile file(pinPath(it->second, QStringLiteral("value")));
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }
    const QByteArray level = file.readAll().trimmed();
    if (level != "0" && level != "1") {
        return std::nullopt;
    }
    const bool high = level == "1";
    return m_settings.activeLow ? !high : high;
}

void GpioRelayActuator::release()
{
    if (!m_initialized) {
        return;
    }
    for (const auto &pin : m_settings.pins) {
        const int gpio = m_gpioByDevice.at(pin.first);
        if (!writeLevel(gpio, false)) {
            logGpioFailure(QStringLiteral("release"),
                           QStringLiteral("relay_write_failed"),
                           nlohmann::json{{"device", pin.first}, {"gpio", gpio}});
        }
    }
    for (int gpio : m_exported) {
        unexportPin(gpio);
    }
    m_exported.clear();
    m_initialized = false;

    SLOG_INFO(QStringLiteral("GpioRelayActuator"),
              QStringLiteral("release"),
              QStringLiteral("relays_released"),
              QStringLiteral("daemon_stop"),
              QStringLiteral("sysfs_gpio"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"devices", m_settings.pins.size()}});
}

QString GpioRelayActuator::pinPath(int gpio, const QString &leaf) const
{
    return QStringLiteral("%1/gpio%2/%3")
        .arg(QString::fromStdString(m_settings.sysfsRoot))
        .arg(gpio)
        .arg(leaf);
}

bool GpioRelayActuator::exportPin(int gpio)
{
    if (QFileInfo::exists(pinPath(gpio, QStringLiteral("value")))) {
        return true;
    }

    const QString exportPath = QString::fromStdString(m_settings.sysfsRoot)
        + QStringLiteral("/export");
    if (!writeSysfs(exportPath, QByteArray::number(gpio))) {
        return false;
    }
    m_exported.push_back(gpio);

    // udev needs a moment to fix permissions on the new node.
    for (int attempt = 0; attempt < 10; ++attempt) {
        QFile direction(pinPath(gpio, QStringLiteral("direction")));
        if (direction.open(QIODevice::WriteOnly)) {
            return true;
        }
        QThread::msleep(20);
    }
    return false;
}

void GpioRelayActuator::unexportPin(int gpio)
{
    const QString unexportPath = QString::fromStdString(m_settings.sysfsRoot)
        + QStringLiteral("/unexport");
    if (!writeSysfs(unexportPath, QByteArray::number(gpio))) {
        logGpioFailure(QStringLiteral("release"),
                       QStringLiteral("gpio_unexport_failed"),
                       nlohmann::json{{"gpio", gpio}});
    }
}

bool GpioRelayActuator::writeLevel(int gpio, bool on)
{
    const bool high = m_settings.activeLow ? !on : on;
    return writeSysfs(pinPath(gpio, QStringLiteral("value")), high ? "1" : "0");
}

} // namespace sprout
