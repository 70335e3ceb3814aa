#include "daemon/actuator_accessor.hpp"

#include <utility>

#include "common/logging.hpp"

namespace sprout {

ActuatorAccessor::ActuatorAccessor(std::unique_ptr<Actuator> actuator)
    : m_actuator(std::move(actuator))
{
}

bool ActuatorAccessor::initialize()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache.clear();
    m_available = m_actuator && m_actuator->initialize();
    if (!m_available) {
        return false;
    }
    for (const auto &device : m_actuator->deviceNames()) {
        m_cache[device] = false;
    }
    return true;
}

void ActuatorAccessor::replace(std::unique_ptr<Actuator> actuator)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_actuator = std::move(actuator);
    m_cache.clear();
    m_available = false;
}

bool ActuatorAccessor::set(const std::string &device, bool on)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return setLocked(device, on);
}

std::optional<bool> ActuatorAccessor::toggle(const std::string &device)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_cache.find(device);
    if (it == m_cache.end()) {
        return std::nullopt;
    }
    const bool next = !it->second;
    if (!setLocked(device, next)) {
        return std::nullopt;
    }
    return next;
}

void ActuatorAccessor::turnAllOff()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto &entry : m_cache) {
        if (!setLocked(entry.first, false)) {
            SLOG_WARN(QStringLiteral("ActuatorAccessor"),
                      QStringLiteral("turnAllOff"),
                      QStringLiteral("relay_off_failed"),
                      QStringLiteral("shutdown"),
                      QStringLiteral("actuator_set"),
                      logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"device", entry.first}});
        }
    }
}

void ActuatorAccessor::release()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_actuator || !m_available) {
        return;
    }
    m_actuator->release();
    for (auto &entry : m_cache) {
        entry.second = false;
    }
    m_available = false;
}

std::optional<bool> ActuatorAccessor::state(const std::string &device) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_cache.find(device);
    if (it == m_cache.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, bool> ActuatorAccessor::states() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cache;
}

std::vector<std::string> ActuatorAccessor::deviceNames() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_actuator) {
        return {};
    }
    return m_actuator->deviceNames();
}

bool ActuatorAccessor::hasDevice(const std::string &device) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cache.count(device) > 0;
}

bool ActuatorAccessor::isAvailable() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_available;
}

bool ActuatorAccessor::isSimulated() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_actuator && m_actuator->isSimulated();
}

bool ActuatorAccessor::setLocked(const std::string &device, bool on)
{
    if (!m_available || m_cache.count(device) == 0) {
        return false;
    }
    if (!m_actuator->set(device, on)) {
        return false;
    }
    m_cache[device] = on;
    return true;
}

} // namespace sprout
