#include "hardware/simulated_actuator.hpp"

#include <utility>

#include "common/logging.hpp"

namespace sprout {

SimulatedActuator::SimulatedActuator(std::vector<std::string> devices)
    : m_devices(std::move(devices))
{
}

bool SimulatedActuator::initialize()
{
    for (const auto &device : m_devices) {
        m_states[device] = false;
    }
    SLOG_WARN(QStringLiteral("SimulatedActuator"),
              QStringLiteral("initialize"),
              QStringLiteral("relay_simulation_mode"),
              QStringLiteral("daemon_start"),
              QStringLiteral("in_memory"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"devices", m_devices}});
    return true;
}

bool SimulatedActuator::set(const std::string &device, bool on)
{
    auto it = m_states.find(device);
    if (it == m_states.end()) {
        return false;
    }
    it->second = on;
    SLOG_INFO(QStringLiteral("SimulatedActuator"),
              QStringLiteral("set"),
              on ? QStringLiteral("relay_on") : QStringLiteral("relay_off"),
              QStringLiteral("relay_control"),
              QStringLiteral("in_memory"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"device", device}});
    return true;
}

std::optional<bool> SimulatedActuator::get(const std::string &device) const
{
    auto it = m_states.find(device);
    if (it == m_states.end()) {
        return std::nullopt;
    }
    return it->second;
}

void SimulatedActuator::release()
{
    for (auto &state : m_states) {
        state.second = false;
    }
}

} // namespace sprout
