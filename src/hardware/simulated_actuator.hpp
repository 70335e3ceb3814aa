#pragma once

#include <map>
#include <string>
#include <vector>

#include "hardware/actuator.hpp"

namespace sprout {

// In-memory relay board used when no GPIO hardware is available.
class SimulatedActuator : public Actuator {
public:
    explicit SimulatedActuator(std::vector<std::string> devices);

    bool initialize() override;
    std::vector<std::string> deviceNames() const override { return m_devices; }
    bool set(const std::string &device, bool on) override;
    std::optional<bool> get(const std::string &device) const override;
    void release() override;
    bool isSimulated() const override { return true; }

private:
    std::vector<std::string> m_devices;
    std::map<std::string, bool> m_states;
};

} // namespace sprout
