#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "hardware/actuator.hpp"

namespace sprout {

// ActuatorAccessor is the only path to the relay driver. The control loop and
// API handlers share it; reads are served from the last-known-state cache so
// request handlers never touch the hardware concurrently with a tick.
class ActuatorAccessor {
public:
    explicit ActuatorAccessor(std::unique_ptr<Actuator> actuator);

    // Initializes the driver and fills the cache with all devices off.
    bool initialize();
    // Swaps in another driver (the simulated one after a failed start).
    void replace(std::unique_ptr<Actuator> actuator);

    bool set(const std::string &device, bool on);
    // Returns the new state, or nullopt when the device could not be driven.
    std::optional<bool> toggle(const std::string &device);
    void turnAllOff();
    void release();

    std::optional<bool> state(const std::string &device) const;
    std::map<std::string, bool> states() const;
    std::vector<std::string> deviceNames() const;
    bool hasDevice(const std::string &device) const;

    bool isAvailable() const;
    bool isSimulated() const;

private:
    mutable std::mutex m_mutex;
    std::unique_ptr<Actuator> m_actuator;
    std::map<std::string, bool> m_cache;
    bool m_available = false;

    bool setLocked(const std::string &device, bool on);
};

} // namespace sprout
