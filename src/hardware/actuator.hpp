#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sprout {

// Relay driver for the named devices of the tent.
class Actuator {
public:
    virtual ~Actuator() = default;

    // Claims the hardware and drives every device off. Returns false when the
    // hardware is unusable.
    virtual bool initialize() = 0;
    virtual std::vector<std::string> deviceNames() const = 0;

    virtual bool set(const std::string &device, bool on) = 0;
    // nullopt when the device is unknown or its state cannot be read.
    virtual std::optional<bool> get(const std::string &device) const = 0;

    // Drives every device off and gives the hardware back.
    virtual void release() = 0;
    virtual bool isSimulated() const = 0;
};

} // namespace sprout
