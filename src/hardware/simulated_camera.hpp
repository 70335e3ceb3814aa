#pragma once

#include "hardware/capturer.hpp"

namespace sprout {

// Writes a small placeholder file in place of a photo.
class SimulatedCamera : public Capturer {
public:
    bool initialize() override;
    std::optional<std::string> capture(const std::string &path) override;
    void release() override {}
    bool isSimulated() const override { return true; }
};

} // namespace sprout
