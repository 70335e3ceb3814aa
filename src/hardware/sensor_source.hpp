#pragma once

#include <optional>

#include "common/models.hpp"

namespace sprout {

class SensorSource {
public:
    virtual ~SensorSource() = default;

    virtual bool initialize() = 0;
    // nullopt on any read failure.
    virtual std::optional<EnvironmentReading> read() = 0;
    virtual bool isSimulated() const = 0;
};

} // namespace sprout
