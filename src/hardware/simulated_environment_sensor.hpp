#pragma once

#include <optional>
#include <random>

#include "hardware/sensor_source.hpp"

namespace sprout {

// Random-walk environment readings kept within plausible indoor ranges.
// A fixed seed makes the sequence reproducible.
class SimulatedEnvironmentSensor : public SensorSource {
public:
    explicit SimulatedEnvironmentSensor(std::optional<unsigned int> seed = std::nullopt);

    bool initialize() override;
    std::optional<EnvironmentReading> read() override;
    bool isSimulated() const override { return true; }

private:
    std::mt19937 m_rng;
    std::optional<EnvironmentReading> m_last;

    double uniform(double low, double high);
};

} // namespace sprout
