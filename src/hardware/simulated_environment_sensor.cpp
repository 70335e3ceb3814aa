#include "hardware/simulated_environment_sensor.hpp"

#include <algorithm>
#include <cmath>

#include "common/logging.hpp"

namespace sprout {

namespace {

double roundTo2(double value)
{
    return std::round(value * 100.0) / 100.0;
}

} // namespace

SimulatedEnvironmentSensor::SimulatedEnvironmentSensor(std::optional<unsigned int> seed)
    : m_rng(seed ? *seed : std::random_device{}())
{
}

bool SimulatedEnvironmentSensor::initialize()
{
    SLOG_WARN(QStringLiteral("SimulatedEnvironmentSensor"),
              QStringLiteral("initialize"),
              QStringLiteral("sensor_simulation_mode"),
              QStringLiteral("daemon_start"),
              QStringLiteral("random_walk"),
              logging::defaultWho(),
              QString(),
              nlohmann::json::object());
    return true;
}

std::optional<EnvironmentReading> SimulatedEnvironmentSensor::read()
{
    EnvironmentReading reading;
    if (m_last) {
        reading.temperature = m_last->temperature + uniform(-0.5, 0.5);
        reading.humidity = m_last->humidity + uniform(-2.0, 2.0);
        reading.pressure = m_last->pressure + uniform(-0.5, 0.5);
        reading.gasResistance = m_last->gasResistance + uniform(-1000.0, 1000.0);
    } else {
        reading.temperature = uniform(20.0, 26.0);
        reading.humidity = uniform(50.0, 70.0);
        reading.pressure = uniform(1000.0, 1020.0);
        reading.gasResistance = uniform(50000.0, 100000.0);
    }

    reading.temperature = roundTo2(std::clamp(reading.temperature, 15.0, 35.0));
    reading.humidity = roundTo2(std::clamp(reading.humidity, 30.0, 90.0));
    reading.pressure = roundTo2(std::clamp(reading.pressure, 990.0, 1030.0));
    reading.gasResistance = roundTo2(std::clamp(reading.gasResistance, 10000.0, 200000.0));
    reading.capturedAt = std::chrono::system_clock::now();

    m_last = reading;
    return reading;
}

double SimulatedEnvironmentSensor::uniform(double low, double high)
{
    std::uniform_real_distribution<double> dist(low, high);
    return dist(m_rng);
}

} // namespace sprout
