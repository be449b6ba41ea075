#pragma once

#include "IRng.hpp"
#include <memory>

namespace devsim {

struct GeoLocation {
    double latitude = 0.0;
    double longitude = 0.0;
};

struct TelemetryRecord {
    double temperature = 0.0;
    double humidity = 0.0;
    double pressure = 0.0;
    GeoLocation location;
};

/**
 * @brief Simulated environmental sensor
 *
 * Every read is an independent uniform draw over a fixed band; there is no
 * drift or correlation between consecutive readings. Not thread-safe: each
 * publish loop owns its own sensor.
 */
class EnvironmentSensor {
public:
    explicit EnvironmentSensor(std::shared_ptr<IRng> rng);

    double readTemperature();
    double readHumidity();
    double readPressure();
    GeoLocation readLocation();

    /// All five quantities, drawn in declaration order
    TelemetryRecord read();

    static constexpr double MIN_TEMPERATURE = 20.0;
    static constexpr double TEMPERATURE_SPAN = 15.0;
    static constexpr double MIN_HUMIDITY = 60.0;
    static constexpr double HUMIDITY_SPAN = 20.0;
    static constexpr double MIN_PRESSURE = 1013.25;
    static constexpr double PRESSURE_SPAN = 12.0;
    static constexpr double MIN_LATITUDE = 39.810492;
    static constexpr double MIN_LONGITUDE = -98.556061;
    static constexpr double LOCATION_SPAN = 0.5;

private:
    std::shared_ptr<IRng> rng_;
};

} // namespace devsim
