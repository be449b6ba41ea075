#include "EnvironmentSensor.hpp"
#include <stdexcept>

namespace devsim {

EnvironmentSensor::EnvironmentSensor(std::shared_ptr<IRng> rng) : rng_(std::move(rng)) {
    if (!rng_) {
        throw std::invalid_argument("EnvironmentSensor requires a random source");
    }
}

double EnvironmentSensor::readTemperature() {
    return MIN_TEMPERATURE + rng_->uniform() * TEMPERATURE_SPAN;
}

double EnvironmentSensor::readHumidity() {
    return MIN_HUMIDITY + rng_->uniform() * HUMIDITY_SPAN;
}

double EnvironmentSensor::readPressure() {
    return MIN_PRESSURE + rng_->uniform() * PRESSURE_SPAN;
}

GeoLocation EnvironmentSensor::readLocation() {
    GeoLocation location;
    location.latitude = MIN_LATITUDE + rng_->uniform() * LOCATION_SPAN;
    location.longitude = MIN_LONGITUDE + rng_->uniform() * LOCATION_SPAN;
    return location;
}

TelemetryRecord EnvironmentSensor::read() {
    TelemetryRecord record;
    record.temperature = readTemperature();
    record.humidity = readHumidity();
    record.pressure = readPressure();
    record.location = readLocation();
    return record;
}

} // namespace devsim
