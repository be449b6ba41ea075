#include "Message.hpp"
#include <stdexcept>

namespace devsim {

std::string sensorTypeToString(SensorType type) {
    switch (type) {
        case SensorType::Telemetry: return "Stelemetry";
        case SensorType::Log: return "Slog";
        default: return "unknown";
    }
}

SensorType stringToSensorType(const std::string& str) {
    if (str == "Stelemetry") return SensorType::Telemetry;
    if (str == "Slog") return SensorType::Log;
    throw std::invalid_argument("Unknown sensor type: " + str);
}

} // namespace devsim
