#pragma once

#include <string>

namespace devsim {

/// Classification carried as the SensorType application property
enum class SensorType {
    Telemetry,
    Log
};

struct OutboundMessage {
    std::string payload;
    SensorType sensorType = SensorType::Telemetry;
};

/// Wire tag: "Stelemetry" or "Slog"
std::string sensorTypeToString(SensorType type);

/// @throws std::invalid_argument for unknown tags
SensorType stringToSensorType(const std::string& str);

} // namespace devsim
