#pragma once

#include "EnvironmentSensor.hpp"
#include "Message.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace devsim {

/**
 * @brief Telemetry body encoding
 *
 * The body is a flat object with exactly the keys temperature, humidity,
 * pressure, latitude and longitude, in that order. The classification tag
 * travels as message metadata and never appears in the body.
 */
class JsonCodec {
public:
    static std::string serialize(const TelemetryRecord& record);

    /// @throws nlohmann::json::exception on malformed input or missing keys
    static TelemetryRecord deserialize(const std::string& json);

    static nlohmann::ordered_json recordToJson(const TelemetryRecord& record);
    static TelemetryRecord jsonToRecord(const nlohmann::json& json);

    static OutboundMessage makeMessage(const TelemetryRecord& record, SensorType type);
};

} // namespace devsim
