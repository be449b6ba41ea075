#include "JsonCodec.hpp"

namespace devsim {

std::string JsonCodec::serialize(const TelemetryRecord& record) {
    return recordToJson(record).dump();
}

TelemetryRecord JsonCodec::deserialize(const std::string& json) {
    return jsonToRecord(nlohmann::json::parse(json));
}

nlohmann::ordered_json JsonCodec::recordToJson(const TelemetryRecord& record) {
    nlohmann::ordered_json j;

    j["temperature"] = record.temperature;
    j["humidity"] = record.humidity;
    j["pressure"] = record.pressure;
    j["latitude"] = record.location.latitude;
    j["longitude"] = record.location.longitude;

    return j;
}

TelemetryRecord JsonCodec::jsonToRecord(const nlohmann::json& json) {
    TelemetryRecord record;

    record.temperature = json.at("temperature").get<double>();
    record.humidity = json.at("humidity").get<double>();
    record.pressure = json.at("pressure").get<double>();
    record.location.latitude = json.at("latitude").get<double>();
    record.location.longitude = json.at("longitude").get<double>();

    return record;
}

OutboundMessage JsonCodec::makeMessage(const TelemetryRecord& record, SensorType type) {
    OutboundMessage message;
    message.payload = serialize(record);
    message.sensorType = type;
    return message;
}

} // namespace devsim
