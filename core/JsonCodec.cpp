#include "JsonCodec.hpp"
#include "IClock.hpp"

namespace datalogger {

std::string JsonCodec::serialize(const Reading& reading) {
    // Raw topics and key/value text are not guaranteed to be valid UTF-8
    return readingToJson(reading).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Reading JsonCodec::deserialize(const std::string& json) {
    return jsonToReading(nlohmann::json::parse(json));
}

nlohmann::json JsonCodec::readingToJson(const Reading& reading) {
    nlohmann::json j;

    j["topic"] = reading.topic;
    j["device_id"] = reading.deviceId;
    j["ts_ms"] = toEpochMillis(reading.timestamp);
    j["payload"] = reading.payload;

    return j;
}

Reading JsonCodec::jsonToReading(const nlohmann::json& json) {
    Reading reading;

    reading.topic = json.value("topic", "");
    reading.deviceId = json.value("device_id", "");
    reading.timestamp = fromEpochMillis(json.value("ts_ms", static_cast<std::int64_t>(0)));
    if (json.contains("payload")) {
        reading.payload = json["payload"];
    }

    return reading;
}

nlohmann::json JsonCodec::recordToJson(const QueuedRecord& record) {
    const auto& reading = record.reading;
    nlohmann::json j;

    j["seq"] = record.sequenceNumber;
    j["topic"] = reading.topic;
    j["device_id"] = reading.deviceId;
    j["ts"] = formatIso8601(reading.timestamp);
    j["ts_ms"] = toEpochMillis(reading.timestamp);
    j["payload"] = reading.payload;

    return j;
}

nlohmann::json JsonCodec::batchToJson(const Batch& batch, std::uint64_t batchId,
                                      std::chrono::system_clock::time_point sentAt) {
    nlohmann::json j;

    j["schema"] = kBatchSchema;
    j["batch_id"] = batchId;
    j["sent_at"] = formatIso8601(sentAt);
    j["count"] = batch.size();

    nlohmann::json readings = nlohmann::json::array();
    for (const auto& record : batch.records) {
        readings.push_back(recordToJson(record));
    }
    j["readings"] = std::move(readings);

    return j;
}

} // namespace datalogger
