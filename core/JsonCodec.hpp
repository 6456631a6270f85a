#pragma once

#include "Reading.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <string>

namespace datalogger {

/// Schema name carried by every collector request
inline constexpr const char* kBatchSchema = "datalogger.batch.v1";

class JsonCodec {
public:
    // Storage form kept in the durable queue
    static std::string serialize(const Reading& reading);
    static Reading deserialize(const std::string& json);

    static nlohmann::json readingToJson(const Reading& reading);
    static Reading jsonToReading(const nlohmann::json& json);

    // Collector wire form (datalogger.batch.v1)
    static nlohmann::json recordToJson(const QueuedRecord& record);
    static nlohmann::json batchToJson(const Batch& batch, std::uint64_t batchId,
                                      std::chrono::system_clock::time_point sentAt);
};

} // namespace datalogger
