/**
 * @file Decoder.hpp
 * @brief Raw MQTT publish to Reading conversion
 *
 * Accepted payloads (schema datalogger.reading.v1):
 * - JSON object with optional "v" (must be 1), "device_id"/"deviceId", "ts"
 *   and the measurement under "values" or "value". Without either key the
 *   object minus its metadata keys is the measurement.
 * - Any other JSON value, taken as the measurement verbatim.
 * - Key/value text "TEMP:23.5,PM25:10,DATE:2025-02-13,20:45:28" as published
 *   by the field gateways. DATE sets the timestamp (wall time read as UTC).
 *
 * "ts" may be epoch seconds, milliseconds or microseconds (told apart by
 * magnitude) or an ISO-8601 UTC string. Without a timestamp the receive
 * instant is used. Without a device id the topic level at deviceIdLevel is.
 *
 * @note Stateless: decode() is a pure function of its arguments
 */

#pragma once

#include "Reading.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace datalogger {

struct DecoderConfig {
    std::vector<std::string> topicFilters{"sensors/#"};
    int deviceIdLevel = 1;
};

enum class DecodeErrorKind {
    UnrecognizedTopic,
    EmptyPayload,
    MalformedPayload,
    UnsupportedSchema
};

struct DecodeError {
    DecodeErrorKind kind = DecodeErrorKind::MalformedPayload;
    std::string message;
};

struct DecodeResult {
    bool success = false;
    Reading reading;
    DecodeError error;

    static DecodeResult ok(Reading reading);
    static DecodeResult fail(DecodeErrorKind kind, const std::string& message);
};

class Decoder {
public:
    explicit Decoder(DecoderConfig config);

    /**
     * @brief Decode one publish
     * @param topic Topic the message arrived on
     * @param payload Raw payload bytes
     * @param receivedAt Receive instant, used when the payload has no timestamp
     * @return Reading with ackToken unset, or the reason it was dropped
     */
    DecodeResult decode(const std::string& topic, const std::string& payload,
                        std::chrono::system_clock::time_point receivedAt) const;

    /// MQTT filter matching with + and # wildcards
    static bool topicMatches(const std::string& filter, const std::string& topic);

    const DecoderConfig& config() const { return config_; }

private:
    DecoderConfig config_;

    bool acceptsTopic(const std::string& topic) const;
    std::string deviceIdFromTopic(const std::string& topic) const;
};

std::string decodeErrorKindToString(DecodeErrorKind kind);

} // namespace datalogger
