#include "Decoder.hpp"
#include "IClock.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include <optional>

namespace datalogger {

namespace {

const char* const kReadingSchema = "datalogger.reading.v1";

std::vector<std::string> splitLevels(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        auto pos = text.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

// Largest epoch offset a system_clock::time_point can hold, in milliseconds
const double kMaxEpochMillis = static_cast<double>(
    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::duration::max()).count());

// Seconds, milliseconds or microseconds since the epoch, by magnitude.
// nullopt when the instant is out of the clock's range.
std::optional<std::chrono::system_clock::time_point> fromEpochNumber(double value) {
    double millis = value * 1000.0;
    if (value > 1e13) {
        millis = value / 1000.0;
    } else if (value > 1e10) {
        millis = value;
    }
    if (!std::isfinite(millis) || millis < 0 || millis >= kMaxEpochMillis) {
        return std::nullopt;
    }
    return fromEpochMillis(static_cast<std::int64_t>(millis));
}

// Key/value text keys are plain identifiers, TEMP or PM25
bool isKeyValueKey(const std::string& key) {
    if (key.empty()) return false;
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

// Text that starts like JSON and failed to parse is broken JSON, not key/value text
bool looksLikeJson(const std::string& trimmed) {
    return !trimmed.empty() && (trimmed[0] == '{' || trimmed[0] == '[' || trimmed[0] == '"');
}

bool parseNumber(const std::string& text, double& out) {
    if (text.empty()) return false;
    errno = 0;
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return errno == 0 && end == text.c_str() + text.size();
}

bool parseInteger(const std::string& text, long long& out) {
    if (text.empty()) return false;
    errno = 0;
    char* end = nullptr;
    out = std::strtoll(text.c_str(), &end, 10);
    return errno == 0 && end == text.c_str() + text.size();
}

bool isClockTime(const std::string& text) {
    int h = 0, m = 0, s = 0, consumed = 0;
    return std::sscanf(text.c_str(), "%2d:%2d:%2d%n", &h, &m, &s, &consumed) == 3 &&
           static_cast<std::size_t>(consumed) == text.size();
}

bool isMetadataKey(const std::string& key) {
    return key == "v" || key == "schema" || key == "device_id" || key == "deviceId" || key == "ts";
}

} // namespace

DecodeResult DecodeResult::ok(Reading reading) {
    DecodeResult result;
    result.success = true;
    result.reading = std::move(reading);
    return result;
}

DecodeResult DecodeResult::fail(DecodeErrorKind kind, const std::string& message) {
    DecodeResult result;
    result.success = false;
    result.error.kind = kind;
    result.error.message = message;
    return result;
}

Decoder::Decoder(DecoderConfig config) : config_(std::move(config)) {
}

DecodeResult Decoder::decode(const std::string& topic, const std::string& payload,
                             std::chrono::system_clock::time_point receivedAt) const {
    if (!acceptsTopic(topic)) {
        return DecodeResult::fail(DecodeErrorKind::UnrecognizedTopic,
                                  "topic matches no subscription filter: " + topic);
    }
    if (trim(payload).empty()) {
        return DecodeResult::fail(DecodeErrorKind::EmptyPayload, "empty payload");
    }

    Reading reading;
    reading.topic = topic;
    reading.timestamp = receivedAt;

    auto json = nlohmann::json::parse(payload, nullptr, false);

    if (!json.is_discarded()) {
        if (json.is_null()) {
            return DecodeResult::fail(DecodeErrorKind::MalformedPayload, "null payload");
        }

        if (json.is_object()) {
            if (json.contains("v")) {
                const auto& v = json["v"];
                if (!v.is_number_integer() || v.get<long long>() != 1) {
                    return DecodeResult::fail(DecodeErrorKind::UnsupportedSchema,
                                              "unsupported payload version " + v.dump());
                }
            }
            if (json.contains("schema")) {
                const auto& schema = json["schema"];
                if (!schema.is_string() || schema.get<std::string>() != kReadingSchema) {
                    return DecodeResult::fail(DecodeErrorKind::UnsupportedSchema,
                                              "unsupported payload schema " + schema.dump());
                }
            }

            for (const char* key : {"device_id", "deviceId"}) {
                if (!json.contains(key)) continue;
                const auto& id = json[key];
                if (!id.is_string()) {
                    return DecodeResult::fail(DecodeErrorKind::MalformedPayload,
                                              std::string(key) + " must be a string");
                }
                reading.deviceId = id.get<std::string>();
                break;
            }

            if (json.contains("ts")) {
                const auto& ts = json["ts"];
                if (ts.is_number()) {
                    double value = ts.get<double>();
                    if (value < 0) {
                        return DecodeResult::fail(DecodeErrorKind::MalformedPayload, "negative ts");
                    }
                    auto parsed = fromEpochNumber(value);
                    if (!parsed) {
                        return DecodeResult::fail(DecodeErrorKind::MalformedPayload,
                                                  "ts out of range: " + ts.dump());
                    }
                    reading.timestamp = *parsed;
                } else if (ts.is_string()) {
                    auto parsed = parseIso8601(ts.get<std::string>());
                    if (!parsed) {
                        return DecodeResult::fail(DecodeErrorKind::MalformedPayload,
                                                  "unparseable ts " + ts.dump());
                    }
                    reading.timestamp = *parsed;
                } else {
                    return DecodeResult::fail(DecodeErrorKind::MalformedPayload,
                                              "ts must be a number or ISO-8601 string");
                }
            }

            if (json.contains("values")) {
                reading.payload = json["values"];
            } else if (json.contains("value")) {
                reading.payload = json["value"];
            } else {
                nlohmann::json measurement = nlohmann::json::object();
                for (const auto& [key, value] : json.items()) {
                    if (!isMetadataKey(key)) {
                        measurement[key] = value;
                    }
                }
                if (measurement.empty()) {
                    return DecodeResult::fail(DecodeErrorKind::MalformedPayload, "no measurement in payload");
                }
                reading.payload = std::move(measurement);
            }
        } else {
            reading.payload = std::move(json);
        }
    } else if (looksLikeJson(trim(payload))) {
        return DecodeResult::fail(DecodeErrorKind::MalformedPayload, "invalid JSON payload");
    } else {
        // Key/value text: TEMP:23.5,PM25:10,DATE:2025-02-13,20:45:28
        auto tokens = splitLevels(payload, ',');
        nlohmann::json measurement = nlohmann::json::object();

        for (std::size_t i = 0; i < tokens.size(); ++i) {
            std::string token = trim(tokens[i]);
            if (token.empty()) continue;

            auto colon = token.find(':');
            if (colon == std::string::npos || colon == 0) {
                return DecodeResult::fail(DecodeErrorKind::MalformedPayload,
                                          "not a KEY:VALUE pair: " + token);
            }
            std::string key = trim(token.substr(0, colon));
            std::string value = trim(token.substr(colon + 1));
            if (!isKeyValueKey(key)) {
                return DecodeResult::fail(DecodeErrorKind::MalformedPayload, "invalid key in pair: " + token);
            }

            if (key == "DATE") {
                std::string stamp = value;
                if (i + 1 < tokens.size() && isClockTime(trim(tokens[i + 1]))) {
                    stamp += " " + trim(tokens[++i]);
                } else {
                    stamp += " 00:00:00";
                }
                auto parsed = parseIso8601(stamp);
                if (!parsed) {
                    return DecodeResult::fail(DecodeErrorKind::MalformedPayload, "unparseable DATE " + stamp);
                }
                reading.timestamp = *parsed;
                continue;
            }

            long long integer = 0;
            double number = 0.0;
            if (parseInteger(value, integer)) {
                measurement[key] = integer;
            } else if (parseNumber(value, number)) {
                measurement[key] = number;
            } else {
                measurement[key] = value;
            }
        }

        if (measurement.empty()) {
            return DecodeResult::fail(DecodeErrorKind::MalformedPayload, "no measurement in payload");
        }
        reading.payload = std::move(measurement);
    }

    if (reading.deviceId.empty()) {
        reading.deviceId = deviceIdFromTopic(topic);
    }
    if (reading.deviceId.empty()) {
        return DecodeResult::fail(DecodeErrorKind::MalformedPayload, "no device id in payload or topic");
    }

    return DecodeResult::ok(std::move(reading));
}

bool Decoder::topicMatches(const std::string& filter, const std::string& topic) {
    if (filter.empty() || topic.empty()) {
        return false;
    }
    // Wildcards in the first level never match $SYS-style topics
    if (topic[0] == '$' && (filter[0] == '+' || filter[0] == '#')) {
        return false;
    }

    auto filterLevels = splitLevels(filter, '/');
    auto topicLevels = splitLevels(topic, '/');

    std::size_t i = 0;
    for (; i < filterLevels.size(); ++i) {
        if (filterLevels[i] == "#") {
            return i == filterLevels.size() - 1;
        }
        if (i >= topicLevels.size()) {
            return false;
        }
        if (filterLevels[i] != "+" && filterLevels[i] != topicLevels[i]) {
            return false;
        }
    }
    return i == topicLevels.size();
}

bool Decoder::acceptsTopic(const std::string& topic) const {
    for (const auto& filter : config_.topicFilters) {
        if (topicMatches(filter, topic)) {
            return true;
        }
    }
    return false;
}

std::string Decoder::deviceIdFromTopic(const std::string& topic) const {
    if (config_.deviceIdLevel < 0) {
        return "";
    }
    auto levels = splitLevels(topic, '/');
    auto index = static_cast<std::size_t>(config_.deviceIdLevel);
    return index < levels.size() ? levels[index] : "";
}

std::string decodeErrorKindToString(DecodeErrorKind kind) {
    switch (kind) {
        case DecodeErrorKind::UnrecognizedTopic: return "unrecognized_topic";
        case DecodeErrorKind::EmptyPayload: return "empty_payload";
        case DecodeErrorKind::MalformedPayload: return "malformed_payload";
        case DecodeErrorKind::UnsupportedSchema: return "unsupported_schema";
        default: return "unknown";
    }
}

} // namespace datalogger
