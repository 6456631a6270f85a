#pragma once

#include <cstdint>
#include <string>

namespace datalogger {

/**
 * HMAC-SHA256 signature for collector requests.
 *
 * Header value: "t=<epoch seconds>,sig=<base64 HMAC-SHA256(key, t + "." + body)>"
 * The collector recomputes the HMAC over the same string and may reject
 * stale timestamps.
 */
class RequestSigner {
public:
    /// Header carrying the signature
    static constexpr const char* kHeaderName = "X-Datalogger-Signature";

    /**
     * @param keyBase64 Shared secret, base64 encoded
     * @throws std::invalid_argument if the key does not decode to at least one byte
     */
    explicit RequestSigner(const std::string& keyBase64);

    std::string sign(const std::string& body, uint64_t epochSeconds) const;

    static std::string createStringToSign(const std::string& body, uint64_t epochSeconds);
    static std::string hmacSha256(const std::string& key, const std::string& message);
    static std::string base64Encode(const std::string& data);
    static std::string base64Decode(const std::string& encoded);

private:
    std::string key_;
};

} // namespace datalogger
