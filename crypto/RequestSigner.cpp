/**
 * @file RequestSigner.cpp
 * @brief HMAC-SHA256 request signing for the HTTP collector
 *
 * Uses OpenSSL for the HMAC digest and for Base64 encoding/decoding through
 * the BIO interface.
 */

#include "RequestSigner.hpp"
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <stdexcept>

namespace datalogger {

RequestSigner::RequestSigner(const std::string& keyBase64) : key_(base64Decode(keyBase64)) {
    if (key_.empty()) {
        throw std::invalid_argument("signing key is not valid base64");
    }
}

/**
 * @brief Build the signature header value for one request body
 * @param body Exact bytes sent as the request body
 * @param epochSeconds Signing time, also sent in clear as t=
 * @return "t=<epoch>,sig=<base64>"
 */
std::string RequestSigner::sign(const std::string& body, uint64_t epochSeconds) const {
    std::string signature = hmacSha256(key_, createStringToSign(body, epochSeconds));
    return "t=" + std::to_string(epochSeconds) + ",sig=" + base64Encode(signature);
}

std::string RequestSigner::createStringToSign(const std::string& body, uint64_t epochSeconds) {
    return std::to_string(epochSeconds) + "." + body;
}

/**
 * @brief Compute HMAC-SHA256 using OpenSSL
 * @return Raw binary digest (32 bytes)
 *
 * @note Writes into a local buffer so concurrent forward workers can sign
 */
std::string RequestSigner::hmacSha256(const std::string& key, const std::string& message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;

    unsigned char* result = HMAC(EVP_sha256(),
                                 key.data(), static_cast<int>(key.size()),
                                 reinterpret_cast<const unsigned char*>(message.data()),
                                 message.size(),
                                 digest, &digestLength);
    if (!result) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }

    return std::string(reinterpret_cast<char*>(digest), digestLength);
}

/**
 * @brief Encode binary data to Base64 without newlines
 */
std::string RequestSigner::base64Encode(const std::string& data) {
    BIO* bio = BIO_new(BIO_s_mem());
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);

    BIO_write(bio, data.data(), static_cast<int>(data.size()));
    (void)BIO_flush(bio);

    BUF_MEM* bufferPtr = nullptr;
    BIO_get_mem_ptr(bio, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(bio);

    return result;
}

/**
 * @brief Decode a Base64 string
 * @return Decoded bytes, empty on malformed input
 */
std::string RequestSigner::base64Decode(const std::string& encoded) {
    if (encoded.empty()) {
        return "";
    }

    BIO* bio = BIO_new_mem_buf(encoded.data(), static_cast<int>(encoded.size()));
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);

    std::string result(encoded.size(), '\0');
    int decodedLength = BIO_read(bio, &result[0], static_cast<int>(result.size()));

    BIO_free_all(bio);

    if (decodedLength > 0) {
        result.resize(static_cast<std::size_t>(decodedLength));
    } else {
        result.clear();
    }

    return result;
}

} // namespace datalogger
