#pragma once

#include "../DataloggerConfig.hpp"
#include "../IClock.hpp"
#include "../Reading.hpp"
#include "../ports/IHttpClient.hpp"
#include "../../crypto/RequestSigner.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace datalogger::domain {

struct DeliveryReport {
    std::uint64_t batchId = 0;
    std::vector<std::uint64_t> sequenceNumbers;
    int httpStatus = 0;
    std::chrono::milliseconds latency{0};
};

enum class ForwardErrorKind {
    Transient,   ///< 5xx, 1xx/3xx, timeout, connection failure: retry with backoff
    Permanent    ///< 4xx: the collector will never accept this batch
};

struct ForwardError {
    ForwardErrorKind kind = ForwardErrorKind::Transient;
    std::uint64_t batchId = 0;
    int httpStatus = 0;        ///< 0 when no response was received
    bool timedOut = false;
    std::string message;
};

struct ForwardResult {
    bool success = false;
    DeliveryReport report;
    ForwardError error;
};

/**
 * Posts one batch to the collector per send() call. Retries and attempt
 * counting belong to the caller.
 *
 * Body: datalogger.batch.v1 (see JsonCodec::batchToJson).
 * Headers: Content-Type, X-Datalogger-Schema, X-Datalogger-Batch, optional
 * Authorization: Bearer and X-Datalogger-Signature.
 *
 * With collector.login_url set the bearer token is fetched by posting the
 * login form (email, password) and reading "token" from the JSON reply.
 * An HTTP 401 drops the token, logs in again and posts the same batch once
 * more before the outcome is classified.
 */
class Forwarder {
public:
    /// @throws std::invalid_argument if a signing key is configured but not valid base64
    Forwarder(std::shared_ptr<ports::IHttpClient> httpClient,
              CollectorConfig config,
              std::shared_ptr<IClock> clock);

    ForwardResult send(const Batch& batch);

    /// Request that send() would post for this batch
    ports::HttpRequest buildRequest(const Batch& batch, std::uint64_t batchId) const;

    static bool isSuccessStatus(int status) { return status >= 200 && status < 300; }
    static ForwardErrorKind classifyStatus(int status);

    std::uint64_t batchesSent() const { return nextBatchId_ - 1; }
    std::uint64_t logins() const { return logins_; }

private:
    std::shared_ptr<ports::IHttpClient> httpClient_;
    CollectorConfig config_;
    std::shared_ptr<IClock> clock_;
    std::unique_ptr<RequestSigner> signer_;
    std::atomic<std::uint64_t> nextBatchId_{1};
    std::atomic<std::uint64_t> logins_{0};

    mutable std::mutex tokenMutex_;
    std::string token_;

    std::string currentToken() const;

    /**
     * @brief Replace the bearer token from the login endpoint
     * @return Empty on success, otherwise why the login failed
     * @note A failed login is a transient forward failure; the batch is retried
     */
    std::string login();

    ForwardResult failure(std::uint64_t batchId, const Batch& batch, ForwardErrorKind kind,
                          const std::string& message);
};

std::string forwardErrorKindToString(ForwardErrorKind kind);

} // namespace datalogger::domain
