#include "Forwarder.hpp"
#include "../JsonCodec.hpp"
#include <cctype>
#include <cstdio>
#include <iostream>
#include <nlohmann/json.hpp>

namespace datalogger::domain {

namespace {

// application/x-www-form-urlencoded value
std::string formEncode(const std::string& value) {
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            out += static_cast<char>(c);
        } else if (c == ' ') {
            out += '+';
        } else {
            char hex[4];
            std::snprintf(hex, sizeof(hex), "%%%02X", c);
            out += hex;
        }
    }
    return out;
}

} // namespace

Forwarder::Forwarder(std::shared_ptr<ports::IHttpClient> httpClient,
                     CollectorConfig config,
                     std::shared_ptr<IClock> clock)
    : httpClient_(std::move(httpClient)), config_(std::move(config)), clock_(std::move(clock)),
      token_(config_.authToken) {
    if (!config_.signingKeyBase64.empty()) {
        signer_ = std::make_unique<RequestSigner>(config_.signingKeyBase64);
    }
}

ports::HttpRequest Forwarder::buildRequest(const Batch& batch, std::uint64_t batchId) const {
    ports::HttpRequest request;
    request.url = config_.url;
    request.timeout = config_.timeout;
    request.verifyTls = config_.verifyTls;
    request.body = JsonCodec::batchToJson(batch, batchId, clock_->wallNow())
                       .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    request.headers["Content-Type"] = "application/json";
    request.headers["X-Datalogger-Schema"] = kBatchSchema;
    request.headers["X-Datalogger-Batch"] = std::to_string(batchId);
    std::string token = currentToken();
    if (!token.empty()) {
        request.headers["Authorization"] = "Bearer " + token;
    }
    if (signer_) {
        request.headers[RequestSigner::kHeaderName] = signer_->sign(request.body, clock_->epochSeconds());
    }
    return request;
}

ForwardResult Forwarder::send(const Batch& batch) {
    ForwardResult result;
    if (batch.empty()) {
        result.success = true;
        return result;
    }

    std::uint64_t batchId = nextBatchId_++;
    bool useLogin = !config_.loginUrl.empty();

    if (useLogin && currentToken().empty()) {
        auto error = login();
        if (!error.empty()) {
            return failure(batchId, batch, ForwardErrorKind::Transient, error);
        }
    }

    auto started = clock_->now();
    auto response = httpClient_->post(buildRequest(batch, batchId));

    if (useLogin && response.transportOk && response.status == 401) {
        std::cerr << "[Forwarder] Batch " << batchId << ": token rejected (HTTP 401), logging in again" << std::endl;
        auto error = login();
        if (!error.empty()) {
            return failure(batchId, batch, ForwardErrorKind::Transient, error);
        }
        response = httpClient_->post(buildRequest(batch, batchId));
    }

    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(clock_->now() - started);

    if (response.transportOk && isSuccessStatus(response.status)) {
        result.success = true;
        result.report.batchId = batchId;
        result.report.sequenceNumbers = batch.sequenceNumbers();
        result.report.httpStatus = response.status;
        result.report.latency = latency;

        std::cout << "[Forwarder] Batch " << batchId << ": " << batch.size()
                  << " records accepted (HTTP " << response.status << ", "
                  << latency.count() << " ms)" << std::endl;
        return result;
    }

    if (!response.transportOk) {
        result = failure(batchId, batch, ForwardErrorKind::Transient,
                         response.timedOut ? "timeout: " + response.error : "transport: " + response.error);
        result.error.timedOut = response.timedOut;
        return result;
    }

    std::string message = "HTTP " + std::to_string(response.status);
    if (!response.body.empty()) {
        message += ": " + response.body.substr(0, 200);
    }
    result = failure(batchId, batch, classifyStatus(response.status), message);
    result.error.httpStatus = response.status;
    return result;
}

ForwardResult Forwarder::failure(std::uint64_t batchId, const Batch& batch, ForwardErrorKind kind,
                                 const std::string& message) {
    ForwardResult result;
    result.success = false;
    result.error.kind = kind;
    result.error.batchId = batchId;
    result.error.message = message;

    std::cerr << "[Forwarder] Batch " << batchId << " (" << batch.size() << " records) failed, "
              << forwardErrorKindToString(kind) << ": " << message << std::endl;
    return result;
}

std::string Forwarder::currentToken() const {
    std::lock_guard<std::mutex> lock(tokenMutex_);
    return token_;
}

std::string Forwarder::login() {
    {
        std::lock_guard<std::mutex> lock(tokenMutex_);
        token_.clear();
    }

    ports::HttpRequest request;
    request.url = config_.loginUrl;
    request.timeout = config_.timeout;
    request.verifyTls = config_.verifyTls;
    request.headers["Content-Type"] = "application/x-www-form-urlencoded";
    request.body = "email=" + formEncode(config_.loginEmail) + "&password=" + formEncode(config_.loginPassword);

    std::cout << "[Forwarder] Requesting token from " << config_.loginUrl << std::endl;
    auto response = httpClient_->post(request);

    if (!response.transportOk) {
        return std::string("login ") + (response.timedOut ? "timeout: " : "transport: ") + response.error;
    }
    if (!isSuccessStatus(response.status)) {
        return "login failed: HTTP " + std::to_string(response.status);
    }

    auto reply = nlohmann::json::parse(response.body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object() || !reply.contains("token") || !reply["token"].is_string()) {
        return "login failed: token missing in response";
    }

    {
        std::lock_guard<std::mutex> lock(tokenMutex_);
        token_ = reply["token"].get<std::string>();
    }
    logins_++;
    std::cout << "[Forwarder] Login succeeded" << std::endl;
    return "";
}

ForwardErrorKind Forwarder::classifyStatus(int status) {
    if (status >= 400 && status < 500) {
        return ForwardErrorKind::Permanent;
    }
    return ForwardErrorKind::Transient;
}

std::string forwardErrorKindToString(ForwardErrorKind kind) {
    switch (kind) {
        case ForwardErrorKind::Transient: return "transient";
        case ForwardErrorKind::Permanent: return "permanent";
        default: return "unknown";
    }
}

} // namespace datalogger::domain
