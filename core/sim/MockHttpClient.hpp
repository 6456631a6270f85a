#pragma once

#include "../ports/IHttpClient.hpp"
#include <deque>
#include <mutex>
#include <vector>

namespace datalogger::sim {

/**
 * Scripted collector. Each post() consumes the next scripted response;
 * once the script is empty the default status is returned.
 */
class MockHttpClient : public ports::IHttpClient {
public:
    explicit MockHttpClient(int defaultStatus = 200);
    ~MockHttpClient() override = default;

    // IHttpClient interface
    ports::HttpResponse post(const ports::HttpRequest& request) override;

    // Scripting
    void queueStatus(int status, const std::string& body = "");
    void queueTransportFailure(const std::string& error = "Connection refused");
    void queueTimeout();
    void setDefaultStatus(int status);

    std::vector<ports::HttpRequest> requests() const;
    std::size_t requestCount() const;
    ports::HttpRequest lastRequest() const;

private:
    mutable std::mutex mutex_;
    int defaultStatus_;
    std::deque<ports::HttpResponse> script_;
    std::vector<ports::HttpRequest> requests_;
};

} // namespace datalogger::sim
