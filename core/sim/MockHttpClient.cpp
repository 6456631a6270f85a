#include "MockHttpClient.hpp"

namespace datalogger::sim {

MockHttpClient::MockHttpClient(int defaultStatus) : defaultStatus_(defaultStatus) {
}

ports::HttpResponse MockHttpClient::post(const ports::HttpRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);

    if (!script_.empty()) {
        ports::HttpResponse response = script_.front();
        script_.pop_front();
        return response;
    }

    ports::HttpResponse response;
    response.transportOk = true;
    response.status = defaultStatus_;
    return response;
}

void MockHttpClient::queueStatus(int status, const std::string& body) {
    ports::HttpResponse response;
    response.transportOk = true;
    response.status = status;
    response.body = body;

    std::lock_guard<std::mutex> lock(mutex_);
    script_.push_back(response);
}

void MockHttpClient::queueTransportFailure(const std::string& error) {
    ports::HttpResponse response;
    response.error = error;

    std::lock_guard<std::mutex> lock(mutex_);
    script_.push_back(response);
}

void MockHttpClient::queueTimeout() {
    ports::HttpResponse response;
    response.timedOut = true;
    response.error = "Operation timed out";

    std::lock_guard<std::mutex> lock(mutex_);
    script_.push_back(response);
}

void MockHttpClient::setDefaultStatus(int status) {
    std::lock_guard<std::mutex> lock(mutex_);
    defaultStatus_ = status;
}

std::vector<ports::HttpRequest> MockHttpClient::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

std::size_t MockHttpClient::requestCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

ports::HttpRequest MockHttpClient::lastRequest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.empty() ? ports::HttpRequest{} : requests_.back();
}

} // namespace datalogger::sim
