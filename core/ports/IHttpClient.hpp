#pragma once

#include <chrono>
#include <map>
#include <string>

namespace datalogger::ports {

struct HttpRequest {
    std::string url;                              ///< http(s)://host[:port]/path
    std::map<std::string, std::string> headers;
    std::string body;
    std::chrono::milliseconds timeout{10000};
    bool verifyTls = true;
};

struct HttpResponse {
    bool transportOk = false;   ///< false: no HTTP status was received
    int status = 0;             ///< HTTP status code when transportOk
    bool timedOut = false;
    std::string body;
    std::string error;          ///< Transport error description
};

/**
 * Request/response sink used by the Forwarder. Implementations never throw
 * for network problems; they report them with transportOk = false.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual HttpResponse post(const HttpRequest& request) = 0;
};

} // namespace datalogger::ports
