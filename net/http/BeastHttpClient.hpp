/**
 * @file BeastHttpClient.hpp
 * @brief Boost.Beast implementation of the collector HTTP port
 *
 * One connection per request over plain TCP or TLS (Boost.Asio SSL on
 * OpenSSL, SNI set, peer and host name verified unless disabled). The
 * request timeout is a deadline covering connect, handshake, write and read.
 *
 * @note Thread-safe: each post() owns its io_context and stream
 */

#pragma once

#include "../../core/ports/IHttpClient.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace datalogger {

class BeastHttpClient : public ports::IHttpClient {
public:
    struct Url {
        bool secure = false;
        std::string host;
        std::string port;
        std::string target;   ///< Path plus query, "/" when empty
    };

    BeastHttpClient() = default;
    ~BeastHttpClient() override = default;

    ports::HttpResponse post(const ports::HttpRequest& request) override;

    /// Split http(s)://host[:port][/path] into its parts
    static std::optional<Url> parseUrl(const std::string& url);

private:
    static constexpr const char* kUserAgent = "datalogger/1.0";
};

} // namespace datalogger
