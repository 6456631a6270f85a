#include "BeastHttpClient.hpp"
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <chrono>
#include <iostream>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace datalogger {

namespace {

// Runs one asynchronous operation to completion so the tcp_stream deadline applies
template <class Initiate>
void runOp(net::io_context& ioc, Initiate&& initiate) {
    beast::error_code result;
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    if (result) {
        throw beast::system_error(result);
    }
}

template <class Stream>
void exchange(net::io_context& ioc, Stream& stream,
              http::request<http::string_body>& req,
              http::response<http::string_body>& res) {
    beast::flat_buffer buffer;
    runOp(ioc, [&](auto handler) { http::async_write(stream, req, std::move(handler)); });
    runOp(ioc, [&](auto handler) { http::async_read(stream, buffer, res, std::move(handler)); });
}

} // namespace

std::optional<BeastHttpClient::Url> BeastHttpClient::parseUrl(const std::string& url) {
    Url parsed;
    std::string rest;

    if (url.rfind("https://", 0) == 0) {
        parsed.secure = true;
        rest = url.substr(8);
    } else if (url.rfind("http://", 0) == 0) {
        rest = url.substr(7);
    } else {
        return std::nullopt;
    }

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    parsed.target = slash == std::string::npos ? "/" : rest.substr(slash);

    auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        parsed.host = authority.substr(0, colon);
        parsed.port = authority.substr(colon + 1);
    } else {
        parsed.host = authority;
        parsed.port = parsed.secure ? "443" : "80";
    }

    if (parsed.host.empty() || parsed.port.empty() ||
        parsed.port.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    return parsed;
}

ports::HttpResponse BeastHttpClient::post(const ports::HttpRequest& request) {
    ports::HttpResponse response;

    auto url = parseUrl(request.url);
    if (!url) {
        response.error = "invalid collector URL: " + request.url;
        return response;
    }

    http::request<http::string_body> req{http::verb::post, url->target, 11};
    bool defaultPort = url->port == (url->secure ? "443" : "80");
    req.set(http::field::host, defaultPort ? url->host : url->host + ":" + url->port);
    req.set(http::field::user_agent, kUserAgent);
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.body() = request.body;
    req.prepare_payload();

    http::response<http::string_body> res;

    try {
        net::io_context ioc;
        tcp::resolver resolver(ioc);
        auto endpoints = resolver.resolve(url->host, url->port);

        if (url->secure) {
            ssl::context ctx(ssl::context::tls_client);
            if (request.verifyTls) {
                ctx.set_default_verify_paths();
                ctx.set_verify_mode(ssl::verify_peer);
            } else {
                ctx.set_verify_mode(ssl::verify_none);
            }

            beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
            if (!SSL_set_tlsext_host_name(stream.native_handle(), url->host.c_str())) {
                throw beast::system_error(beast::error_code(static_cast<int>(::ERR_get_error()),
                                                            net::error::get_ssl_category()));
            }
            if (request.verifyTls) {
                stream.set_verify_callback(ssl::host_name_verification(url->host));
            }

            auto& lowest = beast::get_lowest_layer(stream);
            lowest.expires_after(request.timeout);

            runOp(ioc, [&](auto handler) { lowest.async_connect(endpoints, std::move(handler)); });
            runOp(ioc, [&](auto handler) { stream.async_handshake(ssl::stream_base::client, std::move(handler)); });
            exchange(ioc, stream, req, res);

            // Response is complete; a peer that skips close_notify is not a delivery failure
            beast::error_code ec;
            lowest.expires_after(std::chrono::seconds(2));
            stream.async_shutdown([&ec](beast::error_code result) { ec = result; });
            ioc.restart();
            ioc.run();
            if (ec && ec != net::ssl::error::stream_truncated && ec != net::error::eof) {
                std::cerr << "[Forwarder] TLS shutdown: " << ec.message() << std::endl;
            }
        } else {
            beast::tcp_stream stream(ioc);
            stream.expires_after(request.timeout);

            runOp(ioc, [&](auto handler) { stream.async_connect(endpoints, std::move(handler)); });
            exchange(ioc, stream, req, res);

            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            if (ec && ec != beast::errc::not_connected) {
                std::cerr << "[Forwarder] Socket shutdown: " << ec.message() << std::endl;
            }
        }

        response.transportOk = true;
        response.status = static_cast<int>(res.result_int());
        response.body = res.body();
    } catch (const beast::system_error& e) {
        response.transportOk = false;
        response.timedOut = e.code() == beast::error::timeout;
        response.error = e.code().message();
    }

    return response;
}

} // namespace datalogger
