#include <gtest/gtest.h>
#include "../net/http/BeastHttpClient.hpp"

using namespace datalogger;

TEST(BeastHttpClientTest, ParsesHttpsUrl) {
    auto url = BeastHttpClient::parseUrl("https://collector.example.com/api/v1/ingest?site=3");

    ASSERT_TRUE(url.has_value());
    EXPECT_TRUE(url->secure);
    EXPECT_EQ(url->host, "collector.example.com");
    EXPECT_EQ(url->port, "443");
    EXPECT_EQ(url->target, "/api/v1/ingest?site=3");
}

TEST(BeastHttpClientTest, ParsesExplicitPort) {
    auto url = BeastHttpClient::parseUrl("http://10.0.0.5:8080/ingest");

    ASSERT_TRUE(url.has_value());
    EXPECT_FALSE(url->secure);
    EXPECT_EQ(url->host, "10.0.0.5");
    EXPECT_EQ(url->port, "8080");
    EXPECT_EQ(url->target, "/ingest");
}

TEST(BeastHttpClientTest, DefaultsTargetToRoot) {
    auto url = BeastHttpClient::parseUrl("http://localhost");

    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url->port, "80");
    EXPECT_EQ(url->target, "/");
}

TEST(BeastHttpClientTest, RejectsBadUrls) {
    EXPECT_FALSE(BeastHttpClient::parseUrl("ftp://host/x").has_value());
    EXPECT_FALSE(BeastHttpClient::parseUrl("http://").has_value());
    EXPECT_FALSE(BeastHttpClient::parseUrl("http://host:abc/").has_value());
}

TEST(BeastHttpClientTest, InvalidUrlIsTransportFailure) {
    BeastHttpClient client;
    ports::HttpRequest request;
    request.url = "not a url";

    auto response = client.post(request);

    EXPECT_FALSE(response.transportOk);
    EXPECT_FALSE(response.error.empty());
}

TEST(BeastHttpClientTest, ConnectionRefusedIsTransportFailure) {
    BeastHttpClient client;
    ports::HttpRequest request;
    // Port 1 on loopback has no listener
    request.url = "http://127.0.0.1:1/ingest";
    request.body = "{}";
    request.timeout = std::chrono::milliseconds(2000);

    auto response = client.post(request);

    EXPECT_FALSE(response.transportOk);
    EXPECT_EQ(response.status, 0);
}
