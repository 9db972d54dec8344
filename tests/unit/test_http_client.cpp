#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <vector>
#include "../../src/core/types/constants.hpp"
#include "../../src/network/http/curl_client.hpp"
#include "../../src/network/http/retry.hpp"
#include "fake_http_client.hpp"

using namespace Fetchium::Network::Http;
using namespace Fetchium::Network::Proxy;
using Fetchium::Testing::FakeHttpClient;

namespace {

RetryPolicy fast_policy(int attempts) {
    RetryPolicy policy;
    policy.max_attempts = attempts;
    policy.backoff_base = std::chrono::milliseconds(0);
    return policy;
}

Response with_status(long status) {
    Response res;
    res.status_code = status;
    res.success     = status >= 200 && status < 400;
    return res;
}

}  // namespace

TEST(HttpClientTest, UserAgents) {
    CurlClient               client;
    std::vector<std::string> uas = {"fetchium/0.1", "Mozilla/5.0 (X11; Linux x86_64) Gecko/20100101 Firefox/128.0"};
    for (const auto& ua : uas)
        client.set_user_agent(ua);
}

TEST(HttpClientTest, StateManagement) {
    CurlClient client;
    client.add_header("Accept", "application/json");
    client.clear_headers();

    auto transport            = ProxyConfigurator::parse(std::string("socks5h://127.0.0.1:9050"));
    transport.connect_timeout = std::chrono::seconds(5);
    client.set_transport(transport);

    ASSERT_TRUE(client.transport().proxy);
    EXPECT_EQ(client.transport().proxy->kind, ProxyKind::Socks5);
    EXPECT_EQ(client.transport().proxy->dns, DnsResolution::Proxy);
    EXPECT_EQ(client.transport().connect_timeout, std::chrono::seconds(5));
}

TEST(HttpClientTest, CancelledBeforeRequest) {
    CurlClient      client;
    TransportConfig transport;
    transport.cancel = std::make_shared<std::atomic<bool>>(true);
    client.set_transport(transport);

    auto res = client.get("http://127.0.0.1:9/never");
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.error_type, ErrorType::Cancelled);
}

TEST(RetryTest, TransientClassification) {
    EXPECT_TRUE(is_transient(with_status(500)));
    EXPECT_TRUE(is_transient(with_status(503)));
    EXPECT_TRUE(is_transient(with_status(429)));
    EXPECT_FALSE(is_transient(with_status(404)));
    EXPECT_FALSE(is_transient(with_status(403)));

    Response refused;
    refused.error_type = ErrorType::Network;
    EXPECT_TRUE(is_transient(refused));

    Response cancelled;
    cancelled.error_type = ErrorType::Cancelled;
    EXPECT_FALSE(is_transient(cancelled));
}

TEST(RetryTest, BackoffDoubles) {
    using std::chrono::milliseconds;
    EXPECT_EQ(Fetchium::Core::get_backoff_time(0, milliseconds(100)), milliseconds(0));
    EXPECT_EQ(Fetchium::Core::get_backoff_time(1, milliseconds(100)), milliseconds(100));
    EXPECT_EQ(Fetchium::Core::get_backoff_time(3, milliseconds(100)), milliseconds(400));
}

TEST(RetryTest, RecoversAfterServerErrors) {
    FakeHttpClient client;
    client.on("https://index.test/list", FakeHttpClient::Reply{503, ""});
    client.on("https://index.test/list", FakeHttpClient::Reply{200, "[]"});

    auto res = get_with_retry(client, "https://index.test/list", fast_policy(3), TransportConfig{});
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.body, "[]");
    EXPECT_EQ(client.count("GET https://index.test/list"), 2u);
}

TEST(RetryTest, GivesUpAfterMaxAttempts) {
    FakeHttpClient client;
    client.on("https://index.test/list", FakeHttpClient::Reply{0, "", ErrorType::Timeout});

    auto res = get_with_retry(client, "https://index.test/list", fast_policy(3), TransportConfig{});
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.error_type, ErrorType::Timeout);
    EXPECT_EQ(client.requests().size(), 3u);
}

TEST(RetryTest, NotFoundIsNotRetried) {
    FakeHttpClient client;
    auto           res = get_with_retry(client, "https://index.test/missing", fast_policy(5), TransportConfig{});
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.status_code, 404);
    EXPECT_EQ(client.requests().size(), 1u);
}

TEST(RetryTest, TransportReachesClient) {
    FakeHttpClient client;
    client.on("https://index.test/", "ok");

    auto transport = ProxyConfigurator::parse(std::string("http://proxy.test:3128"));
    get_with_retry(client, "https://index.test/", fast_policy(1), transport);

    ASSERT_TRUE(client.transport().proxy);
    EXPECT_EQ(client.transport().proxy->host, "proxy.test");
    EXPECT_EQ(client.transport().proxy->port, 3128);
}

TEST(RetryTest, CancelStopsBackoff) {
    FakeHttpClient client;
    client.on("https://index.test/list", FakeHttpClient::Reply{500, ""});

    TransportConfig transport;
    transport.cancel = std::make_shared<std::atomic<bool>>(true);

    RetryPolicy policy;
    policy.max_attempts = 4;
    policy.backoff_base = std::chrono::milliseconds(10000);

    auto start = std::chrono::steady_clock::now();
    auto res   = get_with_retry(client, "https://index.test/list", policy, transport);
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.error_type, ErrorType::Cancelled);
    EXPECT_EQ(client.requests().size(), 1u);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(RetryTest, WaitForRetryCompletes) {
    TransportConfig transport;
    EXPECT_TRUE(wait_for_retry(std::chrono::milliseconds(20), transport));
}
