#include <catch2/catch_test_macros.hpp>
#include <relay/client.h>
#include <relay/exceptions.h>
#include "test_support.h"
#include <chrono>

using namespace relay;
namespace net = boost::asio;

TEST_CASE("Client: URL Parsing", "[client]") {
    SECTION("Plain HTTP with port, path and query") {
        auto url = parse_url("http://127.0.0.1:9000/chats/42?x=1");
        CHECK(url.host == "127.0.0.1");
        CHECK(url.port == "9000");
        CHECK(url.target == "/chats/42?x=1");
        CHECK_FALSE(url.is_ssl);
    }

    SECTION("HTTPS defaults to 443") {
        auto url = parse_url("https://chat.example.com/stats");
        CHECK(url.host == "chat.example.com");
        CHECK(url.port == "443");
        CHECK(url.target == "/stats");
        CHECK(url.is_ssl);
    }

    SECTION("Bare host gets the root target") {
        auto url = parse_url("http://backend");
        CHECK(url.host == "backend");
        CHECK(url.port == "80");
        CHECK(url.target == "/");
    }

    SECTION("Query without a path") {
        auto url = parse_url("http://backend?x=1");
        CHECK(url.host == "backend");
        CHECK(url.target == "/?x=1");
    }
}

TEST_CASE("Client: Redirect Resolution", "[client]") {
    CHECK(resolve_url("http://b:9/chats/1", "/final") == "http://b:9/final");
    CHECK(resolve_url("http://b/chats/1", "other") == "http://b/chats/other");
    CHECK(resolve_url("http://b:9/x", "https://elsewhere/y") == "https://elsewhere/y");
}

TEST_CASE("Client: Failure Kinds", "[client]") {
    SECTION("Refused connection is UpstreamUnavailable") {
        CHECK_THROWS_AS(testing::run_sync([]() -> Async<void> {
            co_await fetch("http://127.0.0.1:1/chats", "GET", {}, std::nullopt, 5);
        }), UpstreamUnavailable);
    }

    SECTION("Missing host is UpstreamUnavailable") {
        CHECK_THROWS_AS(testing::run_sync([]() -> Async<void> {
            co_await fetch("http:///chats");
        }), UpstreamUnavailable);
    }

    SECTION("Silent peer is UpstreamTimeout") {
        // Accepted by the kernel backlog, never answered
        net::io_context listen_ioc;
        net::ip::tcp::acceptor acceptor(listen_ioc, {net::ip::make_address("127.0.0.1"), 0});
        const auto port = acceptor.local_endpoint().port();

        const auto start = std::chrono::steady_clock::now();
        CHECK_THROWS_AS(testing::run_sync([port]() -> Async<void> {
            co_await fetch("http://127.0.0.1:" + std::to_string(port) + "/stats", "GET", {}, std::nullopt, 1);
        }), UpstreamTimeout);
        const auto elapsed = std::chrono::steady_clock::now() - start;
        CHECK(elapsed < std::chrono::seconds(5));
    }

    SECTION("Host name lookup counts against the deadline") {
        net::io_context listen_ioc;
        net::ip::tcp::acceptor acceptor(listen_ioc, {net::ip::make_address("127.0.0.1"), 0});
        const auto port = acceptor.local_endpoint().port();

        CHECK_THROWS_AS(testing::run_sync([port]() -> Async<void> {
            co_await fetch("http://localhost:" + std::to_string(port) + "/stats", "GET", {}, std::nullopt, 0);
        }), UpstreamTimeout);
    }
}
