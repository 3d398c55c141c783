#include <catch2/catch_test_macros.hpp>
#include <relay/router.h>
#include <relay/request.h>
#include <relay/response.h>
#include <boost/asio.hpp>

using namespace relay;

namespace {
    Handler tagged(int& slot, int tag) {
        return [&slot, tag](Request&, Response&) -> Async<void> {
            slot = tag;
            co_return;
        };
    }
}

TEST_CASE("Router: Static Route Matching", "[router]") {
    Router router;

    router.add_route("GET", "/health", [](Request&, Response&) -> Async<void> {
        co_return;
    });

    SECTION("Exact match should succeed") {
        auto match = router.match("GET", "/health");
        REQUIRE(match.has_value());
    }

    SECTION("Wrong method should fail") {
        auto match = router.match("POST", "/health");
        CHECK_FALSE(match.has_value());
    }

    SECTION("Wrong path should fail") {
        auto match = router.match("GET", "/stats");
        CHECK_FALSE(match.has_value());
    }

    SECTION("Query string is ignored") {
        auto match = router.match("GET", "/health?verbose=1");
        CHECK(match.has_value());
    }
}

TEST_CASE("Router: Parameter Extraction", "[router]") {
    Router router;

    router.add_route("GET", "/chats/:id", [](Request&, Response&) -> Async<void> {
        co_return;
    });

    SECTION("Dynamic parameter should match") {
        auto match = router.match("GET", "/chats/42");
        REQUIRE(match.has_value());
        CHECK(match->params.at("id") == "42");
        CHECK(match->params.size() == 1);
    }

    SECTION("Ids are opaque strings") {
        auto match = router.match("GET", "/chats/abc-def_1");
        REQUIRE(match.has_value());
        CHECK(match->params.at("id") == "abc-def_1");
    }

    SECTION("Trailing slash should not break matching") {
        auto match = router.match("GET", "/chats/42/");
        CHECK(match.has_value());
    }

    SECTION("Path parameters should be URL-decoded") {
        auto match = router.match("GET", "/chats/Jane%20Doe");
        REQUIRE(match.has_value());
        CHECK(match->params.at("id") == "Jane Doe");
    }

    SECTION("A plus sign in a path parameter stays a plus sign") {
        auto match = router.match("GET", "/chats/a+b%2Bc");
        REQUIRE(match.has_value());
        CHECK(match->params.at("id") == "a+b+c");
    }

    SECTION("Deeper paths do not match") {
        CHECK_FALSE(router.match("GET", "/chats/42/messages").has_value());
        CHECK_FALSE(router.match("GET", "/chats").has_value());
    }
}

TEST_CASE("Router: Any-Method Routes and Precedence", "[router]") {
    Router router;
    int hit = 0;

    SECTION("Any-method route accepts arbitrary method tokens") {
        router.add_route(std::string(Router::kAnyMethod), "/stats", tagged(hit, 1));

        for (const char* method : {"GET", "POST", "PUT", "PATCH", "DELETE", "OPTIONS", "PURGE"}) {
            CHECK(router.match(method, "/stats").has_value());
        }
    }

    SECTION("HEAD falls back to GET routes") {
        router.add_route("GET", "/health", tagged(hit, 1));
        router.add_route("POST", "/chat", tagged(hit, 2));

        CHECK(router.match("HEAD", "/health").has_value());
        CHECK_FALSE(router.match("HEAD", "/chat").has_value());
        CHECK_FALSE(router.match("GET", "/chat").has_value());
    }

    SECTION("First registered route wins") {
        router.add_route(std::string(Router::kAnyMethod), "/chats", tagged(hit, 1));
        router.add_route("GET", "/chats", tagged(hit, 2));

        auto match = router.match("GET", "/chats");
        REQUIRE(match.has_value());

        Request req;
        Response res;
        auto task = match->handler(req, res);
        boost::asio::io_context ioc;
        boost::asio::co_spawn(ioc, std::move(task), boost::asio::detached);
        ioc.run();

        CHECK(hit == 1);
    }

    SECTION("A later method-specific route still serves other methods") {
        router.add_route("GET", "/chats", tagged(hit, 1));
        router.add_route(std::string(Router::kAnyMethod), "/chats", tagged(hit, 2));

        CHECK(router.size() == 2);
        auto match = router.match("DELETE", "/chats");
        REQUIRE(match.has_value());

        Request req;
        Response res;
        boost::asio::io_context ioc;
        boost::asio::co_spawn(ioc, match->handler(req, res), boost::asio::detached);
        ioc.run();

        CHECK(hit == 2);
    }
}
