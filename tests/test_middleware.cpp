#include <catch2/catch_test_macros.hpp>
#include <relay/middleware.h>
#include <relay/exceptions.h>
#include "test_support.h"
#include <filesystem>
#include <fstream>

using namespace relay;
namespace fs = std::filesystem;

namespace {
    // Runs one middleware with a terminal handler that records whether it was reached
    bool run_middleware(const Middleware& mw, Request& req, Response& res) {
        bool reached = false;
        testing::run_sync([&]() -> Async<void> {
            co_await mw(req, res, [&reached]() -> Async<void> {
                reached = true;
                co_return;
            });
        });
        return reached;
    }

    Request json_request(std::string body, std::string content_type = "application/json") {
        Request req;
        req.method = "POST";
        req.set_target("/chat");
        req.body = std::move(body);
        req.headers.set(boost::beast::http::field::content_type, content_type);
        return req;
    }
}

TEST_CASE("Middleware: MIME Types", "[middleware]") {
    CHECK(middleware::get_mime_type("index.html") == "text/html");
    CHECK(middleware::get_mime_type("app.js") == "application/javascript");
    CHECK(middleware::get_mime_type("style.css") == "text/css");
    CHECK(middleware::get_mime_type("logo.svg") == "image/svg+xml");
    CHECK(middleware::get_mime_type("archive.xyz") == "application/octet-stream");
}

TEST_CASE("Middleware: JSON Body Decoding", "[middleware]") {
    auto mw = middleware::json_body();
    Response res;

    SECTION("Object bodies are stored in the context") {
        auto req = json_request(R"({"msg":"hi"})");
        CHECK(run_middleware(mw, req, res));

        auto body = req.get_opt<boost::json::value>(middleware::kJsonBodyKey);
        REQUIRE(body.has_value());
        CHECK(body->at("msg").as_string() == "hi");
    }

    SECTION("Content-Type match is case-insensitive and tolerates parameters") {
        auto req = json_request("[1,2]", "Application/JSON; charset=utf-8");
        CHECK(run_middleware(mw, req, res));
        CHECK(req.get_opt<boost::json::value>(middleware::kJsonBodyKey).has_value());
    }

    SECTION("Invalid JSON is rejected before the handler") {
        auto req = json_request(R"({"msg":)");
        bool reached = false;
        CHECK_THROWS_AS(reached = run_middleware(mw, req, res), BadRequest);
        CHECK_FALSE(reached);
    }

    SECTION("Strict mode rejects scalar top-level values") {
        auto req = json_request("42");
        CHECK_THROWS_AS(run_middleware(mw, req, res), BadRequest);

        auto lenient = json_request("42");
        CHECK(run_middleware(middleware::json_body(false), lenient, res));
        CHECK(lenient.get_opt<boost::json::value>(middleware::kJsonBodyKey)->as_int64() == 42);
    }

    SECTION("Non-JSON and empty bodies pass through untouched") {
        auto text = json_request("not json", "text/plain");
        CHECK(run_middleware(mw, text, res));
        CHECK_FALSE(text.get_opt<boost::json::value>(middleware::kJsonBodyKey).has_value());

        auto empty = json_request("");
        CHECK(run_middleware(mw, empty, res));
        CHECK_FALSE(empty.get_opt<boost::json::value>(middleware::kJsonBodyKey).has_value());
    }

    SECTION("Only the exact JSON media type is decoded") {
        auto patch = json_request("not json", "application/json-patch+json");
        CHECK(run_middleware(mw, patch, res));
        CHECK_FALSE(patch.get_opt<boost::json::value>(middleware::kJsonBodyKey).has_value());

        auto problem = json_request(R"({"x":1})", "application/problem+json");
        CHECK(run_middleware(mw, problem, res));
        CHECK_FALSE(problem.get_opt<boost::json::value>(middleware::kJsonBodyKey).has_value());
    }
}

TEST_CASE("Middleware: Static Files", "[middleware][static]") {
    const fs::path base = fs::temp_directory_path() / "relay_static_test";
    fs::remove_all(base);
    fs::create_directories(base / "public" / "assets");
    std::ofstream(base / "public" / "index.html") << "<h1>Relay</h1>";
    std::ofstream(base / "public" / "assets" / "app.js") << "console.log(1);";
    std::ofstream(base / "public" / "assets" / "a+b.js") << "plus();";
    std::ofstream(base / "secret.txt") << "top secret";

    auto mw = middleware::static_files((base / "public").string());

    auto get = [](const std::string& target) {
        Request req;
        req.method = "GET";
        req.set_target(target);
        return req;
    };

    SECTION("Root serves index.html") {
        auto req = get("/");
        Response res;
        CHECK_FALSE(run_middleware(mw, req, res));
        CHECK(res.body() == "<h1>Relay</h1>");
        CHECK(res.get_header("Content-Type") == "text/html");
    }

    SECTION("Nested asset with inferred MIME type") {
        auto req = get("/assets/app.js");
        Response res;
        CHECK_FALSE(run_middleware(mw, req, res));
        CHECK(res.body() == "console.log(1);");
        CHECK(res.get_header("Content-Type") == "application/javascript");
    }

    SECTION("Plus signs in file names are literal") {
        auto req = get("/assets/a+b.js");
        Response res;
        CHECK_FALSE(run_middleware(mw, req, res));
        CHECK(res.body() == "plus();");

        auto escaped = get("/assets/a%2Bb.js");
        Response escaped_res;
        CHECK_FALSE(run_middleware(mw, escaped, escaped_res));
        CHECK(escaped_res.body() == "plus();");
    }

    SECTION("Missing files fall through") {
        auto req = get("/health");
        Response res;
        CHECK(run_middleware(mw, req, res));
    }

    SECTION("Non-GET requests fall through") {
        Request req = get("/index.html");
        req.method = "POST";
        Response res;
        CHECK(run_middleware(mw, req, res));
    }

    SECTION("Traversal outside the root is forbidden") {
        auto req = get("/../secret.txt");
        Response res;
        CHECK_FALSE(run_middleware(mw, req, res));
        CHECK(res.get_status() == 403);
        CHECK(res.body().find("top secret") == std::string::npos);
    }

    fs::remove_all(base);
}
