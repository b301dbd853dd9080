#include <catch2/catch_test_macros.hpp>
#include <cascade/context.h>
#include <cascade/exceptions.h>
#include "helpers.h"
#include <boost/json.hpp>

using namespace cascade;
using namespace cascade::testing;

TEST_CASE("Context: Creation", "[context]") {
    Fixture f(make_request("POST", "/users?active=1"));

    CHECK(&f.ctx.app() == &f.app);
    CHECK(&f.ctx.req() == &f.req);
    CHECK(&f.ctx.res() == &f.res);
    CHECK(&f.ctx.request().ctx() == &f.ctx);
    CHECK(&f.ctx.response().ctx() == &f.ctx);
    CHECK(&f.ctx.request().response() == &f.ctx.response());
    CHECK(&f.ctx.response().request() == &f.ctx.request());
    CHECK(f.ctx.state().size() == 0);
    CHECK(f.ctx.original_url() == "/users?active=1");

    SECTION("original_url survives rewrites") {
        f.ctx.request().set_url("/rewritten");
        CHECK(f.ctx.url() == "/rewritten");
        CHECK(f.ctx.original_url() == "/users?active=1");
    }

    SECTION("create_context builds an independent context per call") {
        auto a = f.app.create_context(f.req, f.res);
        auto b = f.app.create_context(f.req, f.res);
        a->state().set("user", std::string("tobi"));
        CHECK(a.get() != b.get());
        CHECK_FALSE(b->state().has("user"));
    }
}

TEST_CASE("Context: State Bag", "[context]") {
    Fixture f;
    State& state = f.ctx.state();

    state.set("count", 3);
    state.set("name", std::string("cascade"));

    CHECK(state.get<int>("count") == 3);
    CHECK(state.get<std::string>("name") == "cascade");
    CHECK(state.get_opt<int>("missing") == std::nullopt);
    CHECK(state.get_opt<int>("name") == std::nullopt);
    CHECK(state.has("count"));
    CHECK_THROWS_AS(state.get<int>("missing"), std::runtime_error);

    state.erase("count");
    CHECK_FALSE(state.has("count"));
}

TEST_CASE("Context: Delegates", "[context]") {
    Fixture f(make_request("GET", "/path?x=1"));

    CHECK(f.ctx.method() == "GET");
    CHECK(f.ctx.path() == "/path");
    CHECK(f.ctx.get("host") == "localhost:3000");

    f.ctx.status(201).set("X-Id", "9");
    CHECK(f.ctx.status() == 201);
    CHECK(f.ctx.response().get("x-id") == "9");

    f.ctx.body("hello");
    CHECK(std::get<std::string>(f.ctx.response().body()) == "hello");
    CHECK(f.ctx.writable());
    CHECK_FALSE(f.ctx.header_sent());
}

TEST_CASE("Context: throw_error", "[context]") {
    Fixture f;

    SECTION("Status and message") {
        try {
            f.ctx.throw_error(400, "name required");
        } catch (const HttpError& err) {
            CHECK(err.status() == 400);
            CHECK(std::string(err.what()) == "name required");
            CHECK(err.expose());
            CHECK(err.name() == "BadRequestError");
        }
    }

    SECTION("Message defaults to the status phrase") {
        try {
            f.ctx.throw_error(404);
        } catch (const HttpError& err) {
            CHECK(std::string(err.what()) == "Not Found");
        }
    }

    SECTION("Message only is a 500 and not exposed") {
        try {
            f.ctx.throw_error("boom");
        } catch (const HttpError& err) {
            CHECK(err.status() == 500);
            CHECK_FALSE(err.expose());
        }
    }

    SECTION("Headers travel with the error") {
        try {
            f.ctx.throw_error(401, "login", {{"WWW-Authenticate", "Basic"}});
        } catch (const HttpError& err) {
            REQUIRE(err.headers().size() == 1);
            CHECK(err.headers()[0].first == "WWW-Authenticate");
        }
    }
}

TEST_CASE("Context: assert_that", "[context]") {
    Fixture f;

    CHECK_NOTHROW(f.ctx.assert_that(true, 401, "unused"));
    try {
        f.ctx.assert_that(false, 401, "login required");
        FAIL("assert_that should have thrown");
    } catch (const HttpError& err) {
        CHECK(err.status() == 401);
        CHECK(std::string(err.what()) == "login required");
    }
}

TEST_CASE("Context: onerror", "[context]") {
    Fixture f;
    f.app.silent(true);

    SECTION("Null error is ignored") {
        f.ctx.onerror(nullptr);
        CHECK_FALSE(f.res.writable_ended());
    }

    SECTION("Ends the response with the error page") {
        f.ctx.set("X-Stale", "1");
        f.ctx.onerror(std::make_exception_ptr(HttpError(422, "bad field")));
        CHECK(f.res.writable_ended());
        CHECK(f.res.status_code() == 422);
        CHECK(f.res.header("X-Stale").empty());
        CHECK(f.res.body() == "bad field");
    }
}

TEST_CASE("Context: to_json", "[context]") {
    Fixture f(make_request("GET", "/inspect"));
    f.ctx.status(200);

    const auto json = f.ctx.to_json().as_object();
    CHECK(json.at("originalUrl").as_string() == "/inspect");
    CHECK(json.at("request").as_object().at("method").as_string() == "GET");
    CHECK(json.at("response").as_object().at("status").as_int64() == 200);
    CHECK(json.at("app").as_object().at("subdomainOffset").as_int64() == 2);
}
