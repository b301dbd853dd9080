#include <catch2/catch_test_macros.hpp>
#include <cascade/app.h>
#include <cascade/exceptions.h>
#include "helpers.h"
#include <boost/json.hpp>
#include <cerrno>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <system_error>

using namespace cascade;
using namespace cascade::testing;

TEST_CASE("Context onerror: Default Error Response", "[onerror]") {
    AppConfig config;
    config.silent = true;
    App app(config);

    SECTION("Responds with the thrown status") {
        app.use([](Context& ctx) -> Async<void> {
            ctx.body("something else");
            ctx.throw_error(418, "boom");
            co_return;
        });

        Exchange ex;
        dispatch(app, ex);
        CHECK(ex.res->status_code() == 418);
        CHECK(ex.res->header("Content-Type") == "text/plain; charset=utf-8");
        CHECK(ex.res->header("Content-Length") == "4");
        CHECK(ex.res->body() == "boom");
    }

    SECTION("Unsets all headers") {
        app.use([](Context& ctx) -> Async<void> {
            ctx.set("Vary", "Accept-Encoding");
            ctx.set("X-CSRF-Token", "asdf");
            ctx.body("response");
            ctx.throw_error(418, "boom");
            co_return;
        });

        Exchange ex;
        dispatch(app, ex);
        CHECK(ex.res->status_code() == 418);
        CHECK(ex.res->header("Vary").empty());
        CHECK(ex.res->header("X-CSRF-Token").empty());
    }

    SECTION("Sets headers carried by the error") {
        app.use([](Context& ctx) -> Async<void> {
            ctx.set("Vary", "Accept-Encoding");
            ctx.body("response");
            Error err("boom");
            err.set_status(418).set_expose(true).add_header("X-New-Header", "Value");
            throw err;
            co_return;
        });

        Exchange ex;
        dispatch(app, ex);
        CHECK(ex.res->status_code() == 418);
        CHECK(ex.res->header("X-New-Header") == "Value");
        CHECK(ex.res->header("Vary").empty());
        CHECK(ex.res->header("Content-Type") == "text/plain; charset=utf-8");
    }

    SECTION("Falls back to status_code") {
        app.use([](Context& ctx) -> Async<void> {
            ctx.body("something else");
            Error err("Not found");
            err.set_status_code(404);
            throw err;
            co_return;
        });

        Exchange ex;
        dispatch(app, ex);
        CHECK(ex.res->status_code() == 404);
        CHECK(ex.res->body() == "Not Found");
    }

    SECTION("Unknown status becomes 500") {
        app.use([](Context& ctx) -> Async<void> {
            ctx.body("something else");
            Error err("some error");
            err.set_status(9999);
            throw err;
            co_return;
        });

        Exchange ex;
        dispatch(app, ex);
        CHECK(ex.res->status_code() == 500);
        CHECK(ex.res->body() == "Internal Server Error");
    }

    SECTION("ENOENT maps to 404") {
        app.use([](Context&) -> Async<void> {
            throw std::system_error(ENOENT, std::generic_category(), "open index.html");
            co_return;
        });

        Exchange ex;
        dispatch(app, ex);
        CHECK(ex.res->status_code() == 404);
        CHECK(ex.res->body() == "Not Found");
    }

    SECTION("Server errors hide their message") {
        app.use([](Context& ctx) -> Async<void> {
            ctx.throw_error(503, "database is down");
            co_return;
        });

        Exchange ex;
        dispatch(app, ex);
        CHECK(ex.res->status_code() == 503);
        CHECK(ex.res->body() == "Service Unavailable");
    }

    SECTION("Non-error values respond 500") {
        app.use([](Context&) -> Async<void> {
            throw std::string("string error");
            co_return;
        });

        Exchange ex;
        dispatch(app, ex);
        CHECK(ex.res->status_code() == 500);
        CHECK(ex.res->header("Content-Type") == "text/plain; charset=utf-8");
        CHECK(ex.res->body() == "Internal Server Error");
    }
}

TEST_CASE("Context onerror: Error Observers", "[onerror]") {
    App app(AppConfig{});

    SECTION("Receives the error and the context") {
        std::string message;
        Context* seen = nullptr;
        app.on_error([&](const Error& err, Context* ctx) {
            message = err.what();
            seen = ctx;
        });
        app.use([](Context& ctx) -> Async<void> {
            ctx.state().set("marker", 7);
            ctx.throw_error(418, "boom");
            co_return;
        });

        Exchange ex;
        dispatch(app, ex);
        CHECK(message == "boom");
        REQUIRE(seen != nullptr);
        CHECK(ex.res->status_code() == 418);
    }

    SECTION("Observers run in registration order") {
        std::vector<int> order;
        app.on_error([&](const Error&, Context*) { order.push_back(1); });
        app.on_error([&](const Error&, Context*) { order.push_back(2); });
        app.use([](Context& ctx) -> Async<void> {
            ctx.throw_error("boom");
            co_return;
        });

        Exchange ex;
        dispatch(app, ex);
        CHECK(order == std::vector<int>{1, 2});
    }

    SECTION("Objects are reported as JSON") {
        std::string message;
        app.on_error([&](const Error& err, Context*) {
            message = err.what();
        });
        app.use([](Context&) -> Async<void> {
            throw boost::json::value{{"key", "value"}};
            co_return;
        });

        Exchange ex;
        dispatch(app, ex);
        CHECK(message == R"(non-error thrown: {"key":"value"})");
        CHECK(ex.res->status_code() == 500);
    }

    SECTION("Errors after headers were sent are only reported") {
        bool header_sent = false;
        app.on_error([&](const Error& err, Context* ctx) {
            CHECK(std::string(err.what()) == "mock error");
            header_sent = err.header_sent();
            ctx->res().end();
        });
        app.use([](Context& ctx) -> Async<void> {
            ctx.status(200);
            ctx.set("X-Foo", "Bar");
            ctx.response().flush_headers();
            throw std::runtime_error("mock error");
            co_return;
        });

        Exchange ex;
        dispatch(app, ex);
        CHECK(header_sent);
        CHECK(ex.res->status_code() == 200);
        CHECK(ex.res->header("X-Foo") == "Bar");
        CHECK(ex.res->wire().find("HTTP/1.1 200 OK\r\n") == 0);
    }

    SECTION("Transport failures reach the observers") {
        std::string code;
        app.on_error([&](const Error& err, Context*) {
            code = err.code();
        });
        app.use([](Context& ctx) -> Async<void> {
            ctx.response().respond(false);
            co_return;
        });

        Exchange ex;
        dispatch(app, ex);
        ex.res->complete(boost::system::error_code(ECONNRESET, boost::system::generic_category()));
        CHECK(code == "ECONNRESET");
        CHECK(ex.res->destroyed());
    }
}

TEST_CASE("App onerror: Default Reporter", "[onerror]") {
    const std::string log_file = "cascade_onerror_test.log";
    std::remove(log_file.c_str());
    Logger::instance().configure(log_file);

    auto read_log = [&]() {
        Logger::instance().flush();
        std::ifstream in(log_file);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    };

    App app(AppConfig{});

    SECTION("Reports server errors indented") {
        app.onerror(Error("boom\nsecond line"));
        const std::string out = read_log();
        CHECK(out.find("  Error: boom\n  second line") != std::string::npos);
    }

    SECTION("Skips 404") {
        Error err("not here");
        err.set_status(404);
        app.onerror(err);
        CHECK(read_log().find("not here") == std::string::npos);
    }

    SECTION("Skips exposed errors") {
        app.onerror(HttpError(400, "client mistake"));
        CHECK(read_log().find("client mistake") == std::string::npos);
    }

    SECTION("Skips everything when silent") {
        app.silent(true);
        app.onerror(Error("quiet please"));
        CHECK(read_log().find("quiet please") == std::string::npos);
    }

    SECTION("Non-error values carry their JSON form") {
        app.use([](Context&) -> Async<void> {
            throw 42;
            co_return;
        });

        Exchange ex;
        dispatch(app, ex);
        CHECK(read_log().find("non-error thrown: 42") != std::string::npos);
    }

    Logger::instance().configure("stdout");
    std::remove(log_file.c_str());
}
