/**
 * Example 03: Error Handling
 *
 * Errors thrown anywhere in the pipeline become an HTTP response.
 * Concepts:
 * - ctx.throw_error() and ctx.assert_that()
 * - An error-wrapping middleware that rewrites failures as JSON
 * - Observing errors with app.on_error()
 */

#include <cascade/app.h>
#include <cascade/exceptions.h>
#include <boost/json.hpp>
#include <stdexcept>

using namespace cascade;

int main() {
    App app;

    // 1. Observers receive every error the pipeline could not handle
    app.on_error([](const Error& err, Context* ctx) {
        const std::string where = ctx != nullptr ? ctx->original_url() : "-";
        Logger::instance().warn("request " + where + " failed: " + err.to_string());
    });

    // 2. Turn HTTP errors into JSON before they reach the default handler
    // Anything else keeps propagating to the default handler.
    app.use([](Context& ctx, Next next) -> Async<void> {
        try {
            co_await next();
        } catch (const HttpError& err) {
            ctx.status(err.status().value_or(500));
            ctx.body(boost::json::object{
                {"error", err.name()},
                {"message", err.expose() ? std::string(err.what()) : std::string(ctx.response().message())}
            });
        }
    });

    app.use([](Context& ctx) -> Async<void> {
        if (ctx.path() == "/secret") {
            ctx.assert_that(!ctx.get("Authorization").empty(), 401, "login required");
            ctx.body("the secret");
        } else if (ctx.path() == "/crash") {
            throw std::runtime_error("unexpected failure");
        } else if (ctx.path() != "/") {
            ctx.throw_error(404);
        } else {
            ctx.body("try /secret or /crash");
        }
        co_return;
    });

    app.listen(8080);
    return 0;
}
