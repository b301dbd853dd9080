/**
 * Example 02: Middleware Chain
 *
 * Middleware run downstream in registration order, then unwind upstream.
 * Concepts:
 * - co_await next() to delegate downstream
 * - Post-processing after downstream returns (timing header)
 * - Sharing data through ctx.state()
 * - Reading the active context from anywhere with context storage
 */

#include <cascade/app.h>
#include <boost/json.hpp>
#include <chrono>
#include <ctime>

using namespace cascade;

namespace {

    // Works without a Context parameter because context storage is enabled.
    std::string current_trace_id(App& app) {
        Context* ctx = app.current_context();
        if (ctx == nullptr) {
            return "none";
        }
        return ctx->state().get_opt<std::string>("trace_id").value_or("none");
    }

} // namespace

int main() {
    App app;
    app.context_storage(true);

    // 1. Response time header, set once everything downstream has finished
    app.use([](Context& ctx, Next next) -> Async<void> {
        auto start = std::chrono::steady_clock::now();

        co_await next();

        auto diff = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start).count();
        ctx.set("X-Response-Time-US", std::to_string(diff));
    });

    // 2. Trace id stored in the request state
    app.use([](Context& ctx, Next next) -> Async<void> {
        ctx.state().set("trace_id", "trace-" + std::to_string(std::time(nullptr)));
        co_await next();
    });

    // 3. A slow step; the trace id survives the suspension
    app.use([&app](Context& ctx) -> Async<void> {
        co_await delay(std::chrono::milliseconds(10));
        ctx.body(boost::json::object{
            {"message", "Middleware trace demo"},
            {"path", ctx.path()},
            {"trace_id", current_trace_id(app)}
        });
    });

    app.listen(8080);
    return 0;
}
