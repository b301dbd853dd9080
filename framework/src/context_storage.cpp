#include <cascade/context_storage.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace cascade {

namespace {

    thread_local Context* current_context = nullptr;

} // namespace

Context* ContextStorage::current() noexcept {
    return current_context;
}

ContextStorage::Scope::Scope(Context* ctx) noexcept : previous_(current_context) {
    current_context = ctx;
}

ContextStorage::Scope::~Scope() {
    current_context = previous_;
}

Async<void> ContextStorage::run(Context& ctx, Async<void> task) {
    auto executor = co_await boost::asio::this_coro::executor;
    co_await boost::asio::co_spawn(
        ContextBoundExecutor<decltype(executor)>(executor, &ctx),
        std::move(task),
        boost::asio::use_awaitable);
}

} // namespace cascade
