#ifndef CASCADE_CONTEXT_STORAGE_H
#define CASCADE_CONTEXT_STORAGE_H

#include <cascade/async.h>
#include <boost/asio/execution.hpp>
#include <boost/asio/prefer.hpp>
#include <boost/asio/query.hpp>
#include <boost/asio/require.hpp>
#include <type_traits>
#include <utility>

namespace cascade {

class Context;

/**
 * @brief Thread-local slot holding the context of the request currently
 * running on this thread.
 */
class ContextStorage {
public:
    /** @brief The active context, or nullptr outside a bound request. */
    static Context* current() noexcept;

    /** @brief Installs a context for its lifetime and restores the previous one. */
    class Scope {
        Context* previous_;

    public:
        explicit Scope(Context* ctx) noexcept;
        ~Scope();

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;
    };

    /**
     * @brief Runs the task as its own coroutine whose every resumption sees
     * ctx as the current context.
     */
    static Async<void> run(Context& ctx, Async<void> task);
};

/**
 * @brief Executor adapter that installs a Context around each function it
 * executes. A coroutine spawned on it is resumed through it, so the context
 * follows the coroutine across suspensions and threads.
 */
template <typename Executor>
class ContextBoundExecutor {
    Executor inner_;
    Context* ctx_;

    template <typename Function>
    struct Bound {
        Function function;
        Context* ctx;

        void operator()() {
            ContextStorage::Scope scope(ctx);
            std::move(function)();
        }
    };

public:
    ContextBoundExecutor(Executor inner, Context* ctx) noexcept
        : inner_(std::move(inner)), ctx_(ctx) {}

    const Executor& inner_executor() const noexcept { return inner_; }
    Context* context() const noexcept { return ctx_; }

    template <typename Property>
    std::enable_if_t<
        boost::asio::can_query<const Executor&, Property>::value,
        typename boost::asio::query_result<const Executor&, Property>::type>
    query(const Property& p) const {
        return boost::asio::query(inner_, p);
    }

    template <typename Property>
    std::enable_if_t<
        boost::asio::can_require<const Executor&, Property>::value,
        ContextBoundExecutor<std::decay_t<typename boost::asio::require_result<const Executor&, Property>::type>>>
    require(const Property& p) const {
        return {boost::asio::require(inner_, p), ctx_};
    }

    template <typename Property>
    std::enable_if_t<
        boost::asio::can_prefer<const Executor&, Property>::value,
        ContextBoundExecutor<std::decay_t<typename boost::asio::prefer_result<const Executor&, Property>::type>>>
    prefer(const Property& p) const {
        return {boost::asio::prefer(inner_, p), ctx_};
    }

    template <typename Function>
    void execute(Function&& f) const {
        inner_.execute(Bound<std::decay_t<Function>>{std::forward<Function>(f), ctx_});
    }

    friend bool operator==(const ContextBoundExecutor& a, const ContextBoundExecutor& b) noexcept {
        return a.inner_ == b.inner_ && a.ctx_ == b.ctx_;
    }

    friend bool operator!=(const ContextBoundExecutor& a, const ContextBoundExecutor& b) noexcept {
        return !(a == b);
    }
};

} // namespace cascade

#endif
