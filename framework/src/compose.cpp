#include <cascade/compose.h>
#include <cascade/exceptions.h>
#include <memory>
#include <stdexcept>

namespace cascade {

namespace {

    struct Dispatch {
        std::shared_ptr<const std::vector<Middleware>> stack;
        Context* ctx;
        Next final;
        long index = -1;
    };

    Async<void> resolved() {
        co_return;
    }

    // Not a coroutine: a repeated next() must throw where it is called.
    Async<void> dispatch(const std::shared_ptr<Dispatch>& state, size_t i) {
        if (static_cast<long>(i) <= state->index) {
            throw MultipleNextCalls();
        }
        state->index = static_cast<long>(i);

        if (i == state->stack->size()) {
            return state->final ? state->final() : resolved();
        }

        const Middleware& fn = (*state->stack)[i];
        return fn(*state->ctx, [state, i]() {
            return dispatch(state, i + 1);
        });
    }

} // namespace

Middleware compose(std::vector<Middleware> middleware) {
    for (const auto& fn : middleware) {
        if (!fn) {
            throw std::invalid_argument("Middleware must be composed of functions!");
        }
    }

    auto stack = std::make_shared<const std::vector<Middleware>>(std::move(middleware));

    return [stack](Context& ctx, Next next) -> Async<void> {
        auto state = std::make_shared<Dispatch>(Dispatch{stack, &ctx, std::move(next)});
        co_await dispatch(state, 0);
    };
}

} // namespace cascade
