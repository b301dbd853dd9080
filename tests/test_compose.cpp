#include <catch2/catch_test_macros.hpp>
#include <cascade/compose.h>
#include <cascade/exceptions.h>
#include "helpers.h"
#include <stdexcept>
#include <vector>

using namespace cascade;
using namespace cascade::testing;

TEST_CASE("Compose: Cascading Order", "[compose]") {
    Fixture f;
    std::vector<int> order;

    std::vector<Middleware> stack;
    stack.push_back([&](Context&, Next next) -> Async<void> {
        order.push_back(1);
        co_await next();
        order.push_back(6);
    });
    stack.push_back([&](Context&, Next next) -> Async<void> {
        order.push_back(2);
        co_await delay(std::chrono::milliseconds(1));
        co_await next();
        order.push_back(5);
    });
    stack.push_back([&](Context&, Next next) -> Async<void> {
        order.push_back(3);
        co_await next();
        order.push_back(4);
    });

    auto fn = compose(stack);
    run([&]() -> Async<void> {
        co_await fn(f.ctx, {});
    });

    CHECK(order == std::vector<int>{1, 2, 3, 4, 5, 6});
}

TEST_CASE("Compose: Empty Pipeline", "[compose]") {
    Fixture f;
    auto fn = compose({});

    SECTION("Resolves without a final next") {
        CHECK_NOTHROW(run([&]() -> Async<void> {
            co_await fn(f.ctx, {});
        }));
    }

    SECTION("Calls the outer next") {
        bool called = false;
        run([&]() -> Async<void> {
            co_await fn(f.ctx, [&]() -> Async<void> {
                called = true;
                co_return;
            });
        });
        CHECK(called);
    }
}

TEST_CASE("Compose: Shared Context", "[compose]") {
    Fixture f;
    auto fn = compose({
        [](Context& ctx, Next next) -> Async<void> {
            ctx.state().set("arr", std::vector<int>{0});
            co_await next();
        },
        [](Context& ctx, Next next) -> Async<void> {
            auto arr = ctx.state().get<std::vector<int>>("arr");
            arr.push_back(1);
            ctx.state().set("arr", arr);
            co_await next();
        }
    });

    run([&]() -> Async<void> {
        co_await fn(f.ctx, {});
    });

    CHECK(f.ctx.state().get<std::vector<int>>("arr") == std::vector<int>{0, 1});
}

TEST_CASE("Compose: Skipping Downstream", "[compose]") {
    Fixture f;
    std::vector<int> order;

    auto fn = compose({
        [&](Context&, Next next) -> Async<void> {
            order.push_back(1);
            co_await next();
            order.push_back(3);
        },
        [&](Context&, Next) -> Async<void> {
            order.push_back(2);
            co_return;
        },
        [&](Context&, Next next) -> Async<void> {
            order.push_back(99);
            co_await next();
        }
    });

    run([&]() -> Async<void> {
        co_await fn(f.ctx, {});
    });

    CHECK(order == std::vector<int>{1, 2, 3});
}

TEST_CASE("Compose: Multiple next() Calls", "[compose]") {
    Fixture f;

    SECTION("Throws in the middleware that calls twice") {
        bool caught = false;
        auto fn = compose({
            [&](Context&, Next next) -> Async<void> {
                co_await next();
                try {
                    co_await next();
                } catch (const MultipleNextCalls&) {
                    caught = true;
                }
            }
        });

        run([&]() -> Async<void> {
            co_await fn(f.ctx, {});
        });
        CHECK(caught);
    }

    SECTION("Propagates out of the dispatch") {
        auto fn = compose({
            [](Context&, Next next) -> Async<void> {
                co_await next();
            },
            [](Context&, Next next) -> Async<void> {
                co_await next();
                co_await next();
            }
        });

        CHECK_THROWS_AS(run([&]() -> Async<void> {
            co_await fn(f.ctx, {});
        }), MultipleNextCalls);
    }

    SECTION("Message") {
        MultipleNextCalls err;
        CHECK(std::string(err.what()) == "next() called multiple times");
    }
}

TEST_CASE("Compose: Error Propagation", "[compose]") {
    Fixture f;
    bool upstream_ran = false;

    auto fn = compose({
        [&](Context&, Next next) -> Async<void> {
            co_await next();
            upstream_ran = true;
        },
        [](Context&, Next) -> Async<void> {
            throw std::runtime_error("boom");
            co_return;
        }
    });

    SECTION("Failure rejects the composed dispatch") {
        CHECK_THROWS_WITH(run([&]() -> Async<void> {
            co_await fn(f.ctx, {});
        }), "boom");
        CHECK_FALSE(upstream_ran);
    }

    SECTION("Upstream middleware may catch") {
        bool handled = false;
        auto outer = compose({
            [&](Context&, Next next) -> Async<void> {
                try {
                    co_await next();
                } catch (const std::runtime_error&) {
                    handled = true;
                }
            },
            fn
        });

        run([&]() -> Async<void> {
            co_await outer(f.ctx, {});
        });
        CHECK(handled);
    }
}

TEST_CASE("Compose: Nesting and Reuse", "[compose]") {
    Fixture f;
    std::vector<int> order;

    auto inner = compose({
        [&](Context&, Next next) -> Async<void> {
            order.push_back(2);
            co_await next();
            order.push_back(4);
        }
    });

    auto outer = compose({
        [&](Context&, Next next) -> Async<void> {
            order.push_back(1);
            co_await next();
            order.push_back(5);
        },
        inner,
        [&](Context&, Next) -> Async<void> {
            order.push_back(3);
            co_return;
        }
    });

    SECTION("A composed pipeline is itself middleware") {
        run([&]() -> Async<void> {
            co_await outer(f.ctx, {});
        });
        CHECK(order == std::vector<int>{1, 2, 3, 4, 5});
    }

    SECTION("The same composition can run twice") {
        run([&]() -> Async<void> {
            co_await outer(f.ctx, {});
            co_await outer(f.ctx, {});
        });
        CHECK(order == std::vector<int>{1, 2, 3, 4, 5, 1, 2, 3, 4, 5});
    }
}

TEST_CASE("Compose: Invalid Input", "[compose]") {
    std::vector<Middleware> stack{
        [](Context&, Next next) -> Async<void> { co_await next(); },
        Middleware{}
    };

    CHECK_THROWS_AS(compose(stack), std::invalid_argument);
}

TEST_CASE("Compose: Composing Does Not Run Middleware", "[compose]") {
    bool ran = false;
    auto fn = compose({
        [&](Context&, Next) -> Async<void> {
            ran = true;
            co_return;
        }
    });

    CHECK(static_cast<bool>(fn));
    CHECK_FALSE(ran);
}
