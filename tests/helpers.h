#ifndef CASCADE_TESTS_HELPERS_H
#define CASCADE_TESTS_HELPERS_H

#include <cascade/app.h>
#include <cascade/context.h>
#include <cascade/transport.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <exception>
#include <functional>
#include <memory>
#include <string>

namespace cascade::testing {

// In-memory transport: flush() moves the buffered bytes to wire().
class RecordingResponse : public ServerResponse {
    std::string wire_;

public:
    explicit RecordingResponse(const IncomingMessage& req) : ServerResponse(req) {}

    Async<void> flush() override {
        wire_ += pending_;
        pending_.clear();
        co_return;
    }

    // Everything written so far, flushed or not.
    std::string wire() const { return wire_ + pending_; }

    std::string body() const {
        const std::string all = wire();
        const size_t pos = all.find("\r\n\r\n");
        return pos == std::string::npos ? std::string() : all.substr(pos + 4);
    }

    std::string header(const std::string& name) const {
        const auto it = headers().find(name);
        return it == headers().end() ? std::string() : std::string(it->value().data(), it->value().size());
    }

    void complete(const boost::system::error_code& ec = {}) { finish(ec); }
};

inline IncomingMessage make_request(const std::string& method = "GET", const std::string& url = "/") {
    IncomingMessage req;
    req.method = method;
    req.url = url;
    req.remote_address = "127.0.0.1";
    req.headers.set(http::field::host, "localhost:3000");
    return req;
}

// Runs one coroutine to completion on a private io_context, rethrowing failures.
inline void run(std::function<Async<void>()> task) {
    boost::asio::io_context ioc;
    std::exception_ptr failure;
    boost::asio::co_spawn(ioc, std::move(task), [&failure](std::exception_ptr e) {
        failure = e;
    });
    ioc.run();
    if (failure) {
        std::rethrow_exception(failure);
    }
}

// A full request/response exchange through App::callback().
struct Exchange {
    IncomingMessage req;
    std::unique_ptr<RecordingResponse> res;

    explicit Exchange(IncomingMessage request = make_request())
        : req(std::move(request)), res(std::make_unique<RecordingResponse>(req)) {}
};

inline void dispatch(App& app, Exchange& exchange) {
    auto handler = app.callback();
    run([&]() -> Async<void> {
        co_await handler(exchange.req, *exchange.res);
        co_await exchange.res->flush();
    });
}

// Context over a fresh request/response pair, for unit tests of the facades.
struct Fixture {
    App app;
    IncomingMessage req;
    RecordingResponse res;
    Context ctx;

    explicit Fixture(IncomingMessage request = make_request(), AppConfig config = AppConfig{})
        : app(std::move(config)), req(std::move(request)), res(req), ctx(app, req, res) {}
};

} // namespace cascade::testing

#endif
