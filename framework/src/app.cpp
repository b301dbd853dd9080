#include <cascade/app.h>
#include <cascade/context_storage.h>
#include <cascade/environment.h>
#include <cascade/exceptions.h>
#include <cascade/respond.h>
#include <cascade/util/string.h>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>
#include <stdexcept>
#include <thread>
#include "server.h"

namespace cascade {

AppConfig AppConfig::from_env() {
    AppConfig config;
    config.env = env<std::string>("CASCADE_ENV", config.env);
    config.proxy = env<bool>("CASCADE_PROXY", config.proxy);
    config.silent = env<bool>("CASCADE_SILENT", config.silent);
    config.log_path = env<std::string>("CASCADE_LOG_PATH", config.log_path);
    config.max_body_size = env<size_t>("CASCADE_MAX_BODY_SIZE", config.max_body_size);
    return config;
}

App::App(AppConfig config) : config_(std::move(config)) {
}

App::~App() {
    if (!ioc_.stopped()) {
        ioc_.stop();
    }
}

Async<void> delay(std::chrono::milliseconds ms) {
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer timer(executor, ms);
    co_await timer.async_wait(boost::asio::use_awaitable);
}

App& App::use(Middleware fn) {
    if (!fn) {
        throw std::invalid_argument("middleware must be a function!");
    }
    middleware_.push_back(std::move(fn));
    Logger::instance().debug("use middleware #" + std::to_string(middleware_.size()));
    return *this;
}

RequestHandler App::callback() {
    Middleware fn = config_.compose ? config_.compose(middleware_) : compose(middleware_);
    Logger::instance().debug("composed " + std::to_string(middleware_.size()) + " middleware");

    return [this, fn = std::move(fn)](IncomingMessage& req, ServerResponse& res) -> Async<void> {
        auto ctx = create_context(req, res);
        if (config_.context_storage) {
            co_await ContextStorage::run(*ctx, handle_request(ctx, fn));
        } else {
            co_await handle_request(ctx, fn);
        }
    };
}

std::shared_ptr<Context> App::create_context(IncomingMessage& req, ServerResponse& res) {
    return std::make_shared<Context>(*this, req, res);
}

Async<void> App::handle_request(std::shared_ptr<Context> ctx, Middleware fn) {
    ctx->res().set_status_code(404);

    ctx->res().on_finished([ctx](const boost::system::error_code& ec) {
        if (ec) {
            ctx->onerror(std::make_exception_ptr(boost::system::system_error(ec)));
        }
    });

    std::exception_ptr error;
    try {
        co_await fn(*ctx, Next{});
        co_await respond(*ctx);
    } catch (...) {
        error = std::current_exception();
    }

    if (error) {
        ctx->onerror(error);
    }
}

App& App::on_error(ErrorListener listener) {
    error_listeners_.push_back(std::move(listener));
    return *this;
}

void App::emit_error(const Error& err, Context* ctx) {
    if (error_listeners_.empty()) {
        onerror(err);
        return;
    }
    for (const auto& listener : error_listeners_) {
        listener(err, ctx);
    }
}

void App::onerror(const Error& err) {
    if (err.status() == 404 || err.expose()) {
        return;
    }
    if (config_.silent) {
        return;
    }

    Logger::instance().log_error("\n" + util::indent(err.to_string()) + "\n");
}

Context* App::current_context() const {
    if (!config_.context_storage) {
        return nullptr;
    }
    return ContextStorage::current();
}

void App::listen(const int port, int num_threads) {
    Logger::instance().configure(config_.log_path);

    if (num_threads <= 0) {
        num_threads = 4;
    }

    auto const address = net::ip::make_address("0.0.0.0");
    auto const endpoint = net::ip::tcp::endpoint{address, static_cast<unsigned short>(port)};

    try {
        // Create and launch listening port
        auto listener = std::make_shared<Listener>(ioc_, endpoint, *this, callback());
        listener->run();
    } catch (const std::exception& e) {
        Logger::instance().log_error(std::string("Could not start listener: ") + e.what());
        Logger::instance().flush();
        throw;
    }

    Logger::instance().info("listening on port " + std::to_string(port) + " (" +
                            std::to_string(num_threads) + " threads, env " + config_.env + ")");

    // (Ctrl+C) to stop cleanly
    net::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](boost::system::error_code const&, int) {
        ioc_.stop();
    });

    // Run the IO Context on n threads
    std::vector<std::thread> v;
    v.reserve(num_threads - 1);
    for (auto i = num_threads - 1; i > 0; --i)
        v.emplace_back([this] {
            ioc_.run();
        });

    // Run on the main thread too
    ioc_.run();

    for (auto& t : v)
        t.join();

    Logger::instance().flush();
}

boost::json::value App::to_json() const {
    return boost::json::object{
        {"subdomainOffset", config_.subdomain_offset},
        {"proxy", config_.proxy},
        {"env", config_.env}
    };
}

} // namespace cascade
