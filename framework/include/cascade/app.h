#ifndef CASCADE_APP_H
#define CASCADE_APP_H

#include <cascade/async.h>
#include <cascade/compose.h>
#include <cascade/context.h>
#include <cascade/exceptions.h>
#include <cascade/logger.h>
#include <cascade/transport.h>
#include <boost/asio/io_context.hpp>
#include <boost/json/value.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace net = boost::asio;

namespace cascade {

using ErrorListener = std::function<void(const Error&, Context*)>;
using Composer = std::function<Middleware(std::vector<Middleware>)>;
using RequestHandler = std::function<Async<void>(IncomingMessage&, ServerResponse&)>;

struct AppConfig {
    std::string env = "development";
    bool proxy = false;                           // trust X-Forwarded-* headers
    int subdomain_offset = 2;
    std::string proxy_ip_header = "X-Forwarded-For";
    size_t max_ips_count = 0;                     // 0 = unlimited
    bool silent = false;                          // suppress the default error reporter
    bool context_storage = false;
    Composer compose;                             // empty = cascade::compose

    size_t max_body_size = 10 * 1024 * 1024;      // 10MB default
    int timeout_seconds = 30;                     // 30s timeout
    std::string log_path = "stdout";              // Logging destination

    /**
     * @brief Defaults overridden by CASCADE_ENV, CASCADE_PROXY, CASCADE_SILENT,
     * CASCADE_LOG_PATH and CASCADE_MAX_BODY_SIZE.
     */
    static AppConfig from_env();
};

/**
 * @brief The application: an ordered middleware list plus the request entry
 * point that runs it.
 *
 * Middleware registered with use() run in registration order on the way down
 * and in reverse order on the way up. callback() compiles the list once and
 * returns the handler the HTTP server calls for every request.
 */
class App {
private:
    AppConfig config_;
    std::vector<Middleware> middleware_;
    std::vector<ErrorListener> error_listeners_;
    net::io_context ioc_;

public:
    explicit App(AppConfig config = AppConfig::from_env());
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /**
     * @brief Access the application configuration.
     */
    AppConfig& config() { return config_; }
    const AppConfig& get_config() const { return config_; }

    App& env(const std::string& name) { config_.env = name; return *this; }
    App& proxy(bool trusted) { config_.proxy = trusted; return *this; }
    App& silent(bool quiet) { config_.silent = quiet; return *this; }
    App& subdomain_offset(int offset) { config_.subdomain_offset = offset; return *this; }
    App& context_storage(bool enabled) { config_.context_storage = enabled; return *this; }
    App& log_to(const std::string& path) { config_.log_path = path; return *this; }
    App& max_body_size(size_t bytes) { config_.max_body_size = bytes; return *this; }

    /**
     * @brief Appends a middleware.
     * @throws std::invalid_argument for an empty function.
     */
    App& use(Middleware fn);

    /**
     * @brief Appends a middleware that never delegates downstream, written
     * as Async<void>(Context&).
     */
    template<typename Func>
    std::enable_if_t<std::is_invocable_r_v<Async<void>, Func&, Context&> &&
                     !std::is_invocable_v<Func&, Context&, Next>, App&>
    use(Func fn) {
        return use(Middleware([fn = std::move(fn)](Context& ctx, Next) mutable {
            return fn(ctx);
        }));
    }

    const std::vector<Middleware>& middleware() const { return middleware_; }

    /**
     * @brief Compiles the middleware list and returns the request handler.
     * Middleware added afterwards needs a new callback().
     */
    RequestHandler callback();

    /** @brief Builds the per-request context. */
    std::shared_ptr<Context> create_context(IncomingMessage& req, ServerResponse& res);

    /**
     * @brief Runs the pipeline for one context, then writes the response.
     * Failures from either step go to Context::onerror.
     */
    Async<void> handle_request(std::shared_ptr<Context> ctx, Middleware fn);

    /** @brief Registers an error observer. */
    App& on_error(ErrorListener listener);
    size_t error_listener_count() const { return error_listeners_.size(); }

    /**
     * @brief Delivers an error to every observer in order, or to the default
     * reporter when there are none.
     */
    void emit_error(const Error& err, Context* ctx);

    /**
     * @brief Default reporter. Skips 404s, exposed errors and silent apps;
     * everything else is written to the log at ERROR level.
     */
    void onerror(const Error& err);

    /**
     * @brief Context of the request running on this task, or nullptr when
     * context storage is disabled or no request is active.
     */
    Context* current_context() const;

    /**
     * @brief Starts the HTTP server on the specified port.
     *
     * @param port The port to listen on.
     * @param num_threads Number of threads for the event loop (0 = 4).
     */
    void listen(int port, int num_threads = 0);

    /** @brief Returns the internal io_context engine. */
    net::io_context& engine() { return ioc_; }

    boost::json::value to_json() const;
};

/**
 * @brief Asynchronously waits for a specified duration.
 * usage: co_await cascade::delay(std::chrono::milliseconds(1000));
 */
Async<void> delay(std::chrono::milliseconds ms);

} // namespace cascade

#endif
