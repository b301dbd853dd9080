#ifndef CASCADE_CONTEXT_H
#define CASCADE_CONTEXT_H

#include <cascade/exceptions.h>
#include <cascade/request.h>
#include <cascade/response.h>
#include <cascade/transport.h>
#include <any>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace cascade {

class App;

/**
 * @brief Untyped key/value bag shared by the middleware of one request.
 */
class State {
public:
    template<typename T>
    void set(const std::string& key, T&& value) {
        values_[key] = std::make_any<std::decay_t<T>>(std::forward<T>(value));
    }

    template<typename T>
    T get(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            throw std::runtime_error("Key not found in request context: " + key);
        }
        return std::any_cast<T>(it->second);
    }

    template<typename T>
    std::optional<T> get_opt(const std::string& key) const {
        const auto it = values_.find(key);
        if (it == values_.end()) return std::nullopt;
        if (const T* value = std::any_cast<T>(&it->second)) {
            return *value;
        }
        return std::nullopt;
    }

    bool has(const std::string& key) const { return values_.count(key) > 0; }
    void erase(const std::string& key) { values_.erase(key); }
    size_t size() const { return values_.size(); }

private:
    std::unordered_map<std::string, std::any> values_;
};

/**
 * @brief Per-request aggregate handed to every middleware.
 *
 * Owns the Request and Response facades and the state bag. The raw message
 * and response are owned by the transport and must outlive the context.
 */
class Context {
private:
    App& app_;
    IncomingMessage& req_;
    ServerResponse& res_;
    Request request_;
    Response response_;
    State state_;
    std::string original_url_;

public:
    Context(App& app, IncomingMessage& req, ServerResponse& res);

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    App& app() const { return app_; }
    IncomingMessage& req() { return req_; }
    ServerResponse& res() { return res_; }
    Request& request() { return request_; }
    const Request& request() const { return request_; }
    Response& response() { return response_; }
    const Response& response() const { return response_; }
    State& state() { return state_; }
    const State& state() const { return state_; }

    const std::string& original_url() const { return original_url_; }

    // Request delegates
    const std::string& method() const { return request_.method(); }
    std::string path() const { return request_.path(); }
    const std::string& url() const { return request_.url(); }
    std::string get(std::string_view field) const { return request_.get(field); }

    // Response delegates
    int status() const { return response_.status(); }
    Context& status(int code) { response_.status(code); return *this; }

    template<typename T>
    Context& body(T&& value) {
        response_.body(std::forward<T>(value));
        return *this;
    }

    Context& set(const std::string& key, const std::string& value) {
        response_.header(key, value);
        return *this;
    }

    bool writable() const { return response_.writable(); }
    bool header_sent() const { return response_.headers_sent(); }

    /**
     * @brief Throws an HttpError. An empty message defaults to the status
     * phrase; 4xx messages are exposed to the client.
     */
    [[noreturn]] void throw_error(int status, const std::string& message = "", HeaderList headers = {});
    [[noreturn]] void throw_error(const std::string& message);

    void assert_that(bool condition, int status, const std::string& message = "");

    /**
     * @brief Default error handler: reports the error to the application and,
     * unless the head is already out, replaces the response with a plain-text
     * error page.
     */
    void onerror(std::exception_ptr error);

    boost::json::value to_json() const;
};

} // namespace cascade

#endif
