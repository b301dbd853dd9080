#ifndef CASCADE_RESPONSE_H
#define CASCADE_RESPONSE_H

#include <cascade/body.h>
#include <cascade/transport.h>
#include <boost/json/value.hpp>
#include <boost/json/value_from.hpp>
#include <chrono>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace cascade {

class App;
class Context;
class Request;

/**
 * @brief Settable response state layered over the raw ServerResponse.
 *
 * Status defaults to 404 until set. Setting a body infers status,
 * Content-Type and Content-Length; see body(). Once the transport has sent the
 * head, status and header mutations are ignored.
 */
class Response {
private:
    Context& ctx_;
    ServerResponse& res_;
    Body body_;
    bool explicit_status_ = false;
    bool explicit_null_body_ = false;
    bool respond_ = true;

    void assign_body(Body value, bool explicit_null);

public:
    Response(Context& ctx, ServerResponse& res);

    Response(const Response&) = delete;
    Response& operator=(const Response&) = delete;

    ServerResponse& raw() { return res_; }
    const ServerResponse& raw() const { return res_; }
    Context& ctx() const { return ctx_; }
    App& app() const;
    Request& request() const;

    int status() const { return res_.status_code(); }

    /** @throws std::invalid_argument unless 100 <= code <= 999. */
    Response& status(int code);

    /** @brief Status message, defaulting to the canonical phrase. */
    std::string message() const;
    Response& message(std::string msg);

    const Body& body() const { return body_; }

    /** @brief Explicit null body: strips entity headers, 204 unless status forbids a body. */
    Response& body(std::nullptr_t);
    Response& body(const char* text);
    Response& body(std::string text);
    Response& body(Bytes bytes);
    Response& body(Blob blob);
    Response& body(StreamPtr stream);
    Response& body(boost::json::value value);

    /** @brief Resets the body to absent, as if it had never been set. */
    Response& clear_body();

    Response& send(const std::string& text) { return body(text); }
    Response& json(const boost::json::value& data) { return body(data); }

    // Generic JSON Serializer
    template <typename T>
    Response& json(const T& data) {
        if constexpr (std::is_convertible_v<T, boost::json::value>) {
            return body(static_cast<boost::json::value>(data));
        } else {
            return body(boost::json::value_from(data));
        }
    }

    bool explicit_null_body() const { return explicit_null_body_; }

    /**
     * @brief Content-Length when set, otherwise the body's byte length if it
     * can be known without consuming it.
     */
    std::optional<size_t> length() const;
    Response& length(size_t n);

    /** @brief Content-Type without parameters, empty when unset. */
    std::string type() const;

    /** @brief Accepts a MIME type, a shorthand ("json", "text") or an extension. */
    Response& type(std::string_view type);

    Response& header(const std::string& key, const std::string& value);
    Response& add_header(const std::string& key, const std::string& value);

    Response& headers(std::initializer_list<std::pair<std::string, std::string>> headers) {
        for (const auto& [key, value] : headers) {
            header(key, value);
        }
        return *this;
    }

    Response& remove(std::string_view key);
    bool has(std::string_view key) const;
    std::string get(std::string_view key) const;
    const http::fields& headers() const { return res_.headers(); }

    bool headers_sent() const { return res_.headers_sent(); }
    bool writable() const { return res_.writable(); }
    Response& flush_headers();

    std::optional<std::chrono::system_clock::time_point> last_modified() const;
    Response& last_modified(std::chrono::system_clock::time_point time);

    std::string etag() const { return get("ETag"); }

    /** @brief Sets ETag, quoting the value unless already quoted or weak. */
    Response& etag(std::string_view tag);

    /**
     * @brief Sets Location and a redirect status. Non-redirect codes fall back
     * to 302.
     */
    Response& redirect(const std::string& url, int code = 302);

    /** @brief When false the framework leaves the raw response untouched. */
    bool respond() const { return respond_; }
    Response& respond(bool enabled) { respond_ = enabled; return *this; }

    boost::json::value to_json() const;
};

} // namespace cascade

#endif
