#ifndef CASCADE_REQUEST_H
#define CASCADE_REQUEST_H

#include <cascade/transport.h>
#include <boost/json/value.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cascade {

class App;
class Context;
class Response;

/**
 * @brief Read-mostly view over the raw inbound request.
 *
 * Lives inside its Context; every accessor derives its value from the
 * IncomingMessage on demand.
 */
class Request {
private:
    Context& ctx_;
    IncomingMessage& req_;

public:
    Request(Context& ctx, IncomingMessage& req);

    Request(const Request&) = delete;
    Request& operator=(const Request&) = delete;

    IncomingMessage& raw() { return req_; }
    const IncomingMessage& raw() const { return req_; }
    Context& ctx() const { return ctx_; }
    App& app() const;
    Response& response() const;

    const std::string& method() const { return req_.method; }
    void set_method(std::string method) { req_.method = std::move(method); }

    const std::string& url() const { return req_.url; }
    void set_url(std::string url) { req_.url = std::move(url); }

    const std::string& original_url() const;

    /** @brief Pathname without the query string. */
    std::string path() const;
    void set_path(std::string_view path);

    /** @brief Raw query string without the leading '?'. */
    std::string querystring() const;
    void set_querystring(std::string_view query);

    /** @brief "?" + querystring, or empty. */
    std::string search() const;

    /** @brief Decoded query parameters. */
    std::unordered_map<std::string, std::string> query() const;

    const http::fields& headers() const { return req_.headers; }

    /**
     * @brief Case-insensitive header lookup, empty when absent.
     * "Referer" and "Referrer" are interchangeable.
     */
    std::string get(std::string_view field) const;
    bool has(std::string_view field) const;

    /** @brief "https" for TLS connections or, behind a trusted proxy, X-Forwarded-Proto. */
    std::string protocol() const;
    bool secure() const { return protocol() == "https"; }

    /** @brief Host header including port; X-Forwarded-Host when proxy is trusted. */
    std::string host() const;
    std::string hostname() const;
    std::string origin() const;
    std::string href() const;

    /**
     * @brief Client address chain from the proxy IP header, when proxy is trusted.
     * Limited to the last max_ips_count entries when that is non-zero.
     */
    std::vector<std::string> ips() const;
    std::string ip() const;

    /** @brief Subdomains left of the application's subdomain offset. */
    std::vector<std::string> subdomains() const;

    /** @brief Charset parameter of Content-Type; empty if missing or malformed. */
    std::string charset() const;

    /** @brief Content-Type without parameters. */
    std::string type() const;

    std::optional<size_t> length() const;

    /** @brief GET, HEAD, PUT, DELETE, OPTIONS and TRACE. */
    bool idempotent() const;

    boost::json::value to_json() const;
};

} // namespace cascade

#endif
