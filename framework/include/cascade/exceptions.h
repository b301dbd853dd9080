#ifndef CASCADE_EXCEPTIONS_H
#define CASCADE_EXCEPTIONS_H

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cascade {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Base class for every failure the error boundary reports.
 *
 * Carries the fields the default error response is built from. `status` and
 * `status_code` are independent optional sources for the HTTP status; the
 * boundary prefers `status` and falls back to `status_code`.
 */
class Error : public std::runtime_error {
    std::string name_;
    std::optional<int> status_;
    std::optional<int> status_code_;
    bool expose_ = false;
    HeaderList headers_;
    std::string code_;
    bool header_sent_ = false;

public:
    explicit Error(const std::string& message, std::string name = "Error");

    const std::string& name() const noexcept { return name_; }

    std::optional<int> status() const noexcept { return status_; }
    Error& set_status(int status) { status_ = status; return *this; }

    std::optional<int> status_code() const noexcept { return status_code_; }
    Error& set_status_code(int status) { status_code_ = status; return *this; }

    bool expose() const noexcept { return expose_; }
    Error& set_expose(bool expose) { expose_ = expose; return *this; }

    const HeaderList& headers() const noexcept { return headers_; }
    Error& set_headers(HeaderList headers) { headers_ = std::move(headers); return *this; }
    Error& add_header(std::string name, std::string value) {
        headers_.emplace_back(std::move(name), std::move(value));
        return *this;
    }

    // errno-style name such as "ENOENT", empty when unknown
    const std::string& code() const noexcept { return code_; }
    Error& set_code(std::string code) { code_ = std::move(code); return *this; }

    bool header_sent() const noexcept { return header_sent_; }
    void set_header_sent(bool sent) noexcept { header_sent_ = sent; }

    /** @brief "Name: message", the text the default reporter prints. */
    std::string to_string() const;
};

/**
 * @brief An error carrying an HTTP status. Messages of 4xx errors are exposed
 * to the client by default.
 */
class HttpError : public Error {
public:
    HttpError(int status, const std::string& msg);
    HttpError(int status, const std::string& msg, HeaderList headers);
};

/** @brief 400 Bad Request */
class BadRequest : public HttpError {
public:
    BadRequest(const std::string& msg = "Bad Request") : HttpError(400, msg) {}
};

/** @brief 401 Unauthorized */
class Unauthorized : public HttpError {
public:
    Unauthorized(const std::string& msg = "Unauthorized") : HttpError(401, msg) {}
};

/** @brief 403 Forbidden */
class Forbidden : public HttpError {
public:
    Forbidden(const std::string& msg = "Forbidden") : HttpError(403, msg) {}
};

/** @brief 404 Not Found */
class NotFound : public HttpError {
public:
    NotFound(const std::string& msg = "Not Found") : HttpError(404, msg) {}
};

/** @brief 500 Internal Server Error */
class InternalServerError : public HttpError {
public:
    InternalServerError(const std::string& msg = "Internal Server Error") : HttpError(500, msg) {}
};

/**
 * @brief Raised when a middleware invokes its downstream continuation twice.
 */
class MultipleNextCalls : public Error {
public:
    MultipleNextCalls() : Error("next() called multiple times") {}
};

/**
 * @brief Converts any in-flight exception into an Error.
 *
 * Values that are not exceptions (strings, numbers, JSON values...) become an
 * Error whose message is "non-error thrown: " followed by their JSON form.
 */
Error normalize_error(std::exception_ptr error);

} // namespace cascade

#endif
