#include <cascade/context.h>
#include <cascade/app.h>
#include <cascade/status.h>

namespace cascade {

Context::Context(App& app, IncomingMessage& req, ServerResponse& res)
    : app_(app),
      req_(req),
      res_(res),
      request_(*this, req),
      response_(*this, res),
      original_url_(req.url) {
}

void Context::throw_error(int status, const std::string& message, HeaderList headers) {
    throw HttpError(status, message, std::move(headers));
}

void Context::throw_error(const std::string& message) {
    throw HttpError(500, message);
}

void Context::assert_that(bool condition, int status, const std::string& message) {
    if (!condition) {
        throw_error(status, message);
    }
}

void Context::onerror(std::exception_ptr error) {
    if (!error) {
        return;
    }

    Error err = normalize_error(error);

    bool headers_sent = false;
    if (header_sent() || !writable()) {
        headers_sent = true;
        err.set_header_sent(true);
    }

    app_.emit_error(err, this);

    if (headers_sent) {
        return;
    }

    res_.headers().clear();
    for (const auto& [name, value] : err.headers()) {
        response_.add_header(name, value);
    }
    response_.type("text");

    int code = err.status().value_or(err.status_code().value_or(0));
    if (err.code() == "ENOENT") {
        code = 404;
    }
    if (!status::is_valid(code)) {
        code = 500;
    }

    const bool client_visible = err.expose() && code >= 400 && code < 600;
    const std::string message = client_visible ? std::string(err.what()) : std::string(status::message(code));

    response_.status(code);
    response_.length(message.size());
    res_.end(message);
}

boost::json::value Context::to_json() const {
    return boost::json::object{
        {"request", request_.to_json()},
        {"response", response_.to_json()},
        {"app", app_.to_json()},
        {"originalUrl", original_url_}
    };
}

} // namespace cascade
