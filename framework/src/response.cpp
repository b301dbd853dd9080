#include <cascade/response.h>
#include <cascade/context.h>
#include <cascade/status.h>
#include <cascade/util/mime.h>
#include <cascade/util/string.h>
#include <boost/json/src.hpp>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace cascade {

namespace {

    boost::beast::string_view to_beast(std::string_view sv) {
        return boost::beast::string_view(sv.data(), sv.size());
    }

    bool looks_like_html(const std::string& text) {
        for (char c : text) {
            if (!std::isspace(static_cast<unsigned char>(c))) {
                return c == '<';
            }
        }
        return false;
    }

} // namespace

Response::Response(Context& ctx, ServerResponse& res) : ctx_(ctx), res_(res) {
}

App& Response::app() const {
    return ctx_.app();
}

Request& Response::request() const {
    return ctx_.request();
}

Response& Response::status(int code) {
    if (res_.headers_sent()) {
        return *this;
    }
    if (code < 100 || code > 999) {
        throw std::invalid_argument("invalid status code: " + std::to_string(code));
    }

    explicit_status_ = true;
    res_.set_status_code(code);
    if (res_.http_version_major() < 2) {
        res_.set_status_message(std::string(status::message(code)));
    }
    if (kind_of(body_) != BodyKind::Empty && status::is_empty(code)) {
        body(nullptr);
    }
    return *this;
}

std::string Response::message() const {
    if (!res_.status_message().empty()) {
        return res_.status_message();
    }
    return std::string(status::message(res_.status_code()));
}

Response& Response::message(std::string msg) {
    res_.set_status_message(std::move(msg));
    return *this;
}

Response& Response::body(std::nullptr_t) {
    assign_body(std::monostate{}, true);
    return *this;
}

Response& Response::body(const char* text) {
    if (text == nullptr) {
        return body(nullptr);
    }
    return body(std::string(text));
}

Response& Response::body(std::string text) {
    assign_body(std::move(text), false);
    return *this;
}

Response& Response::body(Bytes bytes) {
    assign_body(std::move(bytes), false);
    return *this;
}

Response& Response::body(Blob blob) {
    assign_body(std::move(blob), false);
    return *this;
}

Response& Response::body(StreamPtr stream) {
    if (!stream) {
        return clear_body();
    }
    assign_body(std::move(stream), false);
    return *this;
}

Response& Response::body(boost::json::value value) {
    assign_body(std::move(value), false);
    return *this;
}

Response& Response::clear_body() {
    assign_body(std::monostate{}, false);
    return *this;
}

void Response::assign_body(Body value, bool explicit_null) {
    Body original = std::move(body_);
    body_ = std::move(value);

    if (kind_of(body_) == BodyKind::Empty) {
        if (!status::is_empty(status())) {
            if (type() == "application/json") {
                body_ = std::string("null");
                return;
            }
            status(204);
        }
        if (explicit_null) {
            explicit_null_body_ = true;
        }
        remove("Content-Type");
        remove("Content-Length");
        remove("Transfer-Encoding");
        return;
    }

    if (!explicit_status_) {
        status(200);
    }

    const bool set_type = !has("Content-Type");

    switch (kind_of(body_)) {
        case BodyKind::Text: {
            const auto& text = std::get<std::string>(body_);
            if (set_type) {
                type(looks_like_html(text) ? "html" : "text");
            }
            length(text.size());
            break;
        }
        case BodyKind::Bytes:
            if (set_type) {
                type("bin");
            }
            length(std::get<Bytes>(body_).size());
            break;
        case BodyKind::Blob: {
            const auto& blob = std::get<Blob>(body_);
            if (set_type) {
                type(blob.type().empty() ? std::string_view("bin") : std::string_view(blob.type()));
            }
            length(blob.size());
            break;
        }
        case BodyKind::Stream: {
            const bool same = kind_of(original) == BodyKind::Stream &&
                              std::get<StreamPtr>(original) == std::get<StreamPtr>(body_);
            if (!same && kind_of(original) != BodyKind::Empty) {
                remove("Content-Length");
            }
            if (set_type) {
                type("bin");
            }
            break;
        }
        case BodyKind::Structured:
            remove("Content-Length");
            type("json");
            break;
        case BodyKind::Empty:
            break;
    }
}

std::optional<size_t> Response::length() const {
    if (has("Content-Length")) {
        const std::string value = get("Content-Length");
        size_t n = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
        if (ec != std::errc() || ptr == value.data()) {
            return std::nullopt;
        }
        return n;
    }

    switch (kind_of(body_)) {
        case BodyKind::Text:
            return std::get<std::string>(body_).size();
        case BodyKind::Bytes:
            return std::get<Bytes>(body_).size();
        case BodyKind::Blob:
            return std::get<Blob>(body_).size();
        case BodyKind::Structured:
            return boost::json::serialize(std::get<boost::json::value>(body_)).size();
        default:
            return std::nullopt;
    }
}

Response& Response::length(size_t n) {
    if (!has("Transfer-Encoding")) {
        header("Content-Length", std::to_string(n));
    }
    return *this;
}

std::string Response::type() const {
    const std::string value = get("Content-Type");
    if (value.empty()) {
        return {};
    }
    return std::string(util::trim(std::string_view(value).substr(0, value.find(';'))));
}

Response& Response::type(std::string_view type) {
    const std::string value = util::content_type(type);
    if (value.empty()) {
        remove("Content-Type");
    } else {
        header("Content-Type", value);
    }
    return *this;
}

Response& Response::header(const std::string& key, const std::string& value) {
    if (!res_.headers_sent()) {
        res_.headers().set(key, value);
    }
    return *this;
}

Response& Response::add_header(const std::string& key, const std::string& value) {
    if (!res_.headers_sent()) {
        res_.headers().insert(key, value);
    }
    return *this;
}

Response& Response::remove(std::string_view key) {
    if (!res_.headers_sent()) {
        res_.headers().erase(to_beast(key));
    }
    return *this;
}

bool Response::has(std::string_view key) const {
    return res_.headers().find(to_beast(key)) != res_.headers().end();
}

std::string Response::get(std::string_view key) const {
    const auto it = res_.headers().find(to_beast(key));
    if (it == res_.headers().end()) {
        return {};
    }
    return std::string(it->value().data(), it->value().size());
}

Response& Response::flush_headers() {
    res_.flush_headers();
    return *this;
}

std::optional<std::chrono::system_clock::time_point> Response::last_modified() const {
    const std::string value = get("Last-Modified");
    if (value.empty()) {
        return std::nullopt;
    }
    return util::parse_http_date(value);
}

Response& Response::last_modified(std::chrono::system_clock::time_point time) {
    return header("Last-Modified", util::format_http_date(time));
}

Response& Response::etag(std::string_view tag) {
    std::string value(tag);
    if (!value.starts_with("\"") && !value.starts_with("W/\"")) {
        value = "\"" + value + "\"";
    }
    return header("ETag", value);
}

Response& Response::redirect(const std::string& url, int code) {
    std::string location = url;
    if (url == "back") {
        location = ctx_.request().get("Referrer");
        if (location.empty()) {
            location = "/";
        }
    }

    header("Location", location);
    status(status::is_redirect(code) ? code : 302);
    type("text");
    return body("Redirecting to " + location + ".");
}

boost::json::value Response::to_json() const {
    boost::json::object header;
    for (const auto& field : res_.headers()) {
        header[util::to_lower(std::string_view(field.name_string().data(), field.name_string().size()))] =
            std::string_view(field.value().data(), field.value().size());
    }
    return boost::json::object{
        {"status", status()},
        {"message", message()},
        {"header", std::move(header)}
    };
}

} // namespace cascade
