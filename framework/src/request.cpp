#include <cascade/request.h>
#include <cascade/app.h>
#include <cascade/context.h>
#include <cascade/util/string.h>
#include <boost/asio/ip/address.hpp>
#include <boost/json.hpp>
#include <algorithm>
#include <charconv>

namespace cascade {

namespace {

    std::string header_value(const http::fields& headers, std::string_view name) {
        const auto it = headers.find(boost::beast::string_view(name.data(), name.size()));
        if (it == headers.end()) {
            return {};
        }
        return std::string(it->value().data(), it->value().size());
    }

    std::string first_of_list(std::string_view value) {
        auto parts = util::split_list(value);
        return parts.empty() ? std::string() : parts.front();
    }

    bool is_ip(const std::string& host) {
        boost::system::error_code ec;
        boost::asio::ip::make_address(host, ec);
        return !ec;
    }

    struct MediaType {
        std::string type;
        std::unordered_map<std::string, std::string> parameters;
    };

    // Strict parse of "type/subtype; key=value"; nullopt when malformed.
    std::optional<MediaType> parse_media_type(std::string_view value) {
        std::vector<std::string_view> pieces;
        size_t pos = 0;
        while (true) {
            const size_t semi = value.find(';', pos);
            pieces.push_back(util::trim(value.substr(pos, semi == std::string_view::npos ? std::string_view::npos : semi - pos)));
            if (semi == std::string_view::npos) break;
            pos = semi + 1;
        }

        MediaType media;
        media.type = util::to_lower(pieces.front());
        const size_t slash = media.type.find('/');
        if (slash == std::string::npos || slash == 0 || slash + 1 == media.type.size()) {
            return std::nullopt;
        }

        for (size_t i = 1; i < pieces.size(); ++i) {
            const std::string_view param = pieces[i];
            const size_t eq = param.find('=');
            if (eq == std::string_view::npos || eq == 0) {
                return std::nullopt;
            }
            std::string_view val = util::trim(param.substr(eq + 1));
            if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
                val = val.substr(1, val.size() - 2);
            }
            media.parameters[util::to_lower(util::trim(param.substr(0, eq)))] = std::string(val);
        }
        return media;
    }

} // namespace

Request::Request(Context& ctx, IncomingMessage& req) : ctx_(ctx), req_(req) {
}

App& Request::app() const {
    return ctx_.app();
}

Response& Request::response() const {
    return ctx_.response();
}

const std::string& Request::original_url() const {
    return ctx_.original_url();
}

std::string Request::path() const {
    const size_t q = req_.url.find('?');
    return req_.url.substr(0, q);
}

void Request::set_path(std::string_view path) {
    const size_t q = req_.url.find('?');
    std::string rest = q == std::string::npos ? std::string() : req_.url.substr(q);
    req_.url = std::string(path) + rest;
}

std::string Request::querystring() const {
    const size_t q = req_.url.find('?');
    if (q == std::string::npos) {
        return {};
    }
    const size_t hash = req_.url.find('#', q);
    return req_.url.substr(q + 1, hash == std::string::npos ? std::string::npos : hash - q - 1);
}

void Request::set_querystring(std::string_view query) {
    std::string url = path();
    if (!query.empty()) {
        url += '?';
        url += query.front() == '?' ? query.substr(1) : query;
    }
    req_.url = std::move(url);
}

std::string Request::search() const {
    std::string qs = querystring();
    return qs.empty() ? qs : "?" + qs;
}

std::unordered_map<std::string, std::string> Request::query() const {
    return util::parse_query(querystring());
}

std::string Request::get(std::string_view field) const {
    if (util::iequals(field, "referer") || util::iequals(field, "referrer")) {
        std::string value = header_value(req_.headers, "referrer");
        return value.empty() ? header_value(req_.headers, "referer") : value;
    }
    return header_value(req_.headers, field);
}

bool Request::has(std::string_view field) const {
    return req_.headers.find(boost::beast::string_view(field.data(), field.size())) != req_.headers.end();
}

std::string Request::protocol() const {
    if (req_.encrypted) {
        return "https";
    }
    if (!app().get_config().proxy) {
        return "http";
    }
    std::string proto = first_of_list(get("X-Forwarded-Proto"));
    return proto.empty() ? "http" : util::to_lower(proto);
}

std::string Request::host() const {
    std::string host;
    if (app().get_config().proxy) {
        host = first_of_list(get("X-Forwarded-Host"));
    }
    if (host.empty()) {
        if (req_.http_version_major >= 2) {
            host = get(":authority");
        }
        if (host.empty()) {
            host = get("Host");
        }
    }
    return host;
}

std::string Request::hostname() const {
    const std::string h = host();
    if (h.empty()) {
        return {};
    }
    if (h.front() == '[') {
        const size_t close = h.find(']');
        return close == std::string::npos ? std::string() : h.substr(0, close + 1);
    }
    return h.substr(0, h.find(':'));
}

std::string Request::origin() const {
    return protocol() + "://" + host();
}

std::string Request::href() const {
    const std::string& original = original_url();
    if (original.starts_with("http://") || original.starts_with("https://")) {
        return original;
    }
    return origin() + original;
}

std::vector<std::string> Request::ips() const {
    const AppConfig& config = app().get_config();
    if (!config.proxy) {
        return {};
    }

    std::vector<std::string> ips = util::split_list(get(config.proxy_ip_header));
    if (config.max_ips_count > 0 && ips.size() > config.max_ips_count) {
        ips.erase(ips.begin(), ips.end() - static_cast<std::ptrdiff_t>(config.max_ips_count));
    }
    return ips;
}

std::string Request::ip() const {
    auto list = ips();
    if (!list.empty()) {
        return list.front();
    }
    return req_.remote_address;
}

std::vector<std::string> Request::subdomains() const {
    const std::string name = hostname();
    if (name.empty() || is_ip(name)) {
        return {};
    }

    std::vector<std::string> labels = util::split_list(name, '.');
    std::reverse(labels.begin(), labels.end());

    const auto offset = static_cast<size_t>(std::max(app().get_config().subdomain_offset, 0));
    if (offset >= labels.size()) {
        return {};
    }
    return std::vector<std::string>(labels.begin() + static_cast<std::ptrdiff_t>(offset), labels.end());
}

std::string Request::charset() const {
    const std::string value = get("Content-Type");
    if (value.empty()) {
        return {};
    }
    auto media = parse_media_type(value);
    if (!media) {
        return {};
    }
    auto it = media->parameters.find("charset");
    return it == media->parameters.end() ? std::string() : it->second;
}

std::string Request::type() const {
    const std::string value = get("Content-Type");
    if (value.empty()) {
        return {};
    }
    return util::to_lower(util::trim(std::string_view(value).substr(0, value.find(';'))));
}

std::optional<size_t> Request::length() const {
    const std::string value = get("Content-Length");
    if (value.empty()) {
        return std::nullopt;
    }
    size_t len = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), len);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    return len;
}

bool Request::idempotent() const {
    static constexpr std::string_view methods[] = {"GET", "HEAD", "PUT", "DELETE", "OPTIONS", "TRACE"};
    return std::find(std::begin(methods), std::end(methods), req_.method) != std::end(methods);
}

boost::json::value Request::to_json() const {
    boost::json::object header;
    for (const auto& field : req_.headers) {
        header[util::to_lower(std::string_view(field.name_string().data(), field.name_string().size()))] =
            std::string_view(field.value().data(), field.value().size());
    }
    return boost::json::object{
        {"method", req_.method},
        {"url", req_.url},
        {"header", std::move(header)}
    };
}

} // namespace cascade
