#include <cascade/util/mime.h>
#include <cascade/util/string.h>

namespace cascade::util {

namespace {

    std::string_view extension_of(std::string_view name) {
        const size_t dot = name.find_last_of('.');
        if (dot == std::string_view::npos) {
            return name;
        }
        return name.substr(dot + 1);
    }

    bool wants_charset(std::string_view mime) {
        return mime.starts_with("text/") ||
               mime == "application/json" ||
               mime == "application/javascript" ||
               mime == "application/xml";
    }

} // namespace

std::string mime_type(std::string_view name) {
    const std::string ext = to_lower(extension_of(name));

    if (ext == "text" || ext == "txt") return "text/plain";
    if (ext == "html" || ext == "htm") return "text/html";
    if (ext == "css") return "text/css";
    if (ext == "csv") return "text/csv";
    if (ext == "js" || ext == "mjs") return "application/javascript";
    if (ext == "json") return "application/json";
    if (ext == "xml") return "application/xml";
    if (ext == "form") return "application/x-www-form-urlencoded";
    if (ext == "bin") return "application/octet-stream";
    if (ext == "pdf") return "application/pdf";
    if (ext == "png") return "image/png";
    if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
    if (ext == "gif") return "image/gif";
    if (ext == "svg") return "image/svg+xml";
    if (ext == "ico") return "image/x-icon";
    if (ext == "webp") return "image/webp";
    if (ext == "woff2") return "font/woff2";
    if (ext == "woff") return "font/woff";
    if (ext == "ttf") return "font/ttf";
    return {};
}

std::string content_type(std::string_view type) {
    std::string mime;
    if (type.find('/') != std::string_view::npos) {
        mime = std::string(type);
    } else {
        mime = mime_type(type);
        if (mime.empty()) {
            return {};
        }
    }

    if (mime.find(';') == std::string::npos && wants_charset(mime)) {
        mime += "; charset=utf-8";
    }
    return mime;
}

} // namespace cascade::util
