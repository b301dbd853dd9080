#include <cascade/respond.h>
#include <cascade/context.h>
#include <cascade/status.h>
#include <boost/json/serialize.hpp>

namespace cascade {

namespace {

    Async<void> pipe(ByteStream& stream, ServerResponse& res) {
        while (res.writable()) {
            auto chunk = co_await stream.read();
            if (!chunk) {
                break;
            }
            res.write(*chunk);
            co_await res.flush();
        }
        res.end();
    }

    std::string_view as_chars(const Bytes& bytes) {
        return std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }

} // namespace

Async<void> respond(Context& ctx) {
    Response& response = ctx.response();
    ServerResponse& res = ctx.res();

    if (!response.respond()) {
        co_return;
    }

    if (!ctx.writable()) {
        res.end();
        co_return;
    }

    const int code = response.status();

    if (status::is_empty(code)) {
        response.body(nullptr);
        res.end();
        co_return;
    }

    if (ctx.method() == "HEAD") {
        if (!res.headers_sent() && !response.has("Content-Length")) {
            if (auto length = response.length()) {
                response.length(*length);
            }
        }
        res.end();
        co_return;
    }

    const Body& body = response.body();

    switch (kind_of(body)) {
        case BodyKind::Empty: {
            if (response.explicit_null_body()) {
                response.remove("Content-Type");
                response.remove("Transfer-Encoding");
                response.length(0);
                res.end();
                co_return;
            }

            std::string text = ctx.req().http_version_major >= 2 ? std::string() : response.message();
            if (text.empty()) {
                text = std::to_string(code);
            }
            if (!res.headers_sent()) {
                response.type("text");
                response.length(text.size());
            }
            res.end(text);
            co_return;
        }
        case BodyKind::Text:
            res.end(std::get<std::string>(body));
            co_return;
        case BodyKind::Bytes:
            res.end(as_chars(std::get<Bytes>(body)));
            co_return;
        case BodyKind::Blob: {
            auto stream = std::get<Blob>(body).stream();
            co_await pipe(*stream, res);
            co_return;
        }
        case BodyKind::Stream: {
            StreamPtr stream = std::get<StreamPtr>(body);
            co_await pipe(*stream, res);
            co_return;
        }
        case BodyKind::Structured: {
            const std::string text = boost::json::serialize(std::get<boost::json::value>(body));
            if (!res.headers_sent()) {
                response.length(text.size());
            }
            res.end(text);
            co_return;
        }
    }
}

} // namespace cascade
