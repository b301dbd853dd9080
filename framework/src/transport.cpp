#include <cascade/transport.h>
#include <cascade/status.h>
#include <cstdio>

namespace cascade {

namespace {

    bool forbids_body(int code) {
        return status::is_empty(code) || (code >= 100 && code < 200);
    }

    std::string chunk_size_line(size_t size) {
        char buf[32];
        const int n = std::snprintf(buf, sizeof(buf), "%zx\r\n", size);
        return std::string(buf, static_cast<size_t>(n));
    }

} // namespace

ServerResponse::ServerResponse(const IncomingMessage& req)
    : ServerResponse(req.http_version_major, req.http_version_minor, req.method == "HEAD") {
}

ServerResponse::ServerResponse(unsigned http_version_major, unsigned http_version_minor, bool head_request)
    : http_version_major_(http_version_major),
      http_version_minor_(http_version_minor),
      head_request_(head_request) {
}

void ServerResponse::send_head(std::string_view first_chunk, bool last) {
    const bool no_body = forbids_body(status_code_);
    const bool has_length = headers_.find(http::field::content_length) != headers_.end();
    const auto te = headers_.find(http::field::transfer_encoding);

    if (te != headers_.end()) {
        chunked_ = te->value().find("chunked") != boost::beast::string_view::npos;
    } else if (!has_length && !no_body) {
        if (last) {
            if (!head_request_) {
                headers_.set(http::field::content_length, std::to_string(first_chunk.size()));
            }
        } else if (http_version_major_ == 1 && http_version_minor_ >= 1) {
            headers_.set(http::field::transfer_encoding, "chunked");
            chunked_ = true;
        } else {
            // HTTP/1.0 without a length is delimited by closing the connection.
            keep_alive_ = false;
        }
    }

    if (headers_.find(http::field::connection) == headers_.end()) {
        headers_.set(http::field::connection, keep_alive_ ? "keep-alive" : "close");
    }

    std::string_view reason = status_message_;
    if (reason.empty()) {
        reason = status::message(status_code_);
    }

    pending_ += "HTTP/" + std::to_string(http_version_major_ > 1 ? 1 : http_version_major_) + "." +
                std::to_string(http_version_major_ > 1 ? 1 : http_version_minor_) + " " +
                std::to_string(status_code_) + " " + std::string(reason) + "\r\n";
    for (const auto& field : headers_) {
        pending_.append(field.name_string().data(), field.name_string().size());
        pending_ += ": ";
        pending_.append(field.value().data(), field.value().size());
        pending_ += "\r\n";
    }
    pending_ += "\r\n";
    headers_sent_ = true;
}

void ServerResponse::append_body(std::string_view chunk) {
    if (head_request_ || forbids_body(status_code_) || chunk.empty()) {
        return;
    }
    if (chunked_) {
        pending_ += chunk_size_line(chunk.size());
        pending_.append(chunk.data(), chunk.size());
        pending_ += "\r\n";
    } else {
        pending_.append(chunk.data(), chunk.size());
    }
}

void ServerResponse::flush_headers() {
    if (!headers_sent_ && writable()) {
        send_head({}, false);
    }
}

void ServerResponse::write(std::string_view chunk) {
    if (!writable()) {
        return;
    }
    if (!headers_sent_) {
        send_head(chunk, false);
    }
    append_body(chunk);
}

void ServerResponse::end(std::string_view chunk) {
    if (!writable()) {
        return;
    }
    if (!headers_sent_) {
        send_head(chunk, true);
    }
    append_body(chunk);
    if (chunked_ && !head_request_ && !forbids_body(status_code_)) {
        pending_ += "0\r\n\r\n";
    }
    ended_ = true;
}

void ServerResponse::on_finished(FinishedHandler handler) {
    if (finished_) {
        handler(finish_error_);
        return;
    }
    finished_handlers_.push_back(std::move(handler));
}

void ServerResponse::finish(const boost::system::error_code& ec) {
    if (finished_) {
        return;
    }
    finished_ = true;
    finish_error_ = ec;
    if (ec) {
        destroyed_ = true;
    }

    auto handlers = std::move(finished_handlers_);
    finished_handlers_.clear();
    for (auto& handler : handlers) {
        handler(ec);
    }
}

} // namespace cascade
