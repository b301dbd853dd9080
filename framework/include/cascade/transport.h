#ifndef CASCADE_TRANSPORT_H
#define CASCADE_TRANSPORT_H

#include <cascade/async.h>
#include <boost/beast/http/fields.hpp>
#include <boost/system/error_code.hpp>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace cascade {

namespace http = boost::beast::http;

/**
 * @brief Raw inbound request as delivered by the transport.
 */
struct IncomingMessage {
    std::string method = "GET";
    std::string url = "/";
    unsigned http_version_major = 1;
    unsigned http_version_minor = 1;
    http::fields headers;
    std::string body;
    std::string remote_address;
    bool encrypted = false;
};

/**
 * @brief Invoked once when the response is finished. A non-empty error code
 * means the connection terminated abnormally.
 */
using FinishedHandler = std::function<void(const boost::system::error_code&)>;

/**
 * @brief Raw outbound response handle.
 *
 * Writes are synchronous and buffered: the head and body chunks are appended
 * to an outbound buffer that the transport drains in flush(). Concrete
 * transports implement flush() and report completion through finish().
 */
class ServerResponse {
private:
    int status_code_ = 200;
    std::string status_message_;
    http::fields headers_;
    unsigned http_version_major_;
    unsigned http_version_minor_;
    bool head_request_;
    bool keep_alive_ = true;

    bool headers_sent_ = false;
    bool ended_ = false;
    bool destroyed_ = false;
    bool finished_ = false;
    bool chunked_ = false;
    boost::system::error_code finish_error_;

    std::vector<FinishedHandler> finished_handlers_;

    void send_head(std::string_view first_chunk, bool last);
    void append_body(std::string_view chunk);

protected:
    std::string pending_;

public:
    explicit ServerResponse(const IncomingMessage& req);
    ServerResponse(unsigned http_version_major, unsigned http_version_minor, bool head_request);
    virtual ~ServerResponse() = default;

    ServerResponse(const ServerResponse&) = delete;
    ServerResponse& operator=(const ServerResponse&) = delete;

    int status_code() const { return status_code_; }
    void set_status_code(int code) { status_code_ = code; }

    const std::string& status_message() const { return status_message_; }
    void set_status_message(std::string message) { status_message_ = std::move(message); }

    http::fields& headers() { return headers_; }
    const http::fields& headers() const { return headers_; }

    unsigned http_version_major() const { return http_version_major_; }
    bool head_request() const { return head_request_; }

    bool keep_alive() const { return keep_alive_; }
    void set_keep_alive(bool keep_alive) { keep_alive_ = keep_alive; }

    bool headers_sent() const noexcept { return headers_sent_; }
    bool writable_ended() const noexcept { return ended_; }
    bool destroyed() const noexcept { return destroyed_; }
    bool finished() const noexcept { return finished_; }

    /** @brief True while the response may still be written to. */
    bool writable() const noexcept { return !ended_ && !destroyed_; }

    /** @brief Serializes the head now; headers are frozen afterwards. */
    void flush_headers();

    /**
     * @brief Appends a body chunk, sending the head first. Switches to chunked
     * transfer coding when no Content-Length is known on HTTP/1.1.
     */
    void write(std::string_view chunk);

    /**
     * @brief Ends the response. When the head is still unsent and no length is
     * known, Content-Length is derived from the final chunk.
     */
    void end(std::string_view chunk = {});

    /**
     * @brief Registers a completion observer. Runs immediately when the
     * response has already finished.
     */
    void on_finished(FinishedHandler handler);

    /** @brief Drains the outbound buffer to the peer. */
    virtual Async<void> flush() = 0;

protected:
    /**
     * @brief Marks the response finished and notifies observers in
     * registration order. Called by transports exactly once.
     */
    void finish(const boost::system::error_code& ec = {});
};

} // namespace cascade

#endif
