#ifndef CASCADE_SERVER_H
#define CASCADE_SERVER_H

#include <cascade/app.h>
#include <cascade/transport.h>
#include <boost/beast/core.hpp>         // buffer, tcp_stream
#include <boost/beast/http.hpp>         // request, response, parsing
#include <boost/asio/ip/tcp.hpp>        // sockets, acceptor
#include <boost/asio.hpp>               // io_context
#include <memory>
#include <optional>

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace cascade {

// ServerResponse writing to a TCP stream
class SocketResponse : public ServerResponse {
    beast::tcp_stream& stream_;

public:
    SocketResponse(beast::tcp_stream& stream, const IncomingMessage& req);

    Async<void> flush() override;

    // Reports the outcome to the finished observers once the exchange is over.
    void complete(const boost::system::error_code& ec = {}) { finish(ec); }
};

// Handles HTTP server connection
class Session : public std::enable_shared_from_this<Session> {
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    App& app_;
    RequestHandler handler_;

public:
    Session(tcp::socket&& socket, App& app, RequestHandler handler);

    void run();
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

private:
    Async<void> serve(IncomingMessage req, bool keep_alive);
    Async<void> reject(int status);
    void do_close();
    std::string get_client_ip();
};

// Accepts incoming connections and launches the sessions
class Listener : public std::enable_shared_from_this<Listener> {
    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    App& app_;
    RequestHandler handler_;

public:
    Listener(net::io_context& ioc, const tcp::endpoint& endpoint, App& app, RequestHandler handler);
    void run();
    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);
};

} // namespace cascade

#endif
