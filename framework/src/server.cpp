#include "server.h"
#include <cascade/logger.h>
#include <cascade/status.h>
#include <boost/asio/redirect_error.hpp>

namespace cascade {

namespace {

    IncomingMessage from_beast(http::request<http::string_body>&& req, std::string remote_address) {
        IncomingMessage msg;
        msg.method = std::string(req.method_string().data(), req.method_string().size());
        msg.url = std::string(req.target().data(), req.target().size());
        msg.http_version_major = req.version() / 10;
        msg.http_version_minor = req.version() % 10;
        msg.headers = static_cast<const http::fields&>(req.base());
        msg.body = std::move(req.body());
        msg.remote_address = std::move(remote_address);
        return msg;
    }

} // namespace

SocketResponse::SocketResponse(beast::tcp_stream& stream, const IncomingMessage& req)
    : ServerResponse(req), stream_(stream) {
}

Async<void> SocketResponse::flush() {
    if (pending_.empty() || destroyed()) {
        co_return;
    }

    std::string out = std::move(pending_);
    pending_.clear();

    boost::system::error_code ec;
    co_await net::async_write(stream_, net::buffer(out), net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        finish(ec);
    }
}

Session::Session(tcp::socket&& socket, App& app, RequestHandler handler)
    : stream_(std::move(socket)), app_(app), handler_(std::move(handler)) {}

void Session::run() {
    net::dispatch(
        stream_.get_executor(),
        beast::bind_front_handler(&Session::do_read, shared_from_this()));
}

void Session::do_read() {
    parser_.emplace();
    parser_->body_limit(app_.get_config().max_body_size);

    stream_.expires_after(std::chrono::seconds(app_.get_config().timeout_seconds));

    http::async_read(stream_, buffer_, *parser_,
        beast::bind_front_handler(&Session::on_read, shared_from_this()));
}

void Session::on_read(beast::error_code ec, const std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    if (ec == http::error::end_of_stream) {
        do_close();
        return;
    }
    if (ec == http::error::body_limit) {
        net::co_spawn(stream_.get_executor(), reject(413), net::detached);
        return;
    }
    if (ec) {
        if (ec != net::error::connection_reset && ec != net::error::eof && ec != beast::error::timeout) {
            Logger::instance().warn("read error: " + ec.message());
        }
        return;
    }

    const bool keep_alive = parser_->get().keep_alive();
    net::co_spawn(
        stream_.get_executor(),
        serve(from_beast(parser_->release(), get_client_ip()), keep_alive),
        net::detached);
}

Async<void> Session::serve(IncomingMessage req, bool keep_alive) {
    auto self = shared_from_this();
    const auto start_time = std::chrono::steady_clock::now();

    SocketResponse res(stream_, req);
    res.set_keep_alive(keep_alive);

    // Disable the read timeout while the application is working.
    stream_.expires_never();

    try {
        co_await handler_(req, res);
        co_await res.flush();
    } catch (const std::exception& e) {
        Logger::instance().log_error(std::string("Unhandled error in request handler: ") + e.what());
        res.complete(net::error::connection_aborted);
    }

    if (!res.finished()) {
        if (res.writable_ended()) {
            res.complete();
        } else {
            Logger::instance().warn(req.method + " " + req.url + " was never ended; closing connection");
            res.complete(net::error::connection_aborted);
        }
    }

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    Logger::instance().log_access(req.remote_address, req.method, req.url, res.status_code(), duration);

    if (res.keep_alive() && !res.destroyed()) {
        do_read();
    } else {
        do_close();
    }
}

Async<void> Session::reject(int status) {
    auto self = shared_from_this();

    IncomingMessage req;
    SocketResponse res(stream_, req);
    res.set_keep_alive(false);
    res.set_status_code(status);
    res.headers().set(http::field::content_type, "text/plain; charset=utf-8");
    res.end(status::message(status));
    co_await res.flush();
    res.complete();

    Logger::instance().log_access(get_client_ip(), "-", "-", status, 0);
    do_close();
}

void Session::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

std::string Session::get_client_ip() {
    beast::error_code ec;
    auto endpoint = stream_.socket().remote_endpoint(ec);
    return ec ? std::string() : endpoint.address().to_string();
}

Listener::Listener(net::io_context& ioc, const tcp::endpoint& endpoint, App& app, RequestHandler handler)
    : ioc_(ioc), acceptor_(ioc), app_(app), handler_(std::move(handler)) {
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);
}

void Listener::run() { do_accept(); }

void Listener::do_accept() {
    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(&Listener::on_accept, shared_from_this()));
}

void Listener::on_accept(const beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec != net::error::bad_descriptor && ec != net::error::invalid_argument) {
            Logger::instance().log_error("accept error: " + ec.message());
        }
    } else {
        std::make_shared<Session>(std::move(socket), app_, handler_)->run();
    }
    do_accept();
}

} // namespace cascade
