#include "server.h"
#include <relay/app.h>
#include <relay/request.h>
#include <relay/response.h>
#include <relay/logger.h>
#include <boost/asio/redirect_error.hpp>
#include <chrono>

namespace relay {

namespace {

    Request from_beast(http::request<http::string_body>&& req) {
        Request relay_req;
        relay_req.method = {req.method_string().data(), req.method_string().size()};
        relay_req.set_target({req.target().data(), req.target().size()});
        relay_req.body = std::move(req.body());
        relay_req.set_fields(req.base());
        return relay_req;
    }

    Async<void> write_and_close(std::shared_ptr<Session> self, std::string payload) {
        auto& stream = self->stream();
        beast::error_code ec;
        co_await net::async_write(stream, net::buffer(payload), net::redirect_error(net::use_awaitable, ec));
        stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    Async<void> handle_session(
        std::shared_ptr<Session> self,
        App& app,
        Request req,
        std::string client_ip,
        bool keep_alive
    ) {
        auto& stream = self->stream();
        std::string response_str;

        try {
            response_str = co_await app.handle_request(req, client_ip, keep_alive);
        } catch (const std::exception& e) {
            Logger::instance().log_error(std::string("Async Handler Error: ") + e.what());
            response_str =
                "HTTP/1.1 500 Internal Server Error\r\n"
                "Content-Type: text/plain\r\n"
                "Content-Length: 21\r\n"
                "Connection: close\r\n\r\n"
                "Internal Server Error";
            keep_alive = false;
        }

        // The read deadline may have elapsed while the handler awaited the backend
        stream.expires_after(std::chrono::seconds(app.get_config().timeout_seconds));

        beast::error_code ec;
        co_await net::async_write(stream, net::buffer(response_str), net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            co_return;
        }

        if (!keep_alive) {
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
            co_return;
        }

        self->do_read();
    }
}

Session::Session(tcp::socket&& socket, App& app)
    : stream_(std::move(socket)), app_(app) {}

void Session::run() {
    net::dispatch(
        stream_.get_executor(),
        beast::bind_front_handler(&Session::do_read, shared_from_this()));
}

void Session::do_read() {
    parser_.emplace();
    parser_->body_limit(app_.get_config().max_body_size);

    stream_.expires_after(
        std::chrono::seconds(app_.get_config().timeout_seconds)
    );

    http::async_read(stream_, buffer_, *parser_,
        beast::bind_front_handler(&Session::on_read, shared_from_this()));
}

void Session::on_read(beast::error_code ec, const std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    if (ec == http::error::end_of_stream) {
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        return;
    }
    if (ec == http::error::body_limit) {
        send_error_response(http::status::payload_too_large, "Request body too large");
        return;
    }
    if (ec) {
        if (ec.category() == http::make_error_code(http::error::bad_target).category()) {
            send_error_response(http::status::bad_request, "Malformed HTTP request");
        } else if (ec != net::error::connection_reset && ec != net::error::eof && ec != beast::error::timeout) {
            Logger::instance().log(LogLevel::WARN, "read error: " + ec.message());
        }
        return;
    }

    stream_.expires_never();

    auto beast_req = parser_->release();
    bool keep_alive = beast_req.keep_alive();

    boost::asio::co_spawn(
        stream_.get_executor(),
        handle_session(
            shared_from_this(),
            app_,
            from_beast(std::move(beast_req)),
            get_client_ip(),
            keep_alive
        ),
        boost::asio::detached
    );
}

std::string Session::get_client_ip() {
    beast::error_code ec;
    auto endpoint = stream_.socket().remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return endpoint.address().to_string();
}

void Session::send_error_response(http::status status, std::string_view message) {
    Response res;
    res.header("Server", app_.get_config().server_name);
    res.status(static_cast<int>(status)).json({{"error", std::string(message)}});
    res.header("Connection", "close");

    stream_.expires_after(std::chrono::seconds(app_.get_config().timeout_seconds));

    boost::asio::co_spawn(
        stream_.get_executor(),
        write_and_close(shared_from_this(), res.build_response()),
        boost::asio::detached
    );
}


Listener::Listener(net::io_context& ioc, const tcp::endpoint &endpoint, App& app)
    : ioc_(ioc), acceptor_(ioc), app_(app) {
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
    if(ec) {
        if (ec == net::error::operation_aborted || ec == net::error::bad_descriptor) {
            return;
        }
        Logger::instance().log(LogLevel::WARN, "accept error: " + ec.message());
    } else {
        std::make_shared<Session>(std::move(socket), app_)->run();
    }
    do_accept();
}

} // namespace relay
