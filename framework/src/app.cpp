#include <relay/app.h>
#include <relay/exceptions.h>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>
#include "server.h"

namespace relay {

App::App() {
}

App::~App() {
    if(!ioc_.stopped()) {
        ioc_.stop();
    }
}

Async<void> delay(std::chrono::milliseconds ms) {
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer timer(executor, ms);
    co_await timer.async_wait(boost::asio::use_awaitable);
}

Async<void> App::run_middleware(size_t index, Request& req, Response& res, const Handler& final_handler) {
    if (index < middleware_.size()) {
        const auto& mw = middleware_[index];
        co_await mw(req, res, [this, index, &req, &res, &final_handler]() -> Async<void> {
            co_await run_middleware(index + 1, req, res, final_handler);
        });
    } else {
        co_await final_handler(req, res);
    }
}

Async<std::string> App::handle_request(Request& req, const std::string& client_ip, const bool keep_alive) {
    const auto start_time = std::chrono::steady_clock::now();
    Response res;
    res.header("Server", config_.server_name);
    int status_code = 500;

    try {
        req.set("client_ip", client_ip);
        auto match = router_.match(req.method, req.path);

        Handler handler;
        if (match.has_value()) {
            req.params = std::move(match->params);
            handler = std::move(match->handler);
        } else {
            handler = [](Request&, Response& res) -> Async<void> {
                res.status(404).send("404 Not Found\n");
                co_return;
            };
        }

        // Run the chain
        co_await run_middleware(0, req, res, handler);

        status_code = res.get_status();

    } catch (const HttpError& e) {
        res = Response();
        res.header("Server", config_.server_name);
        res.status(e.status()).json({
            {"error", "HTTP Error"},
            {"message", e.what()}
        });
        status_code = e.status();
    } catch (const std::exception& e) {
        res = Response();
        res.header("Server", config_.server_name);
        res.status(500).json({
            {"error", "Internal Server Error"},
            {"message", e.what()}
        });
        status_code = 500;
        Logger::instance().log_error(std::string("Exception in handle_request: ") + e.what());
    }

    if (keep_alive) {
        res.header("Connection", "keep-alive");
    } else {
        res.header("Connection", "close");
    }

    const auto end_time = std::chrono::steady_clock::now();
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    Logger::instance().log_access(client_ip, req.method, req.path, status_code, duration);

    co_return res.build_response(req.method == "HEAD");
}

void App::listen(const int port, int num_threads) {
    Logger::instance().configure(config_.log_path);

    if (num_threads <= 0) {
        num_threads = config_.num_threads > 0 ? config_.num_threads : 4;
    }

    auto const address = net::ip::make_address("0.0.0.0");
    auto const endpoint = net::ip::tcp::endpoint{address, static_cast<unsigned short>(port)};

    // Throws if the port cannot be bound
    auto listener = std::make_shared<Listener>(ioc_, endpoint, *this);
    listener->run();

    // (Ctrl+C) to stop cleanly
    net::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](boost::system::error_code const& ec, int) {
        if (!ec) {
            ioc_.stop();
        }
    });

    // Run the IO Context on n threads
    std::vector<std::thread> v;
    v.reserve(num_threads - 1);
    for(auto i = num_threads - 1; i > 0; --i)
        v.emplace_back([this]{
            ioc_.run();
        });

    // Run on the main thread too
    ioc_.run();

    for(auto& t : v)
        if(t.joinable()) t.join();
}

void App::stop() {
    ioc_.stop();
}

void App::use(const Middleware &mw) {
    middleware_.push_back(mw);
}

} // namespace relay
