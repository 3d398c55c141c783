#ifndef RELAY_APP_H
#define RELAY_APP_H

#include <relay/router.h>
#include <relay/logger.h>
#include <boost/asio.hpp>
#include <chrono>
#include <string>
#include <vector>

namespace net = boost::asio;

namespace relay {

struct AppConfig {
    size_t max_body_size = 100 * 1024;      // 100KB default
    int timeout_seconds = 30;               // Inbound read timeout
    std::string log_path = "stdout";        // Logging destination
    std::string server_name = "Relay/1.0";
    int num_threads = 4;
};


/**
 * @brief The primary entry point for a Relay application.
 *
 * The App class owns the Boost.Asio engine, the route table and the
 * middleware chain. Every request runs as its own coroutine on the engine.
 */
class App {
private:
    Router router_;
    std::vector<Middleware> middleware_;
    AppConfig config_;
    net::io_context ioc_;   // Declared last: pending coroutines are destroyed first

public:
    App();
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    const AppConfig& get_config() const { return config_; }

    App& log_to(const std::string& path) { config_.log_path = path; return *this; }
    App& log_level(LogLevel level) { Logger::instance().set_level(level); return *this; }
    App& max_body_size(size_t bytes) { config_.max_body_size = bytes; return *this; }
    App& timeout(int seconds) { config_.timeout_seconds = seconds; return *this; }

    /**
     * @brief Registers a GET route.
     *
     * @param path The URL path (e.g., "/chats/:id").
     * @param handler The coroutine handler.
     */
    void get(const std::string& path, const Handler& handler) { router_.add_route("GET", path, handler); }

    /** @brief Registers a POST route. */
    void post(const std::string& path, const Handler& handler) { router_.add_route("POST", path, handler); }

    /** @brief Registers a DELETE route. */
    void del(const std::string& path, const Handler& handler) { router_.add_route("DELETE", path, handler); }

    /** @brief Registers a route matching every method. */
    void all(const std::string& path, const Handler& handler) {
        router_.add_route(std::string(Router::kAnyMethod), path, handler);
    }

    /**
     * @brief Registers global middleware. Middleware runs in registration
     * order, before route handlers, for every request.
     */
    void use(const Middleware &mw);

    /**
     * @brief Starts the HTTP server on the specified port and blocks until stop().
     *
     * @param port The port to listen on.
     * @param num_threads Number of threads for the event loop (0 = config value).
     */
    void listen(int port, int num_threads = 0);

    /** @brief Stops the event loop; listen() returns once handlers unwind. */
    void stop();

    Async<std::string> handle_request(Request& req, const std::string& client_ip, bool keep_alive);

private:
    Async<void> run_middleware(size_t index, Request& req, Response& res, const Handler& final_handler);
};

    /**
     * @brief Asynchronously waits for a specified duration.
     * usage: co_await relay::delay(std::chrono::milliseconds(1000));
     */
    Async<void> delay(std::chrono::milliseconds ms);

} // namespace relay

#endif
