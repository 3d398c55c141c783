#include <relay/legacy.h>
#include <relay/app.h>
#include <relay/logger.h>
#include <relay/util/string.h>

namespace relay::legacy {

namespace {

    // Fetches path from the backend and re-emits the parsed JSON with status 200
    Async<void> relay_json(const proxy::ProxyConfig& config, std::string method,
                           std::string path, std::string_view error_message, Response& res) {
        boost::json::value data;
        bool failed = false;
        try {
            auto upstream = co_await fetch(config.backend_url + path, method, {}, std::nullopt,
                                           config.timeout_seconds);
            data = upstream.json();
        } catch (const std::exception& e) {
            Logger::instance().log_error(std::string(error_message) + ": " + method + " " + path + ": " + e.what());
            failed = true;
        }

        if (failed) {
            res.status(500).json({{"error", error_message}});
            co_return;
        }

        res.json(data);
    }

} // namespace

Handler list_chats(const proxy::ProxyConfig& config) {
    return [config](Request&, Response& res) -> Async<void> {
        co_await relay_json(config, "GET", "/chats", "Failed to fetch chats", res);
    };
}

Handler get_chat(const proxy::ProxyConfig& config) {
    return [config](Request& req, Response& res) -> Async<void> {
        co_await relay_json(config, "GET", "/chats/" + util::encode_path(req.params["id"]), "Failed to fetch chat", res);
    };
}

Handler delete_chat(const proxy::ProxyConfig& config) {
    return [config](Request& req, Response& res) -> Async<void> {
        co_await relay_json(config, "DELETE", "/chats/" + util::encode_path(req.params["id"]), "Failed to delete chat", res);
    };
}

Handler clear_chats(const proxy::ProxyConfig& config) {
    return [config](Request&, Response& res) -> Async<void> {
        co_await relay_json(config, "DELETE", "/chats", "Failed to clear chats", res);
    };
}

void register_routes(App& app, const proxy::ProxyConfig& config) {
    app.get("/chats", list_chats(config));
    app.get("/chats/:id", get_chat(config));
    app.del("/chats/:id", delete_chat(config));
    app.del("/chats", clear_chats(config));
}

} // namespace relay::legacy
