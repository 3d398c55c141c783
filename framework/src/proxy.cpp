#include <relay/proxy.h>
#include <relay/app.h>
#include <relay/environment.h>
#include <relay/exceptions.h>
#include <relay/legacy.h>
#include <relay/logger.h>
#include <relay/middleware.h>

namespace relay::proxy {

ProxyConfig ProxyConfig::from_env() {
    ProxyConfig defaults;
    ProxyConfig config;
    config.backend_url = env<std::string>("BACKEND_URL", defaults.backend_url);
    config.timeout_seconds = env<int>("BACKEND_TIMEOUT_SECONDS", defaults.timeout_seconds);
    config.legacy_routes_first = env<bool>("LEGACY_ROUTES_FIRST", defaults.legacy_routes_first);
    config.static_dir = env<std::string>("STATIC_DIR", defaults.static_dir);

    if (config.timeout_seconds <= 0) {
        throw std::invalid_argument("BACKEND_TIMEOUT_SECONDS must be positive");
    }
    return config;
}

std::string target_url(const ProxyConfig& config, std::string_view original_target) {
    std::string url = config.backend_url;
    url.append(original_target);
    return url;
}

bool method_carries_body(std::string_view method) {
    return method == "POST" || method == "PUT" || method == "PATCH" || method == "DELETE";
}

bool is_json_content_type(std::string_view content_type) {
    return content_type.find("application/json") != std::string_view::npos;
}

std::string encode_body(const Request& req) {
    if (auto body = req.get_opt<boost::json::value>(middleware::kJsonBodyKey)) {
        return boost::json::serialize(*body);
    }
    return "{}";
}

void relay_response(const FetchResponse& upstream, Response& res) {
    res.status(upstream.status);
    if (is_json_content_type(upstream.get_header("Content-Type"))) {
        res.header("Content-Type", "application/json");
    }
    res.send(upstream.body);
}

Forwarder::Forwarder(ProxyConfig config) : config_(std::move(config)) {}

Async<void> Forwarder::operator()(Request& req, Response& res) const {
    const std::string url = target_url(config_, req.target);

    std::optional<std::string> body;
    if (method_carries_body(req.method)) {
        body = encode_body(req);
    }

    const std::string client = req.get_opt<std::string>("client_ip").value_or("unknown");

    FetchResponse upstream;
    bool failed = false;
    try {
        upstream = co_await fetch(url, req.method, {{"Content-Type", "application/json"}}, body, config_.timeout_seconds);
    } catch (const UpstreamError& e) {
        Logger::instance().log_error("Error calling backend for " + client + " (" + e.kind() + "): "
                                     + req.method + " " + e.url() + ": " + e.what());
        failed = true;
    } catch (const std::exception& e) {
        Logger::instance().log_error("Error calling backend for " + client + ": "
                                     + req.method + " " + url + ": " + e.what());
        failed = true;
    }

    if (failed) {
        res.status(500).json({{"error", kConnectErrorMessage}});
        co_return;
    }

    relay_response(upstream, res);
}

Async<void> health(Request&, Response& res) {
    res.json({{"status", "ok"}});
    co_return;
}

void register_forwarder(App& app, const ProxyConfig& config) {
    Forwarder forward(config);
    app.post("/chat", forward);
    app.all("/chats", forward);
    app.all("/chats/:id", forward);
    app.all("/stats", forward);
}

void register_routes(App& app, const ProxyConfig& config) {
    app.get("/health", health);

    if (config.legacy_routes_first) {
        legacy::register_routes(app, config);
        register_forwarder(app, config);
    } else {
        register_forwarder(app, config);
        legacy::register_routes(app, config);
    }
}

} // namespace relay::proxy
