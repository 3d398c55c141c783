#ifndef RELAY_PROXY_H
#define RELAY_PROXY_H

#include <relay/router.h>
#include <relay/client.h>
#include <string>
#include <string_view>

namespace relay {
class App;
}

namespace relay::proxy {

/**
 * @brief Settings shared by every backend-facing handler.
 *
 * Passed by value into the handlers at registration; nothing reads the
 * environment after startup.
 */
struct ProxyConfig {
    std::string backend_url = "http://localhost:8080";   // Used verbatim, no slash normalization
    int timeout_seconds = 30;
    bool legacy_routes_first = false;
    std::string static_dir = "./public";

    /**
     * @brief Reads BACKEND_URL, BACKEND_TIMEOUT_SECONDS, LEGACY_ROUTES_FIRST
     * and STATIC_DIR, falling back to the defaults above.
     * @throws std::invalid_argument on malformed values.
     */
    static ProxyConfig from_env();
};

inline constexpr std::string_view kConnectErrorMessage = "Failed to connect to backend";

/** @brief backend_url followed by the original path and query, unmodified. */
std::string target_url(const ProxyConfig& config, std::string_view original_target);

/** @brief True for POST, PUT, PATCH and DELETE. */
bool method_carries_body(std::string_view method);

/** @brief Case-sensitive "application/json" substring test on a Content-Type value. */
bool is_json_content_type(std::string_view content_type);

/**
 * @brief JSON text forwarded for a body-carrying request: the decoded JSON
 * body re-serialized, or "{}" when the request had none.
 */
std::string encode_body(const Request& req);

/** @brief Copies status and body; Content-Type only when the backend sent JSON. */
void relay_response(const FetchResponse& upstream, Response& res);

/**
 * @brief The generic forwarder.
 *
 * Re-issues the request against the backend and relays status and body.
 * Any failure to obtain a backend response becomes a 500 with a fixed
 * JSON error; the cause is only logged.
 */
class Forwarder {
    ProxyConfig config_;

public:
    explicit Forwarder(ProxyConfig config);

    Async<void> operator()(Request& req, Response& res) const;
};

/** @brief GET /health: 200 {"status":"ok"}, never touches the backend. */
Async<void> health(Request& req, Response& res);

/**
 * @brief Registers the forwarder routes (POST /chat, any method on /chats,
 * /chats/:id and /stats).
 */
void register_forwarder(App& app, const ProxyConfig& config);

/**
 * @brief Registers /health, the forwarder and the legacy handlers.
 *
 * Routes match first-registered-first, so the set registered first owns the
 * overlapping method/path pairs: the forwarder unless legacy_routes_first.
 */
void register_routes(App& app, const ProxyConfig& config);

} // namespace relay::proxy

#endif
