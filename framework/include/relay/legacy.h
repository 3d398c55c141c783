#ifndef RELAY_LEGACY_H
#define RELAY_LEGACY_H

#include <relay/proxy.h>

namespace relay {
class App;
}

namespace relay::legacy {

/*
 * Path-specific chat handlers. Each issues its own backend call with no
 * headers, query or body, re-parses the backend body as JSON and answers 200
 * with it. The :id parameter is re-encoded for the outbound path. The backend
 * status is not preserved; any failure (including a non-JSON body) becomes a
 * 500 carrying the route's own error message.
 */

Handler list_chats(const proxy::ProxyConfig& config);   // GET /chats
Handler get_chat(const proxy::ProxyConfig& config);     // GET /chats/:id
Handler delete_chat(const proxy::ProxyConfig& config);  // DELETE /chats/:id
Handler clear_chats(const proxy::ProxyConfig& config);  // DELETE /chats

void register_routes(App& app, const proxy::ProxyConfig& config);

} // namespace relay::legacy

#endif
