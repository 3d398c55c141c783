#ifndef RELAY_ROUTER_H
#define RELAY_ROUTER_H

#include <string>
#include <string_view>
#include <vector>
#include <functional>
#include <optional>
#include <unordered_map>
#include <relay/request.h>
#include <relay/response.h>
#include <boost/asio/awaitable.hpp>

namespace relay {

template <typename T = void>
using Async = boost::asio::awaitable<T>;

using Next = std::function<Async<void>()>;
using Middleware = std::function<Async<void>(Request&, Response&, Next)>;
using Handler = std::function<Async<void>(Request&, Response&)>;

struct RouteMatch {
    Handler handler;
    std::unordered_map<std::string, std::string> params;  // {"id": "42"}, percent-decoded
};

/**
 * @brief Ordered route table.
 *
 * Routes are tried in registration order and the first one whose method and
 * path pattern match wins. A route registered with kAnyMethod accepts every
 * method, so it shadows any later route on the same pattern. HEAD requests
 * are also accepted by GET routes.
 */
class Router {
private:
    struct Segment {
        std::string text;   // Literal text, or the parameter name
        bool is_param = false;
    };

    struct Route {
        std::string method;
        std::vector<Segment> pattern;
        Handler handler;
    };

    std::vector<Route> routes_;

    static bool accepts(const Route& route, std::string_view method);
    static std::vector<std::string_view> segments_of(std::string_view path);

public:
    static constexpr std::string_view kAnyMethod = "*";

    void add_route(const std::string& method, const std::string& path, const Handler &handler);

    /**
     * @brief Finds the first route for method and path. The query string, if
     * present, is ignored and a trailing slash is not significant.
     */
    [[nodiscard]] std::optional<RouteMatch> match(std::string_view method, std::string_view path) const;

    size_t size() const { return routes_.size(); }
};

} // namespace relay

#endif
