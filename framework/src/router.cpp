#include <relay/router.h>
#include <relay/util/string.h>

namespace relay {

std::vector<std::string_view> Router::segments_of(std::string_view path) {
    path = path.substr(0, path.find('?'));

    std::vector<std::string_view> segments;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string_view::npos) slash = path.size();
        if (slash > pos) {
            segments.push_back(path.substr(pos, slash - pos));
        }
        pos = slash + 1;
    }
    return segments;
}

void Router::add_route(const std::string& method, const std::string& path, const Handler &handler) {
    Route route{method, {}, handler};
    for (auto seg : segments_of(path)) {
        if (seg.front() == ':') {
            route.pattern.push_back({std::string(seg.substr(1)), true});
        } else {
            route.pattern.push_back({std::string(seg), false});
        }
    }
    routes_.push_back(std::move(route));
}

bool Router::accepts(const Route& route, std::string_view method) {
    if (route.method == kAnyMethod || route.method == method) return true;
    return method == "HEAD" && route.method == "GET";
}

std::optional<RouteMatch> Router::match(std::string_view method, std::string_view path) const {
    const auto request = segments_of(path);

    for (const auto& route : routes_) {
        if (!accepts(route, method) || route.pattern.size() != request.size()) continue;

        RouteMatch found{route.handler, {}};
        bool ok = true;
        for (size_t i = 0; ok && i < request.size(); ++i) {
            const Segment& seg = route.pattern[i];
            if (seg.is_param) {
                found.params[seg.text] = util::percent_decode(request[i]);
            } else {
                ok = seg.text == request[i];
            }
        }
        if (ok) return found;
    }

    return std::nullopt;
}

} // namespace relay
