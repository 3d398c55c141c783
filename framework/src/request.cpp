#include <relay/request.h>
#include <relay/exceptions.h>

namespace relay {

void Request::set_target(std::string_view raw_target) {
    target = std::string(raw_target);
    path = std::string(raw_target.substr(0, raw_target.find('?')));
}

void Request::set_fields(const boost::beast::http::fields& fields) {
    headers = fields;
}

boost::json::value Request::json() const {
    boost::json::error_code ec;
    boost::json::value val = boost::json::parse(body, ec);
    if (ec) {
        throw BadRequest("Invalid JSON body: " + ec.message());
    }
    return val;
}

std::string_view Request::get_header(std::string_view key) const {
    auto it = headers.find(boost::beast::string_view(key.data(), key.size()));
    if (it != headers.end()) {
        return {it->value().data(), it->value().size()};
    }
    return {};
}

} // namespace relay
