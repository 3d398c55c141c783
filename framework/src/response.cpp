#include <relay/response.h>
#include <boost/json/src.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>
#include <sstream>

namespace http = boost::beast::http;

namespace relay {

Response::Response() {
    res_.version(11);
    res_.result(http::status::ok);
    res_.set(http::field::server, "Relay/1.0");
}

Response& Response::status(int code) {
    res_.result(static_cast<unsigned>(code));
    return *this;
}

Response& Response::header(const std::string& key, const std::string& value) {
    res_.set(key, value);
    return *this;
}

Response& Response::send(const std::string& text) {
    res_.body() = text;
    return *this;
}

Response& Response::json(const boost::json::value& data) {
    header("Content-Type", "application/json");
    res_.body() = boost::json::serialize(data);
    return *this;
}

std::string Response::build_response(bool head_only) const {
    auto msg = res_;

    // 1xx, 204 and 304 must not carry a body
    const unsigned code = msg.result_int();
    if ((code >= 100 && code < 200) || code == 204 || code == 304) {
        msg.body().clear();
    }
    msg.prepare_payload();

    std::ostringstream oss;
    if (head_only) {
        oss << msg.base();
    } else {
        oss << msg;
    }
    return oss.str();
}

int Response::get_status() const {
    return static_cast<int>(res_.result_int());
}

std::string Response::get_header(std::string_view key) const {
    auto it = res_.find(boost::beast::string_view(key.data(), key.size()));
    if (it == res_.end()) {
        return "";
    }
    return std::string(it->value().data(), it->value().size());
}

} // namespace relay
