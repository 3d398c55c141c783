#ifndef RELAY_RESPONSE_H
#define RELAY_RESPONSE_H

#include <string>
#include <string_view>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/json.hpp>

namespace relay {

/**
 * @brief Outgoing HTTP response backed by a Beast message.
 *
 * send() writes the body without touching Content-Type: a response that never
 * sets one is serialized without a Content-Type header.
 */
class Response {
private:
    boost::beast::http::response<boost::beast::http::string_body> res_;

public:
    Response();

    Response& status(int code);
    Response& header(const std::string& key, const std::string& value);

    Response& send(const std::string& text);

    // Boost.JSON overload, sets Content-Type: application/json
    Response& json(const boost::json::value& data);

    /**
     * @brief Serializes status line, headers and body.
     * @param head_only Omit the body (HEAD requests) while keeping Content-Length.
     */
    std::string build_response(bool head_only = false) const;

    int get_status() const;
    std::string get_header(std::string_view key) const;
    const std::string& body() const { return res_.body(); }
};

} // namespace relay

#endif
