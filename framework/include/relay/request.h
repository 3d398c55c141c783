#ifndef RELAY_REQUEST_H
#define RELAY_REQUEST_H

#include <string>
#include <string_view>
#include <unordered_map>
#include <optional>
#include <any>
#include <boost/json.hpp>
#include <boost/beast/http/fields.hpp>

namespace relay {

struct Request {
    std::string method;
    std::string target;   // Raw request target as received: path + query string
    std::string path;     // Target without the query string
    std::string body;
    std::unordered_map<std::string, std::string> params;

    // Owned copy of Beast headers
    boost::beast::http::fields headers;

    void set_target(std::string_view target);
    void set_fields(const boost::beast::http::fields& fields);

    /**
     * @brief Parses the body as JSON.
     * @throws BadRequest if the body is not valid JSON.
     */
    boost::json::value json() const;

    // Empty when absent
    std::string_view get_header(std::string_view key) const;

    template<typename T>
    void set(const std::string& key, T&& value) {
        context_[key] = std::make_any<std::decay_t<T>>(std::forward<T>(value));
    }

    template<typename T>
    std::optional<T> get_opt(const std::string& key) const {
        const auto it = context_.find(key);
        if (it == context_.end()) return std::nullopt;
        if (const T* value = std::any_cast<T>(&it->second)) {
            return *value;
        }
        return std::nullopt;
    }

private:
    std::unordered_map<std::string, std::any> context_;
};

} // namespace relay

#endif
