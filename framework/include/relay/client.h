#ifndef RELAY_CLIENT_H
#define RELAY_CLIENT_H

#include <string>
#include <map>
#include <optional>
#include <algorithm>
#include <cctype>
#include <boost/json.hpp>
#include <boost/asio/awaitable.hpp>

namespace relay {

    struct CaseInsensitiveCompare {
        bool operator()(const std::string& a, const std::string& b) const {
            return std::lexicographical_compare(
                a.begin(), a.end(), b.begin(), b.end(),
                [](unsigned char c1, unsigned char c2) { return std::tolower(c1) < std::tolower(c2); }
            );
        }
    };

    struct FetchResponse {
        int status = 0;
        std::string body;   // Raw body text, never re-encoded

        std::multimap<std::string, std::string, CaseInsensitiveCompare> headers;

        /**
         * @brief Parses the body as JSON.
         * @throws boost::system::system_error if the body is not valid JSON.
         */
        boost::json::value json() const { return boost::json::parse(body); }

        // Get first value
        std::string get_header(const std::string& key) const {
            auto it = headers.find(key);
            if (it != headers.end()) return it->second;
            return "";
        }
    };

    struct ParsedUrl {
        std::string host;
        std::string port;
        std::string target;
        bool is_ssl = false;
    };

    /**
     * @brief Splits an http:// or https:// URL into host, port and request target.
     * A URL without scheme is treated as plain HTTP.
     */
    ParsedUrl parse_url(const std::string& url);

    /**
     * @brief Resolves a Location header against the URL that produced it.
     */
    std::string resolve_url(const std::string& base, const std::string& relative);

    /**
     * @brief Performs an asynchronous HTTP/HTTPS request.
     *
     * The method token is sent as given. Redirects are followed (at most 20);
     * a 303, or a 301/302 answering a POST, continues as a bodyless GET.
     *
     * @param url The full URL
     * @param method HTTP method (GET, POST, etc.)
     * @param headers Custom headers
     * @param body Optional raw body, sent as-is
     * @param timeout_seconds Deadline for the whole exchange (default: 30s)
     * @throws UpstreamTimeout when the deadline expires.
     * @throws UpstreamUnavailable on resolve, connect, TLS or protocol failure.
     */
    boost::asio::awaitable<FetchResponse> fetch(
        std::string url,
        std::string method = "GET",
        std::map<std::string, std::string> headers = {},
        std::optional<std::string> body = std::nullopt,
        int timeout_seconds = 30
    );

} // namespace relay

#endif
