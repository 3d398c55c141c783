#ifndef RELAY_EXCEPTIONS_H
#define RELAY_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace relay {

/**
 * @brief Base class for all HTTP-related exceptions in Relay.
 *
 * Thrown from middleware or handlers, it is rendered by App::handle_request
 * with the carried status code.
 */
class HttpError : public std::runtime_error {
    int status_code_;
public:
    HttpError(int status, const std::string& msg)
        : std::runtime_error(msg), status_code_(status) {}

    int status() const { return status_code_; }
};

/** @brief 400 Bad Request */
class BadRequest : public HttpError {
public:
    BadRequest(const std::string& msg = "Bad Request") : HttpError(400, msg) {}
};

/**
 * @brief Raised by fetch() when the backend call does not produce a response.
 */
class UpstreamError : public std::runtime_error {
    std::string url_;
public:
    UpstreamError(const std::string& url, const std::string& msg)
        : std::runtime_error(msg), url_(url) {}

    const std::string& url() const { return url_; }
    virtual const char* kind() const { return "upstream error"; }
};

/** @brief The call did not complete within its deadline. */
class UpstreamTimeout : public UpstreamError {
public:
    using UpstreamError::UpstreamError;
    const char* kind() const override { return "timeout"; }
};

/** @brief Resolve, connect, TLS or protocol failure. */
class UpstreamUnavailable : public UpstreamError {
public:
    using UpstreamError::UpstreamError;
    const char* kind() const override { return "unavailable"; }
};

} // namespace relay

#endif
