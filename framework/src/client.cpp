#include <relay/client.h>
#include <relay/exceptions.h>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace relay {

    namespace {

        constexpr int kMaxRedirects = 20;

        using Clock = std::chrono::steady_clock;
        using RawResponse = http::response<http::string_body>;

        // Static context for performance
        ssl::context& get_client_ssl_ctx() {
            static ssl::context ctx = [] {
                ssl::context c{ssl::context::tlsv12_client};
                c.set_default_verify_paths();
                c.set_verify_mode(ssl::verify_peer);
                return c;
            }();
            return ctx;
        }

        bool is_redirect(unsigned code) {
            return code == 301 || code == 302 || code == 303 || code == 307 || code == 308;
        }

        template <typename Stream>
        net::awaitable<RawResponse> exchange(Stream& stream, http::request<http::string_body>& req, bool head) {
            co_await http::async_write(stream, req, net::use_awaitable);

            beast::flat_buffer buffer;
            http::response_parser<http::string_body> parser;
            parser.skip(head);
            parser.body_limit((std::numeric_limits<std::uint64_t>::max)());

            co_await http::async_read(stream, buffer, parser, net::use_awaitable);
            co_return parser.release();
        }

        // Shared with the resolver thread, which may finish after the deadline
        struct PendingResolve {
            tcp::resolver resolver;
            net::steady_timer wakeup;
            tcp::resolver::results_type results;
            beast::error_code ec;
            bool done = false;

            explicit PendingResolve(const net::any_io_executor& executor)
                : resolver(executor), wakeup(executor) {}
        };

        net::awaitable<tcp::resolver::results_type> resolve(
            const net::any_io_executor& executor,
            const ParsedUrl& parsed,
            Clock::time_point deadline
        ) {
            auto pending = std::make_shared<PendingResolve>(executor);
            pending->wakeup.expires_at(deadline);

            pending->resolver.async_resolve(parsed.host, parsed.port,
                [pending](beast::error_code ec, tcp::resolver::results_type results) {
                    pending->ec = ec;
                    pending->results = std::move(results);
                    pending->done = true;
                    pending->wakeup.cancel();
                });

            beast::error_code wait_ec;
            co_await pending->wakeup.async_wait(net::redirect_error(net::use_awaitable, wait_ec));

            if (!pending->done) {
                throw boost::system::system_error(beast::error::timeout);
            }
            if (pending->ec) {
                throw boost::system::system_error(pending->ec);
            }
            co_return pending->results;
        }

        net::awaitable<RawResponse> fetch_once(
            const ParsedUrl& parsed,
            const std::string& method,
            const std::map<std::string, std::string>& headers,
            const std::optional<std::string>& body,
            Clock::time_point deadline
        ) {
            auto executor = co_await net::this_coro::executor;
            auto const results = co_await resolve(executor, parsed, deadline);

            const bool default_port = (parsed.is_ssl && parsed.port == "443") || (!parsed.is_ssl && parsed.port == "80");

            http::request<http::string_body> req;
            req.method_string(method);
            req.target(parsed.target);
            req.version(11);
            req.set(http::field::host, default_port ? parsed.host : parsed.host + ":" + parsed.port);
            req.set(http::field::user_agent, "Relay/1.0");
            req.set(http::field::accept, "*/*");
            req.set(http::field::connection, "close");

            for (auto const& [k, v] : headers) {
                req.set(k, v);
            }

            if (body.has_value()) {
                req.body() = *body;
                req.prepare_payload();
            }

            const bool head = (method == "HEAD");

            if (parsed.is_ssl) {
                beast::ssl_stream<beast::tcp_stream> stream(executor, get_client_ssl_ctx());
                beast::get_lowest_layer(stream).expires_at(deadline);

                if(! SSL_set_tlsext_host_name(stream.native_handle(), parsed.host.c_str()))
                    throw boost::system::system_error(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
                stream.set_verify_callback(ssl::host_name_verification(parsed.host));

                co_await beast::get_lowest_layer(stream).async_connect(results, net::use_awaitable);
                co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

                RawResponse res = co_await exchange(stream, req, head);

                // Best effort: the response is complete, a dirty close is irrelevant
                beast::error_code ec;
                co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
                co_return res;
            }

            beast::tcp_stream stream(executor);
            stream.expires_at(deadline);

            co_await stream.async_connect(results, net::use_awaitable);
            RawResponse res = co_await exchange(stream, req, head);

            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
            co_return res;
        }

    } // namespace

    ParsedUrl parse_url(const std::string& url) {
        ParsedUrl res;
        std::string s = url;

        if (s.rfind("https://", 0) == 0) {
            res.is_ssl = true;
            res.port = "443";
            s.erase(0, 8);
        } else if (s.rfind("http://", 0) == 0) {
            res.is_ssl = false;
            res.port = "80";
            s.erase(0, 7);
        } else {
            res.is_ssl = false;
            res.port = "80";
        }

        size_t path_pos = s.find_first_of("/?");
        if (path_pos == std::string::npos) {
            res.host = s;
            res.target = "/";
        } else {
            res.host = s.substr(0, path_pos);
            res.target = s.substr(path_pos);
            if (res.target.front() == '?') {
                res.target.insert(0, "/");
            }
        }

        size_t port_pos = res.host.find(':');
        if (port_pos != std::string::npos) {
            res.port = res.host.substr(port_pos + 1);
            res.host = res.host.substr(0, port_pos);
        }

        return res;
    }

    std::string resolve_url(const std::string& base, const std::string& relative) {
        if (relative.rfind("http://", 0) == 0 || relative.rfind("https://", 0) == 0) {
            return relative;
        }
        auto b = parse_url(base);
        std::string proto = b.is_ssl ? "https://" : "http://";
        std::string port_str = (b.port == "80" || b.port == "443") ? "" : ":" + b.port;

        if (!relative.empty() && relative[0] == '/') {
            return proto + b.host + port_str + relative;
        }

        std::string base_path = b.target.substr(0, b.target.find('?'));
        size_t last_slash = base_path.find_last_of('/');
        return proto + b.host + port_str + base_path.substr(0, last_slash + 1) + relative;
    }

    boost::asio::awaitable<FetchResponse> fetch(
        std::string url,
        std::string method,
        std::map<std::string, std::string> headers,
        std::optional<std::string> body,
        int timeout_seconds
    ) {
        const auto deadline = Clock::now() + std::chrono::seconds(timeout_seconds);
        std::string current_url = url;
        int redirects = 0;

        while (true) {
            auto parsed = parse_url(current_url);
            if (parsed.host.empty()) {
                throw UpstreamUnavailable(current_url, "Invalid URL: missing host");
            }

            RawResponse res_msg;
            try {
                res_msg = co_await fetch_once(parsed, method, headers, body, deadline);
            } catch (const boost::system::system_error& e) {
                if (e.code() == beast::error::timeout || e.code() == net::error::timed_out) {
                    throw UpstreamTimeout(current_url, "No response within " + std::to_string(timeout_seconds) + "s");
                }
                throw UpstreamUnavailable(current_url, e.code().message());
            }

            const unsigned code = res_msg.result_int();
            if (is_redirect(code)) {
                auto it = res_msg.find(http::field::location);
                if (it != res_msg.end()) {
                    if (++redirects > kMaxRedirects) {
                        throw UpstreamUnavailable(url, "Too many redirects");
                    }
                    current_url = resolve_url(current_url, std::string(it->value().data(), it->value().size()));
                    if (code == 303 || ((code == 301 || code == 302) && method == "POST")) {
                        method = "GET";
                        body.reset();
                    }
                    continue;
                }
            }

            FetchResponse response;
            response.status = static_cast<int>(code);
            response.body = std::move(res_msg.body());

            for (auto const& field : res_msg) {
                response.headers.insert({
                    std::string(field.name_string().data(), field.name_string().size()),
                    std::string(field.value().data(), field.value().size())
                });
            }

            co_return response;
        }
    }

} // namespace relay
