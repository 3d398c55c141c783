#include <relay/middleware.h>
#include <relay/exceptions.h>
#include <relay/util/string.h>
#include <filesystem>
#include <fstream>
#include <memory>

namespace relay::middleware {

namespace fs = std::filesystem;

std::string get_mime_type(const std::string& path) {
    auto ends_with = [](std::string_view str, std::string_view suffix) {
        return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
    };

    if (ends_with(path, ".html") || ends_with(path, ".htm")) return "text/html";
    if (ends_with(path, ".css")) return "text/css";
    if (ends_with(path, ".js") || ends_with(path, ".mjs")) return "application/javascript";
    if (ends_with(path, ".json")) return "application/json";
    if (ends_with(path, ".png")) return "image/png";
    if (ends_with(path, ".jpg") || ends_with(path, ".jpeg")) return "image/jpeg";
    if (ends_with(path, ".gif")) return "image/gif";
    if (ends_with(path, ".svg")) return "image/svg+xml";
    if (ends_with(path, ".ico")) return "image/x-icon";
    if (ends_with(path, ".webp")) return "image/webp";
    if (ends_with(path, ".woff2")) return "font/woff2";
    if (ends_with(path, ".woff")) return "font/woff";
    if (ends_with(path, ".ttf")) return "font/ttf";
    if (ends_with(path, ".txt")) return "text/plain";
    if (ends_with(path, ".map")) return "application/json";
    return "application/octet-stream";
}

Middleware static_files(const std::string& root_dir, bool serve_index) {
    std::error_code root_ec;
    fs::path abs_root = fs::canonical(root_dir, root_ec);
    if (root_ec) {
        abs_root = fs::absolute(root_dir);
    }

    return [abs_root, serve_index](Request& req, Response& res, Next next) -> Async<void> {
        if (req.method != "GET" && req.method != "HEAD") {
            co_await next();
            co_return;
        }

        std::string decoded_path = util::percent_decode(req.path);
        fs::path requested_path = abs_root / decoded_path.substr(decoded_path.empty() ? 0 : 1);

        std::error_code ec;
        fs::path canonical_path = fs::canonical(requested_path, ec);

        if (ec) {
            co_await next();
            co_return;
        }

        // Path Traversal Check: canonical path must stay below abs_root
        const std::string p_str = canonical_path.string();
        const std::string r_str = abs_root.string();
        const bool inside = p_str.compare(0, r_str.length(), r_str) == 0 &&
                            (p_str.size() == r_str.size() || p_str[r_str.size()] == '/' || r_str.back() == '/');
        if (!inside) {
            res.status(403).json({{"error", "Forbidden"}, {"message", "Access Denied"}});
            co_return;
        }

        if (fs::is_directory(canonical_path, ec)) {
            if (!serve_index) {
                co_await next();
                co_return;
            }
            canonical_path /= "index.html";
            if (!fs::is_regular_file(canonical_path, ec)) {
                co_await next();
                co_return;
            }
        }

        std::string file_real_path = canonical_path.string();
        std::ifstream file(file_real_path, std::ios::binary | std::ios::ate);
        if (!file.is_open()) {
            co_await next();
            co_return;
        }

        std::streamsize size = file.tellg();
        file.seekg(0, std::ios::beg);

        std::string content;
        if (size > 0) {
            content.resize(static_cast<size_t>(size));
            if (!file.read(content.data(), size)) {
                co_await next();
                co_return;
            }
        }

        res.header("Content-Type", get_mime_type(file_real_path));
        res.send(content);
        co_return;
    };
}

Middleware json_body(bool strict) {
    return [strict](Request& req, Response& res, Next next) -> Async<void> {
        if (!req.body.empty() && util::media_type(req.get_header("Content-Type")) == "application/json") {
            boost::json::value parsed = req.json();
            if (strict && !parsed.is_object() && !parsed.is_array()) {
                throw BadRequest("JSON body must be an object or array");
            }
            req.set(kJsonBodyKey, std::move(parsed));
        }

        co_await next();
    };
}

} // namespace relay::middleware
