#ifndef RELAY_MIDDLEWARE_H
#define RELAY_MIDDLEWARE_H

#include <relay/router.h>
#include <string>

namespace relay::middleware {

    /**
     * @brief MIME type for a file path, inferred from its extension.
     * Unknown extensions map to application/octet-stream.
     */
    std::string get_mime_type(const std::string& path);

    /**
     * @brief Serves files below root_dir for GET requests.
     *
     * Directory requests resolve to index.html when serve_index is set.
     * Paths escaping the root are refused with 403; anything not found falls
     * through to the next middleware and the routes.
     */
    Middleware static_files(const std::string& root_dir, bool serve_index = true);

    /**
     * @brief Decodes application/json request bodies.
     *
     * Only that exact media type is decoded (case-insensitive, parameters
     * such as charset allowed); "+json" suffix types pass through untouched.
     *
     * The parsed value is stored in the request context under kJsonBodyKey.
     * Invalid JSON, or (in strict mode) a top-level value that is not an
     * object or array, is rejected with BadRequest before any handler runs.
     */
    Middleware json_body(bool strict = true);

    inline constexpr const char* kJsonBodyKey = "json_body";

} // namespace relay::middleware

#endif
