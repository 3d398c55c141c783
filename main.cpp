#include <relay/app.h>
#include <relay/environment.h>
#include <relay/logger.h>
#include <relay/middleware.h>
#include <relay/proxy.h>
#include <exception>
#include <string>

using namespace relay;

int main() {
    constexpr int kPort = 8080;

    try {
        load_env();
        const auto config = proxy::ProxyConfig::from_env();

        App app;
        app.log_to(env<std::string>("LOG_PATH", "stdout"))
           .log_level(parse_log_level(env<std::string>("LOG_LEVEL", "info")));

        // Static assets first, then body decoding for the routes
        app.use(middleware::static_files(config.static_dir));
        app.use(middleware::json_body());

        proxy::register_routes(app, config);

        Logger::instance().configure(app.get_config().log_path);
        Logger::instance().log(LogLevel::INFO, "Relay server running at http://localhost:" + std::to_string(kPort));
        Logger::instance().log(LogLevel::INFO, "Using backend: " + config.backend_url);

        app.listen(kPort);
    } catch (const std::exception& e) {
        Logger::instance().log_error(std::string("Fatal: ") + e.what());
        return 1;
    }

    return 0;
}
