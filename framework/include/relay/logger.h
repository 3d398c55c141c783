#ifndef RELAY_LOGGER_H
#define RELAY_LOGGER_H

#include <fstream>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <queue>
#include <condition_variable>
#include <atomic>

namespace relay {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Process-wide asynchronous logger.
 *
 * Messages are queued by the caller and written by a dedicated worker thread,
 * so logging never blocks a request coroutine on I/O.
 */
class Logger {
private:
    std::ofstream file_stream_;
    std::mutex config_mutex_;
    std::atomic<bool> use_stdout_{true};
    std::atomic<bool> enabled_{true};
    std::atomic<LogLevel> level_{LogLevel::INFO};

    // Async Queue
    std::queue<std::string> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> running_{true};

    Logger();
    ~Logger();

    static std::string get_timestamp();
    void process_queue();
    void enqueue(std::string msg);

public:
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static Logger& instance();

    // "stdout" (default), "/dev/null" to disable, or a file path
    void configure(const std::string& path);

    void set_level(LogLevel level) { level_ = level; }

    void log(LogLevel level, std::string_view message);

    void log_access(std::string_view client_ip,
                    std::string_view method,
                    std::string_view path,
                    int status_code,
                    long long response_time_ms);

    void log_error(const std::string& message);
};

/**
 * @brief Parses "debug", "info", "warn" or "error" (case-insensitive).
 * @throws std::invalid_argument on any other value.
 */
LogLevel parse_log_level(std::string_view name);

} // namespace relay

#endif //RELAY_LOGGER_H
