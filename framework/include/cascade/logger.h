#ifndef CASCADE_LOGGER_H
#define CASCADE_LOGGER_H

#include <atomic>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <queue>
#include <string>
#include <string_view>
#include <thread>

namespace cascade {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

/**
 * @brief Process-wide asynchronous logger.
 *
 * Messages are queued by the caller and written by a background worker, so
 * logging never blocks a request on I/O.
 */
class Logger {
private:
    // Destination, guarded by sink_mutex_
    std::mutex sink_mutex_;
    std::ofstream file_stream_;
    bool use_stdout_{true};

    std::atomic<bool> enabled_{true};
    std::atomic<LogLevel> level_{LogLevel::INFO};

    // Async Queue
    std::queue<std::string> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::condition_variable drained_cv_;
    bool busy_{false};
    std::thread worker_;
    std::atomic<bool> running_{true};

    Logger();

    static std::string get_timestamp();
    void process_queue();
    void write_line(const std::string& line, bool is_error);
    void enqueue(std::string msg);

public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    ~Logger();

    /**
     * @brief Selects the destination: "stdout" (or empty), "/dev/null" to
     * disable logging, or a file path opened in append mode.
     */
    void configure(const std::string& path);

    void set_level(LogLevel level) { level_ = level; }
    LogLevel get_level() const { return level_; }

    void log(LogLevel level, std::string_view message);
    void debug(std::string_view message) { log(LogLevel::DEBUG, message); }
    void info(std::string_view message) { log(LogLevel::INFO, message); }
    void warn(std::string_view message) { log(LogLevel::WARN, message); }
    void log_error(const std::string& message);

    void log_access(std::string_view client_ip,
                    std::string_view method,
                    std::string_view path,
                    int status_code,
                    long long response_time_ms);

    /** @brief Blocks until every queued message has been written. */
    void flush();
};

} // namespace cascade

#endif // CASCADE_LOGGER_H
