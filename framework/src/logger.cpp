#include <cascade/logger.h>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <iostream>
#include <filesystem>

namespace cascade {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    worker_ = std::thread(&Logger::process_queue, this);
}

Logger::~Logger() {
    running_ = false;
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
}

std::string Logger::get_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto now_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};

    localtime_r(&now_time_t, &tm_buf);

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

void Logger::process_queue() {
    while (true) {
        std::string msg;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            busy_ = false;
            if (queue_.empty()) {
                drained_cv_.notify_all();
            }
            cv_.wait(lock, [this] { return !queue_.empty() || !running_; });

            if (queue_.empty() && !running_) {
                break;
            }

            msg = std::move(queue_.front());
            queue_.pop();
            busy_ = true;
        }

        std::stringstream output;
        output << "[" << get_timestamp() << "] " << msg << "\n";
        write_line(output.str(), msg.starts_with("ERROR"));
    }
}

void Logger::write_line(const std::string& line, bool is_error) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (use_stdout_) {
        if (is_error) {
            std::cerr << line;
        } else {
            std::cout << line;
        }
    } else if (file_stream_.is_open()) {
        file_stream_ << line;
        if (is_error) {
            file_stream_.flush();
        }
    }
}

void Logger::enqueue(std::string msg) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push(std::move(msg));
    }
    cv_.notify_one();
}

void Logger::configure(const std::string& path) {
    // Drain first so earlier messages land in the old destination.
    flush();

    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (path == "/dev/null") {
        enabled_ = false;
        return;
    }

    enabled_ = true;

    if (path == "stdout" || path.empty()) {
        use_stdout_ = true;
        return;
    }

    use_stdout_ = false;

    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }

    if (file_stream_.is_open()) file_stream_.close();
    file_stream_.open(path, std::ios::out | std::ios::app);
}

void Logger::log(LogLevel level, std::string_view message) {
    if (!enabled_ || level < level_) return;

    std::string level_str;
    switch (level) {
        case LogLevel::DEBUG: level_str = "DEBUG"; break;
        case LogLevel::INFO:  level_str = "INFO";  break;
        case LogLevel::WARN:  level_str = "WARN";  break;
        case LogLevel::ERROR: level_str = "ERROR"; break;
    }

    enqueue(level_str + ": " + std::string(message));
}

void Logger::log_access(std::string_view client_ip,
                        std::string_view method,
                        std::string_view path,
                        int status_code,
                        long long response_time_ms) {
    if (!enabled_ || LogLevel::INFO < level_) return;

    std::stringstream ss;
    ss << "ACCESS: " << client_ip << " " << method << " " << path << " "
       << status_code << " " << response_time_ms << "ms";

    enqueue(ss.str());
}

void Logger::log_error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::flush() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    drained_cv_.wait(lock, [this] { return (queue_.empty() && !busy_) || !running_; });
    lock.unlock();

    std::lock_guard<std::mutex> sink(sink_mutex_);
    if (file_stream_.is_open()) {
        file_stream_.flush();
    } else if (use_stdout_) {
        std::cout.flush();
    }
}

} // namespace cascade
