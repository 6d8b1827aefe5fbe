#include <tripwire/logger.h>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace tripwire {

std::string_view to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    worker_ = std::thread(&Logger::process_queue, this);
}

Logger::~Logger() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
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
            cv_.wait(lock, [this] { return !queue_.empty() || !running_; });

            if (queue_.empty() && !running_) {
                break;
            }

            msg = std::move(queue_.front());
            queue_.pop();
            writing_ = true;
        }

        std::stringstream output;
        output << "[" << get_timestamp() << "] " << msg << "\n";
        std::string out_str = output.str();

        if (use_stdout_) {
            if (msg.starts_with("ERROR")) {
                std::cerr << out_str;
            } else {
                std::cout << out_str;
            }
        } else if (file_stream_.is_open()) {
            file_stream_ << out_str;
            if (msg.starts_with("ERROR")) {
                file_stream_.flush();
            }
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            writing_ = false;
        }
        drained_cv_.notify_all();
    }
}

void Logger::configure(const std::string& path) {
    std::lock_guard<std::mutex> lock(queue_mutex_);

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

    std::string msg = std::string(to_string(level)) + ": " + std::string(message);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push(std::move(msg));
    }
    cv_.notify_one();
}

void Logger::flush() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    drained_cv_.wait(lock, [this] { return (queue_.empty() && !writing_) || !running_; });
    if (file_stream_.is_open()) {
        file_stream_.flush();
    }
}

} // namespace tripwire
