#ifndef TRIPWIRE_LOGGER_H
#define TRIPWIRE_LOGGER_H

#include <atomic>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <queue>
#include <string>
#include <string_view>
#include <thread>

namespace tripwire {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

std::string_view to_string(LogLevel level);

/**
 * @brief Asynchronous line logger.
 *
 * Messages are queued by the caller and written by a background worker, so
 * logging from a timer callback or a request path never blocks on I/O.
 * Subclass and override log() to route breaker events elsewhere.
 */
class Logger {
public:
    Logger();
    virtual ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /** @brief Process-wide default logger (stdout, INFO). */
    static Logger& instance();

    /**
     * @brief Selects the destination.
     * "stdout" or "" writes to the console (errors to stderr),
     * "/dev/null" disables output, anything else is appended to as a file.
     */
    void configure(const std::string& path);

    void set_level(LogLevel level) { level_ = level; }
    LogLevel level() const { return level_; }

    virtual void log(LogLevel level, std::string_view message);

    void debug(std::string_view message) { log(LogLevel::DEBUG, message); }
    void info(std::string_view message) { log(LogLevel::INFO, message); }
    void warn(std::string_view message) { log(LogLevel::WARN, message); }
    void error(std::string_view message) { log(LogLevel::ERROR, message); }

    /** @brief Blocks until every queued line has been written. */
    void flush();

private:
    static std::string get_timestamp();
    void process_queue();

    std::ofstream file_stream_;
    bool use_stdout_{true};
    std::atomic<bool> enabled_{true};
    std::atomic<LogLevel> level_{LogLevel::INFO};

    std::queue<std::string> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::condition_variable drained_cv_;
    bool writing_{false};
    std::thread worker_;
    std::atomic<bool> running_{true};
};

} // namespace tripwire

#endif // TRIPWIRE_LOGGER_H
