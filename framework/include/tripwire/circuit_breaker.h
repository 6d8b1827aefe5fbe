#ifndef TRIPWIRE_CIRCUIT_BREAKER_H
#define TRIPWIRE_CIRCUIT_BREAKER_H

#include <tripwire/logger.h>
#include <tripwire/options.h>
#include <tripwire/rolling_window.h>
#include <tripwire/rotation.h>
#include <tripwire/scheduler.h>
#include <tripwire/state_machine.h>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tripwire {

/**
 * @brief Circuit state machine driven by a rolling window of outcomes.
 *
 * Every public operation runs under one mutex, so outcome reports from
 * concurrent calls and timer firings are applied one after another. Outcome
 * reporting never throws. After shutdown() counters still accept increments
 * but the state is frozen.
 */
class CircuitBreaker {
public:
    /**
     * @param options   validated here, throws ConfigError
     * @param scheduler drives the reset and warm-up timers
     * @param trigger   shared rotation source; null gives the window its own timer
     */
    CircuitBreaker(BreakerOptions options,
                   std::shared_ptr<Scheduler> scheduler,
                   std::shared_ptr<RotationTrigger> trigger = nullptr);
    ~CircuitBreaker();

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    void record_invocation();
    void record_success(std::optional<std::uint64_t> latency_ms = std::nullopt);

    /**
     * @brief Counts a failure and, unless warming up, evaluates the open guard
     * against a snapshot that already includes this failure.
     */
    void record_failure(std::optional<std::uint64_t> latency_ms = std::nullopt);

    /** @brief Counts a timeout carrying `latency_ms`, then reports a failure. */
    void record_timeout(std::uint64_t latency_ms);

    /** @brief Trips the breaker. A no-op when already open. */
    void open();

    /** @brief Resets the breaker to closed. A no-op when already closed. */
    void close();

    /** @brief Terminal: cancels both timers and stops window rotation. Idempotent. */
    void shutdown();

    State state() const;
    bool is_open() const { return state() == State::open; }
    bool warming_up() const;

    Snapshot stats() const;
    std::vector<Bucket> buckets() const;

    const std::string& name() const { return options_.name; }
    const BreakerOptions& options() const { return options_; }
    Scheduler& scheduler() { return *scheduler_; }
    Logger& logger() { return *logger_; }

    /** @brief Writes `[circuit-breaker <name>] message`; logger errors are contained. */
    void log(LogLevel level, std::string_view message) noexcept;

private:
    using LogLine = std::pair<LogLevel, std::string>;

    // Runs fn under mtx_, then writes the lines it queued once the lock is released.
    template <typename Fn>
    void with_lock(Fn&& fn);

    void queue_log(LogLevel level, std::string message);

    void fail_locked(std::optional<std::uint64_t> latency_ms);
    void apply_locked(Event event, bool trip = false);
    void start_reset_timer_locked();
    void cancel_reset_timer_locked();
    void cancel_warm_up_timer_locked();

    BreakerOptions options_;
    std::shared_ptr<Scheduler> scheduler_;
    std::shared_ptr<Logger> owned_logger_;
    Logger* logger_;
    std::string log_prefix_;

    mutable std::mutex mtx_;
    std::unique_ptr<RollingWindow> window_;
    State state_ = State::closed;
    bool warming_up_ = false;
    std::vector<LogLine> pending_logs_;

    std::shared_ptr<Timer> reset_timer_;
    std::shared_ptr<Timer> warm_up_timer_;
    std::uint64_t reset_generation_ = 0;
    std::uint64_t warm_up_generation_ = 0;
};

} // namespace tripwire

#endif // TRIPWIRE_CIRCUIT_BREAKER_H
