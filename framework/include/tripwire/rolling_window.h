#ifndef TRIPWIRE_ROLLING_WINDOW_H
#define TRIPWIRE_ROLLING_WINDOW_H

#include <tripwire/rotation.h>
#include <tripwire/scheduler.h>
#include <boost/json.hpp>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace tripwire {

enum class Counter {
    invocations,
    successes,
    failures,
    timeouts
};

/**
 * @brief One time slice of the rolling window.
 * A timed out call is counted in both `failures` and `timeouts`.
 */
struct Bucket {
    std::uint64_t invocations = 0;
    std::uint64_t successes = 0;
    std::uint64_t failures = 0;
    std::uint64_t timeouts = 0;
    std::vector<std::uint64_t> latencies;  // insertion order
    bool breaker_open = false;

    bool operator==(const Bucket&) const = default;
};

/**
 * @brief Aggregate over every bucket, computed fresh on each read.
 */
struct Snapshot {
    std::uint64_t invocations = 0;
    std::uint64_t successes = 0;
    std::uint64_t failures = 0;
    std::uint64_t timeouts = 0;
    std::vector<std::uint64_t> latencies;  // ascending
    double latency_mean = 0.0;
    std::vector<std::pair<double, std::uint64_t>> percentiles;
    bool open = false;

    /**
     * @brief Value reported for a configured percentile.
     * @throws std::out_of_range if `p` is not one of the configured percentiles.
     */
    std::uint64_t percentile(double p) const;

    /** @brief failures / invocations * 100. Infinite when failures exist without invocations. */
    double error_percentage() const;
};

void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const Snapshot& snapshot);

/**
 * @brief Nearest-rank percentile over ascending samples.
 * index = ceil(p * n) - 1; p <= 0 gives the minimum, p >= 1 the maximum,
 * an empty sample set gives 0.
 */
std::uint64_t nearest_rank(const std::vector<std::uint64_t>& sorted, double p);

struct WindowOptions {
    std::size_t bucket_count = 10;
    Millis window_duration{10000};
    bool percentiles_enabled = true;
    std::vector<double> percentiles{0.0, 0.25, 0.5, 0.75, 0.9, 0.95, 0.99, 0.995, 1.0};

    /** @throws ConfigError */
    void validate() const;

    /** @brief window_duration / bucket_count, never below 1ms. */
    Millis rotation_period() const;
};

/**
 * @brief Fixed ring of time buckets with on-demand aggregation.
 *
 * Index 0 is the current bucket and the only one written to. Every tick of
 * the rotation trigger drops the oldest bucket and prepends an empty one, so
 * the ring always holds exactly `bucket_count` buckets.
 */
class RollingWindow {
public:
    /** @brief Owns an IntervalTrigger ticking every rotation_period(). */
    RollingWindow(WindowOptions options, std::shared_ptr<Scheduler> scheduler);

    /** @brief Subscribes to a shared trigger; its period is the caller's concern. */
    RollingWindow(WindowOptions options, std::shared_ptr<RotationTrigger> trigger);

    ~RollingWindow();

    RollingWindow(const RollingWindow&) = delete;
    RollingWindow& operator=(const RollingWindow&) = delete;

    void increment(Counter counter, std::optional<std::uint64_t> latency = std::nullopt);

    Snapshot snapshot() const;

    void mark_open();
    void mark_closed();

    void rotate();

    /** @brief Stops rotation for good. Increments are still accepted. */
    void shutdown();
    bool is_shut_down() const;

    /** @brief Copy of the ring, current bucket first. */
    std::vector<Bucket> buckets() const;

    const WindowOptions& options() const { return options_; }

private:
    // Mutable state, shared with the trigger subscription so a tick racing
    // the window's destruction never touches freed memory.
    struct Ring {
        mutable std::mutex mtx;
        std::deque<Bucket> buckets;
        bool shut_down = false;
        std::optional<RotationTrigger::SubscriptionId> subscription;

        void rotate();
    };

    void attach();

    WindowOptions options_;
    std::shared_ptr<RotationTrigger> trigger_;
    std::shared_ptr<Ring> ring_ = std::make_shared<Ring>();
};

} // namespace tripwire

#endif // TRIPWIRE_ROLLING_WINDOW_H
