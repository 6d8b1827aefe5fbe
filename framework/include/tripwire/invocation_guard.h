#ifndef TRIPWIRE_INVOCATION_GUARD_H
#define TRIPWIRE_INVOCATION_GUARD_H

#include <tripwire/circuit_breaker.h>
#include <tripwire/scheduler.h>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

namespace tripwire {

class InvocationGuard;

/**
 * @brief Bookkeeping for one admitted call.
 *
 * Exactly one of complete(), abort() or the deadline timer settles the
 * call; whichever comes second is ignored, so a late completion after a
 * timeout is never counted twice.
 */
class Invocation : public std::enable_shared_from_this<Invocation> {
public:
    Invocation(std::shared_ptr<CircuitBreaker> breaker, Millis started_at);

    /** @brief Normal completion; classified with the breaker's error predicate. */
    void complete(int status);

    /** @brief The call ended without completing (disconnect, exception). Always a failure. */
    void abort();

    bool settled() const { return settled_.load(); }
    bool timed_out() const { return timed_out_.load(); }

    /** @brief Milliseconds since the call was admitted. */
    std::uint64_t elapsed_ms() const;

private:
    friend class InvocationGuard;

    void arm_deadline(Millis deadline);
    void on_deadline();

    /** @brief True for the first caller only. */
    bool settle();

    std::shared_ptr<CircuitBreaker> breaker_;
    Millis started_at_;
    std::atomic<bool> settled_{false};
    std::atomic<bool> timed_out_{false};

    std::mutex timer_mtx_;
    std::shared_ptr<Timer> deadline_;
};

/**
 * @brief Per-call admission and outcome classification in front of a breaker.
 */
class InvocationGuard {
public:
    explicit InvocationGuard(std::shared_ptr<CircuitBreaker> breaker);

    /**
     * @brief Admits a call.
     *
     * The invocation is counted even when rejected. Returns null when the
     * breaker is open and log-only mode is off; the caller must then answer
     * "unavailable" without touching the downstream. When the guard is
     * disabled the returned invocation records nothing.
     */
    std::shared_ptr<Invocation> begin();

    void enable() { enabled_ = true; }
    void disable() { enabled_ = false; }
    bool enabled() const { return enabled_.load(); }

    CircuitBreaker& breaker() { return *breaker_; }

private:
    std::shared_ptr<CircuitBreaker> breaker_;
    std::atomic<bool> enabled_;
};

} // namespace tripwire

#endif // TRIPWIRE_INVOCATION_GUARD_H
