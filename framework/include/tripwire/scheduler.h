#ifndef TRIPWIRE_SCHEDULER_H
#define TRIPWIRE_SCHEDULER_H

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

namespace tripwire {

using Millis = std::chrono::milliseconds;

/**
 * @brief Handle to a pending one-shot timer.
 */
class Timer {
public:
    virtual ~Timer() = default;

    /**
     * @brief Prevents the callback from running.
     * @return true if this call won the race against expiry, false if the
     *         timer already fired or was already cancelled.
     */
    virtual bool cancel() = 0;
};

/**
 * @brief Time source and one-shot timer factory used by the breaker core.
 */
class Scheduler {
public:
    using Callback = std::function<void()>;

    virtual ~Scheduler() = default;

    /** @brief Monotonic time since an arbitrary epoch. */
    virtual Millis now() const = 0;

    virtual std::shared_ptr<Timer> schedule(Millis delay, Callback callback) = 0;
};

/**
 * @brief Scheduler backed by Boost.Asio steady timers.
 *
 * Callbacks run on the given executor. Pass a strand when the io_context
 * is run from several threads so breaker callbacks stay serialized.
 */
class AsioScheduler : public Scheduler {
public:
    explicit AsioScheduler(boost::asio::any_io_executor executor);

    Millis now() const override;
    std::shared_ptr<Timer> schedule(Millis delay, Callback callback) override;

    boost::asio::any_io_executor get_executor() const { return executor_; }

private:
    boost::asio::any_io_executor executor_;
};

} // namespace tripwire

#endif // TRIPWIRE_SCHEDULER_H
