#ifndef TRIPWIRE_ROTATION_H
#define TRIPWIRE_ROTATION_H

#include <tripwire/scheduler.h>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace tripwire {

/**
 * @brief Source of "rotate now" ticks for rolling windows.
 *
 * A window subscribes to a trigger instead of owning a timer, so many
 * breakers can share one tick source.
 */
class RotationTrigger {
public:
    using Callback = std::function<void()>;
    using SubscriptionId = std::uint64_t;

    virtual ~RotationTrigger() = default;

    SubscriptionId subscribe(Callback callback);

    /** @brief Safe to call with an unknown or already removed id. */
    void unsubscribe(SubscriptionId id);

    std::size_t subscriber_count() const;

protected:
    /**
     * @brief Invokes every current subscriber, outside the lock.
     *
     * A subscriber removed earlier on the firing thread is skipped. One removed
     * concurrently from another thread may still receive this tick, so callbacks
     * must not capture anything that unsubscribing frees.
     */
    void fire();

    virtual void on_first_subscriber() {}
    virtual void on_last_unsubscribed() {}

private:
    mutable std::mutex mtx_;
    std::map<SubscriptionId, std::shared_ptr<Callback>> subscribers_;
    SubscriptionId next_id_ = 1;
};

/**
 * @brief Ticks every `period` while at least one window is subscribed.
 */
class IntervalTrigger : public RotationTrigger {
public:
    IntervalTrigger(std::shared_ptr<Scheduler> scheduler, Millis period);
    ~IntervalTrigger() override;

    Millis period() const { return period_; }
    bool running() const;

protected:
    void on_first_subscriber() override;
    void on_last_unsubscribed() override;

private:
    void arm();

    std::shared_ptr<Scheduler> scheduler_;
    Millis period_;

    mutable std::mutex timer_mtx_;
    std::shared_ptr<Timer> timer_;
    std::uint64_t generation_ = 0;
};

/**
 * @brief Ticks only when rotate() is called, e.g. from an application-wide timer.
 */
class ManualTrigger : public RotationTrigger {
public:
    void rotate() { fire(); }
};

} // namespace tripwire

#endif // TRIPWIRE_ROTATION_H
