#include <tripwire/rotation.h>
#include <tripwire/exceptions.h>
#include <vector>

namespace tripwire {

RotationTrigger::SubscriptionId RotationTrigger::subscribe(Callback callback) {
    SubscriptionId id;
    bool first;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        id = next_id_++;
        first = subscribers_.empty();
        subscribers_.emplace(id, std::make_shared<Callback>(std::move(callback)));
    }
    if (first) on_first_subscriber();
    return id;
}

void RotationTrigger::unsubscribe(SubscriptionId id) {
    bool last;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (subscribers_.erase(id) == 0) return;
        last = subscribers_.empty();
    }
    if (last) on_last_unsubscribed();
}

std::size_t RotationTrigger::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return subscribers_.size();
}

void RotationTrigger::fire() {
    std::vector<std::pair<SubscriptionId, std::shared_ptr<Callback>>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        snapshot.assign(subscribers_.begin(), subscribers_.end());
    }

    for (const auto& [id, callback] : snapshot) {
        // An earlier callback in this tick may have unsubscribed this one.
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (subscribers_.find(id) == subscribers_.end()) continue;
        }
        (*callback)();
    }
}

IntervalTrigger::IntervalTrigger(std::shared_ptr<Scheduler> scheduler, Millis period)
    : scheduler_(std::move(scheduler)), period_(period) {
    if (!scheduler_) {
        throw ConfigError("rotation trigger requires a scheduler");
    }
    if (period_.count() <= 0) {
        throw ConfigError("rotation period must be positive");
    }
}

IntervalTrigger::~IntervalTrigger() {
    on_last_unsubscribed();
}

bool IntervalTrigger::running() const {
    std::lock_guard<std::mutex> lock(timer_mtx_);
    return timer_ != nullptr;
}

void IntervalTrigger::on_first_subscriber() {
    std::lock_guard<std::mutex> lock(timer_mtx_);
    if (!timer_) arm();
}

void IntervalTrigger::on_last_unsubscribed() {
    std::lock_guard<std::mutex> lock(timer_mtx_);
    ++generation_;
    if (timer_) {
        timer_->cancel();
        timer_.reset();
    }
}

// Caller holds timer_mtx_.
void IntervalTrigger::arm() {
    const auto generation = ++generation_;
    timer_ = scheduler_->schedule(period_, [this, generation] {
        {
            std::lock_guard<std::mutex> lock(timer_mtx_);
            if (generation != generation_) return;
            arm();
        }
        fire();
    });
}

} // namespace tripwire
