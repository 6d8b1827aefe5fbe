#include <tripwire/rolling_window.h>
#include <tripwire/exceptions.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <string>

namespace tripwire {

std::uint64_t Snapshot::percentile(double p) const {
    for (const auto& [key, value] : percentiles) {
        if (key == p) return value;
    }
    throw std::out_of_range("Percentile not configured: " + std::to_string(p));
}

double Snapshot::error_percentage() const {
    if (invocations == 0) {
        return failures == 0 ? 0.0 : std::numeric_limits<double>::infinity();
    }
    return static_cast<double>(failures) / static_cast<double>(invocations) * 100.0;
}

void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const Snapshot& snapshot) {
    boost::json::object percentiles;
    for (const auto& [p, value] : snapshot.percentiles) {
        std::ostringstream key;
        key << p;
        percentiles[key.str()] = value;
    }

    boost::json::object obj;
    obj["invocations"] = snapshot.invocations;
    obj["successes"] = snapshot.successes;
    obj["failures"] = snapshot.failures;
    obj["timeouts"] = snapshot.timeouts;
    obj["latencyMean"] = snapshot.latency_mean;
    obj["percentiles"] = std::move(percentiles);
    obj["isCircuitBreakerOpen"] = snapshot.open;
    jv = std::move(obj);
}

std::uint64_t nearest_rank(const std::vector<std::uint64_t>& sorted, double p) {
    if (sorted.empty()) return 0;
    if (p <= 0.0) return sorted.front();
    if (p >= 1.0) return sorted.back();

    const auto n = static_cast<double>(sorted.size());
    auto index = static_cast<std::size_t>(std::ceil(p * n));
    index = std::clamp<std::size_t>(index, 1, sorted.size());
    return sorted[index - 1];
}

void WindowOptions::validate() const {
    if (bucket_count < 1) {
        throw ConfigError("bucket count must be at least 1");
    }
    if (window_duration.count() <= 0) {
        throw ConfigError("window duration must be positive");
    }
}

Millis WindowOptions::rotation_period() const {
    const auto period = window_duration.count() / static_cast<Millis::rep>(bucket_count);
    return Millis(std::max<Millis::rep>(period, 1));
}

RollingWindow::RollingWindow(WindowOptions options, std::shared_ptr<Scheduler> scheduler)
    : options_(std::move(options)) {
    options_.validate();
    if (!scheduler) {
        throw ConfigError("rolling window requires a scheduler");
    }
    trigger_ = std::make_shared<IntervalTrigger>(std::move(scheduler), options_.rotation_period());
    attach();
}

RollingWindow::RollingWindow(WindowOptions options, std::shared_ptr<RotationTrigger> trigger)
    : options_(std::move(options)), trigger_(std::move(trigger)) {
    options_.validate();
    if (!trigger_) {
        throw ConfigError("rolling window requires a rotation trigger");
    }
    attach();
}

RollingWindow::~RollingWindow() {
    shutdown();
}

void RollingWindow::attach() {
    ring_->buckets.resize(options_.bucket_count);
    const auto id = trigger_->subscribe([ring = std::weak_ptr<Ring>(ring_)] {
        if (auto alive = ring.lock()) alive->rotate();
    });
    std::lock_guard<std::mutex> lock(ring_->mtx);
    ring_->subscription = id;
}

void RollingWindow::increment(Counter counter, std::optional<std::uint64_t> latency) {
    std::lock_guard<std::mutex> lock(ring_->mtx);
    Bucket& current = ring_->buckets.front();
    switch (counter) {
        case Counter::invocations: ++current.invocations; break;
        case Counter::successes:   ++current.successes;   break;
        case Counter::failures:    ++current.failures;    break;
        case Counter::timeouts:    ++current.timeouts;    break;
    }
    if (latency) {
        current.latencies.push_back(*latency);
    }
}

Snapshot RollingWindow::snapshot() const {
    Snapshot snap;
    {
        std::lock_guard<std::mutex> lock(ring_->mtx);
        for (const auto& bucket : ring_->buckets) {
            snap.invocations += bucket.invocations;
            snap.successes += bucket.successes;
            snap.failures += bucket.failures;
            snap.timeouts += bucket.timeouts;
            snap.latencies.insert(snap.latencies.end(), bucket.latencies.begin(), bucket.latencies.end());
        }
        snap.open = ring_->buckets.front().breaker_open;
    }

    std::sort(snap.latencies.begin(), snap.latencies.end());

    if (!snap.latencies.empty()) {
        const double total = std::accumulate(snap.latencies.begin(), snap.latencies.end(), 0.0);
        snap.latency_mean = total / static_cast<double>(snap.latencies.size());
    }

    snap.percentiles.reserve(options_.percentiles.size());
    for (double p : options_.percentiles) {
        const std::uint64_t value = options_.percentiles_enabled ? nearest_rank(snap.latencies, p) : 0;
        snap.percentiles.emplace_back(p, value);
    }

    return snap;
}

void RollingWindow::mark_open() {
    std::lock_guard<std::mutex> lock(ring_->mtx);
    ring_->buckets.front().breaker_open = true;
}

void RollingWindow::mark_closed() {
    std::lock_guard<std::mutex> lock(ring_->mtx);
    ring_->buckets.front().breaker_open = false;
}

void RollingWindow::Ring::rotate() {
    std::lock_guard<std::mutex> lock(mtx);
    if (shut_down) return;
    buckets.pop_back();
    buckets.emplace_front();
}

void RollingWindow::rotate() {
    ring_->rotate();
}

void RollingWindow::shutdown() {
    std::optional<RotationTrigger::SubscriptionId> subscription;
    {
        std::lock_guard<std::mutex> lock(ring_->mtx);
        ring_->shut_down = true;
        subscription.swap(ring_->subscription);
    }
    if (subscription) {
        trigger_->unsubscribe(*subscription);
    }
}

bool RollingWindow::is_shut_down() const {
    std::lock_guard<std::mutex> lock(ring_->mtx);
    return ring_->shut_down;
}

std::vector<Bucket> RollingWindow::buckets() const {
    std::lock_guard<std::mutex> lock(ring_->mtx);
    return {ring_->buckets.begin(), ring_->buckets.end()};
}

} // namespace tripwire
