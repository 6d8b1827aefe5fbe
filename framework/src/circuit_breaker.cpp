#include <tripwire/circuit_breaker.h>
#include <tripwire/exceptions.h>
#include <atomic>
#include <iostream>
#include <sstream>

namespace tripwire {

namespace {

std::string default_name() {
    static std::atomic<std::uint64_t> counter{0};
    return "circuit-breaker-" + std::to_string(++counter);
}

std::string with_latency(std::string_view message, std::optional<std::uint64_t> latency_ms) {
    std::ostringstream ss;
    ss << message;
    if (latency_ms) ss << " latency=" << *latency_ms << "ms";
    return ss.str();
}

} // namespace

template <typename Fn>
void CircuitBreaker::with_lock(Fn&& fn) {
    std::vector<LogLine> lines;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        fn();
        lines.swap(pending_logs_);
    }
    for (const auto& [level, message] : lines) {
        log(level, message);
    }
}

// Caller holds mtx_. The sink may call back into the breaker, so it is never invoked here.
void CircuitBreaker::queue_log(LogLevel level, std::string message) {
    pending_logs_.emplace_back(level, std::move(message));
}

CircuitBreaker::CircuitBreaker(BreakerOptions options,
                               std::shared_ptr<Scheduler> scheduler,
                               std::shared_ptr<RotationTrigger> trigger)
    : options_(std::move(options)), scheduler_(std::move(scheduler)) {
    options_.validate();
    if (!scheduler_) {
        throw ConfigError("circuit breaker requires a scheduler");
    }
    if (options_.name.empty()) {
        options_.name = default_name();
    }

    owned_logger_ = options_.logger;
    logger_ = owned_logger_ ? owned_logger_.get() : &Logger::instance();
    log_prefix_ = "[circuit-breaker " + options_.name + "] ";

    if (trigger) {
        window_ = std::make_unique<RollingWindow>(options_.window_options(), std::move(trigger));
    } else {
        window_ = std::make_unique<RollingWindow>(options_.window_options(), scheduler_);
    }

    if (options_.allow_warm_up) {
        std::lock_guard<std::mutex> lock(mtx_);
        warming_up_ = true;
        const auto generation = ++warm_up_generation_;
        warm_up_timer_ = scheduler_->schedule(options_.rolling_count_timeout, [this, generation] {
            with_lock([&] {
                if (generation != warm_up_generation_) return;
                warming_up_ = false;
                warm_up_timer_.reset();
                queue_log(LogLevel::DEBUG, "Warm-up period finished");
            });
        });
    }
}

CircuitBreaker::~CircuitBreaker() {
    shutdown();
}

void CircuitBreaker::log(LogLevel level, std::string_view message) noexcept {
    try {
        logger_->log(level, log_prefix_ + std::string(message));
    } catch (const std::exception& e) {
        std::cerr << log_prefix_ << "logger failed: " << e.what() << '\n';
    } catch (...) {
        std::cerr << log_prefix_ << "logger failed with an unknown exception\n";
    }
}

void CircuitBreaker::record_invocation() {
    std::lock_guard<std::mutex> lock(mtx_);
    window_->increment(Counter::invocations);
}

void CircuitBreaker::record_success(std::optional<std::uint64_t> latency_ms) {
    with_lock([&] {
        window_->increment(Counter::successes, latency_ms);
        apply_locked(Event::success);
    });
}

void CircuitBreaker::record_failure(std::optional<std::uint64_t> latency_ms) {
    with_lock([&] { fail_locked(latency_ms); });
}

void CircuitBreaker::record_timeout(std::uint64_t latency_ms) {
    with_lock([&] {
        window_->increment(Counter::timeouts, latency_ms);
        fail_locked(std::nullopt);
    });
}

void CircuitBreaker::fail_locked(std::optional<std::uint64_t> latency_ms) {
    window_->increment(Counter::failures, latency_ms);
    queue_log(LogLevel::WARN, with_latency("Circuit breaker failure", latency_ms));

    if (state_ == State::shutdown) return;

    const Snapshot snap = window_->snapshot();
    OpenGuardInput input;
    input.state = state_;
    input.warming_up = warming_up_;
    input.invocations = snap.invocations;
    input.error_percentage = snap.error_percentage();
    input.volume_threshold = options_.volume_threshold;
    input.error_threshold_percentage = options_.error_threshold_percentage;

    apply_locked(Event::failure, should_trip(input));
}

void CircuitBreaker::open() {
    with_lock([&] { apply_locked(Event::open); });
}

void CircuitBreaker::close() {
    with_lock([&] { apply_locked(Event::close); });
}

void CircuitBreaker::shutdown() {
    with_lock([&] { apply_locked(Event::shutdown); });
}

void CircuitBreaker::apply_locked(Event event, bool trip) {
    const State previous = state_;
    const Transition t = apply_event(state_, event, trip);
    const Effects& fx = t.effects;

    if (fx.cancel_reset_timer) cancel_reset_timer_locked();
    if (fx.cancel_warm_up_timer) cancel_warm_up_timer_locked();
    if (fx.start_reset_timer) start_reset_timer_locked();
    if (fx.mark_open) window_->mark_open();
    if (fx.mark_closed) window_->mark_closed();
    if (fx.stop_rotation) window_->shutdown();

    state_ = t.next;
    if (!t.changed(previous)) return;

    switch (state_) {
        case State::open:
            queue_log(LogLevel::WARN, "Circuit breaker opened");
            break;
        case State::closed:
            queue_log(LogLevel::INFO, "Circuit breaker closed");
            break;
        case State::half_open:
            queue_log(LogLevel::DEBUG, "Circuit breaker reset timeout: moving to half-open");
            break;
        case State::shutdown:
            queue_log(LogLevel::INFO, "Circuit breaker shut down");
            break;
    }
}

void CircuitBreaker::start_reset_timer_locked() {
    cancel_reset_timer_locked();
    const auto generation = reset_generation_;
    reset_timer_ = scheduler_->schedule(options_.reset_timeout, [this, generation] {
        with_lock([&] {
            if (generation != reset_generation_) return;
            reset_timer_.reset();
            apply_locked(Event::reset_elapsed);
        });
    });
}

void CircuitBreaker::cancel_reset_timer_locked() {
    ++reset_generation_;
    if (reset_timer_) {
        reset_timer_->cancel();
        reset_timer_.reset();
    }
}

void CircuitBreaker::cancel_warm_up_timer_locked() {
    ++warm_up_generation_;
    if (warm_up_timer_) {
        warm_up_timer_->cancel();
        warm_up_timer_.reset();
    }
}

State CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_;
}

bool CircuitBreaker::warming_up() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return warming_up_;
}

Snapshot CircuitBreaker::stats() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return window_->snapshot();
}

std::vector<Bucket> CircuitBreaker::buckets() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return window_->buckets();
}

} // namespace tripwire
