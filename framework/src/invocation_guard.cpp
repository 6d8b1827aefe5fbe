#include <tripwire/invocation_guard.h>
#include <tripwire/exceptions.h>
#include <string>

namespace tripwire {

namespace {

std::string latency_field(std::uint64_t latency_ms) {
    return " latency=" + std::to_string(latency_ms) + "ms";
}

} // namespace

Invocation::Invocation(std::shared_ptr<CircuitBreaker> breaker, Millis started_at)
    : breaker_(std::move(breaker)), started_at_(started_at) {}

std::uint64_t Invocation::elapsed_ms() const {
    if (!breaker_) return 0;
    const auto elapsed = breaker_->scheduler().now() - started_at_;
    return elapsed.count() > 0 ? static_cast<std::uint64_t>(elapsed.count()) : 0;
}

bool Invocation::settle() {
    bool expected = false;
    if (!settled_.compare_exchange_strong(expected, true)) return false;

    std::lock_guard<std::mutex> lock(timer_mtx_);
    if (deadline_) {
        deadline_->cancel();
        deadline_.reset();
    }
    return true;
}

void Invocation::arm_deadline(Millis deadline) {
    std::lock_guard<std::mutex> lock(timer_mtx_);
    deadline_ = breaker_->scheduler().schedule(deadline, [self = shared_from_this()] {
        self->on_deadline();
    });
}

void Invocation::on_deadline() {
    bool expected = false;
    if (!settled_.compare_exchange_strong(expected, true)) return;
    {
        std::lock_guard<std::mutex> lock(timer_mtx_);
        deadline_.reset();
    }

    // The downstream keeps running; only the statistics react.
    timed_out_ = true;
    const auto latency = elapsed_ms();
    breaker_->record_timeout(latency);
    breaker_->log(LogLevel::WARN, "Request timed out" + latency_field(latency));
}

void Invocation::complete(int status) {
    if (!settle() || !breaker_) return;

    const auto latency = elapsed_ms();
    bool failed;
    try {
        failed = breaker_->options().is_error(status);
    } catch (const std::exception& e) {
        breaker_->log(LogLevel::ERROR, std::string("Error predicate threw: ") + e.what());
        failed = true;
    }

    if (failed) {
        breaker_->record_failure(latency);
    } else {
        breaker_->record_success(latency);
        breaker_->log(LogLevel::INFO, "Request succeeded" + latency_field(latency));
    }
}

void Invocation::abort() {
    if (!settle() || !breaker_) return;

    const auto latency = elapsed_ms();
    breaker_->record_failure(latency);
    breaker_->log(LogLevel::WARN, "Request closed prematurely" + latency_field(latency));
}

InvocationGuard::InvocationGuard(std::shared_ptr<CircuitBreaker> breaker)
    : breaker_(std::move(breaker)) {
    if (!breaker_) {
        throw ConfigError("invocation guard requires a circuit breaker");
    }
    enabled_ = breaker_->options().enabled;
}

std::shared_ptr<Invocation> InvocationGuard::begin() {
    if (!enabled_) {
        return std::make_shared<Invocation>(nullptr, Millis{0});
    }

    breaker_->record_invocation();

    // shutdown is not treated as open: calls pass through unguarded.
    if (breaker_->state() == State::open) {
        breaker_->log(LogLevel::WARN, "Circuit is open request rejected");
        if (!breaker_->options().log_only) {
            return nullptr;
        }
    }

    auto invocation = std::make_shared<Invocation>(breaker_, breaker_->scheduler().now());
    if (const auto& timeout = breaker_->options().timeout) {
        invocation->arm_deadline(*timeout);
    }
    return invocation;
}

} // namespace tripwire
