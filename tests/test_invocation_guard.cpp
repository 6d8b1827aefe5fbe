#include <catch2/catch_test_macros.hpp>
#include <tripwire/invocation_guard.h>
#include <tripwire/exceptions.h>
#include "support/manual_scheduler.h"
#include <memory>

using namespace tripwire;
using tripwire::testing::CaptureLogger;
using tripwire::testing::ManualScheduler;

namespace {

struct Fixture {
    std::shared_ptr<ManualScheduler> scheduler = std::make_shared<ManualScheduler>();
    std::shared_ptr<CaptureLogger> logger = std::make_shared<CaptureLogger>();
    BreakerOptions options;

    Fixture() {
        options.name = "inventory";
        options.timeout = Millis(10000);
        options.reset_timeout = Millis(30000);
        options.rolling_count_timeout = Millis(30000);
        options.logger = logger;
    }

    std::shared_ptr<InvocationGuard> guard() {
        return std::make_shared<InvocationGuard>(std::make_shared<CircuitBreaker>(options, scheduler));
    }
};

} // namespace

TEST_CASE("InvocationGuard: Admission", "[guard]") {
    Fixture f;

    SECTION("Closed breaker admits and counts the call") {
        auto guard = f.guard();
        auto call = guard->begin();
        REQUIRE(call != nullptr);
        CHECK(guard->breaker().stats().invocations == 1);
    }

    SECTION("Open breaker rejects but still counts the call") {
        auto guard = f.guard();
        guard->breaker().open();

        CHECK(guard->begin() == nullptr);
        CHECK(guard->breaker().stats().invocations == 1);
        CHECK(f.logger->contains("Circuit is open request rejected"));
    }

    SECTION("Log-only mode forwards calls through an open breaker") {
        f.options.log_only = true;
        auto guard = f.guard();
        guard->breaker().open();

        auto call = guard->begin();
        REQUIRE(call != nullptr);
        call->complete(200);

        const auto stats = guard->breaker().stats();
        CHECK(stats.invocations == 1);
        CHECK(stats.successes == 1);
        CHECK(f.logger->contains("Circuit is open request rejected"));
    }

    SECTION("Half-open breaker admits the probe") {
        auto guard = f.guard();
        guard->breaker().open();
        f.scheduler->advance(f.options.reset_timeout);
        REQUIRE(guard->breaker().state() == State::half_open);

        auto call = guard->begin();
        REQUIRE(call != nullptr);
        call->complete(200);
        CHECK(guard->breaker().state() == State::closed);
    }

    SECTION("Disabled guard passes through and records nothing") {
        f.options.enabled = false;
        auto guard = f.guard();
        guard->breaker().open();

        auto call = guard->begin();
        REQUIRE(call != nullptr);
        call->complete(500);
        f.scheduler->advance(f.options.timeout.value() * 2);

        const auto stats = guard->breaker().stats();
        CHECK(stats.invocations == 0);
        CHECK(stats.failures == 0);
        CHECK(stats.timeouts == 0);

        guard->enable();
        CHECK(guard->begin() == nullptr);
    }

    SECTION("Shutdown breaker lets calls through unguarded") {
        auto guard = f.guard();
        guard->breaker().open();
        guard->breaker().shutdown();
        CHECK(guard->begin() != nullptr);
    }
}

TEST_CASE("InvocationGuard: Outcome classification", "[guard]") {
    Fixture f;

    SECTION("4xx and 5xx are failures by default") {
        f.options.error_threshold_percentage = 100;
        auto guard = f.guard();
        guard->begin()->complete(500);
        guard->begin()->complete(404);
        guard->begin()->complete(200);
        guard->begin()->complete(302);

        const auto stats = guard->breaker().stats();
        CHECK(stats.failures == 2);
        CHECK(stats.successes == 2);
    }

    SECTION("A custom predicate can ignore client errors") {
        f.options.is_error = [](int status) { return status >= 500; };
        auto guard = f.guard();

        guard->begin()->complete(400);
        CHECK(guard->breaker().stats().failures == 0);

        guard->begin()->complete(500);
        CHECK(guard->breaker().stats().failures == 1);
    }

    SECTION("A predicate matching one status only") {
        f.options.is_error = [](int status) { return status == 503; };
        auto guard = f.guard();
        guard->begin()->complete(503);
        CHECK(guard->breaker().stats().failures == 1);
    }

    SECTION("Latency is measured from admission") {
        auto guard = f.guard();
        auto call = guard->begin();
        f.scheduler->advance(Millis(42));
        call->complete(200);
        CHECK(guard->breaker().stats().latencies == std::vector<std::uint64_t>{42});
        CHECK(f.logger->contains("Request succeeded latency=42ms"));
    }

    SECTION("Abrupt termination is a failure whatever the predicate says") {
        f.options.is_error = [](int) { return false; };
        auto guard = f.guard();
        auto call = guard->begin();
        f.scheduler->advance(Millis(7));
        call->abort();

        const auto stats = guard->breaker().stats();
        CHECK(stats.failures == 1);
        CHECK(stats.latencies == std::vector<std::uint64_t>{7});
        CHECK(guard->breaker().state() == State::open);
        CHECK(f.logger->contains("Request closed prematurely"));
    }

    SECTION("A throwing predicate counts as a failure") {
        f.options.is_error = [](int) -> bool { throw std::logic_error("bad predicate"); };
        auto guard = f.guard();
        CHECK_NOTHROW(guard->begin()->complete(200));
        CHECK(guard->breaker().stats().failures == 1);
    }
}

TEST_CASE("InvocationGuard: Completion deadline", "[guard][timeout]") {
    Fixture f;

    SECTION("Completing just before the deadline does not trip") {
        auto guard = f.guard();
        auto call = guard->begin();
        f.scheduler->advance(f.options.timeout.value() - Millis(1));
        call->complete(200);
        f.scheduler->advance(Millis(10));

        CHECK(guard->breaker().state() == State::closed);
        CHECK(guard->breaker().stats().timeouts == 0);
        CHECK_FALSE(call->timed_out());
    }

    SECTION("Exceeding the deadline records a timeout and a failure") {
        auto guard = f.guard();
        auto call = guard->begin();
        f.scheduler->advance(f.options.timeout.value() + Millis(10));
        CHECK(call->timed_out());

        // The late completion must not be counted again.
        call->complete(500);
        call->abort();

        const auto stats = guard->breaker().stats();
        CHECK(stats.failures == 1);
        CHECK(stats.timeouts == 1);
        CHECK(stats.latencies == std::vector<std::uint64_t>{10000});
        CHECK(guard->breaker().state() == State::open);
        CHECK(f.logger->contains("Request timed out latency=10000ms"));
    }

    SECTION("Several timeouts are needed to reach the volume threshold") {
        f.options.volume_threshold = 2;
        auto guard = f.guard();

        auto first = guard->begin();
        f.scheduler->advance(f.options.timeout.value() + Millis(10));
        CHECK(guard->breaker().stats().timeouts == 1);
        CHECK(guard->breaker().state() == State::closed);

        auto second = guard->begin();
        f.scheduler->advance(f.options.timeout.value() + Millis(10));
        const auto stats = guard->breaker().stats();
        CHECK(stats.failures == 2);
        CHECK(stats.timeouts == 2);
        CHECK(guard->breaker().state() == State::open);
    }

    SECTION("No deadline when the timeout is disabled") {
        f.options.timeout = std::nullopt;
        auto guard = f.guard();
        auto call = guard->begin();
        f.scheduler->advance(Millis(60000));
        CHECK(guard->breaker().stats().timeouts == 0);

        call->complete(200);
        CHECK(guard->breaker().stats().successes == 1);
    }

    SECTION("Completion cancels the deadline timer") {
        auto guard = f.guard();
        const auto baseline = f.scheduler->pending();
        auto call = guard->begin();
        CHECK(f.scheduler->pending() == baseline + 1);
        call->complete(200);
        CHECK(f.scheduler->pending() == baseline);
    }
}

TEST_CASE("InvocationGuard: Requires a breaker", "[guard][config]") {
    CHECK_THROWS_AS(InvocationGuard(nullptr), ConfigError);
}
