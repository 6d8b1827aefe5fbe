/**
 * Example: Flaky Upstream
 *
 * Drives the circuit breaker middleware against a simulated downstream that
 * fails for a while and then recovers.
 * Concepts:
 * - Options from the environment (CIRCUIT_BREAKER_* variables, optional .env)
 * - Guarding a handler with middleware::circuit_breaker
 * - Open -> half-open -> closed recovery on an Asio event loop
 * - Serving the rolling stats as JSON
 */

#include <tripwire/tripwire.h>
#include <boost/asio.hpp>
#include <iostream>

using namespace tripwire;

namespace {

// Fails every call until `healthy_after` requests have been seen.
Async<void> flaky_downstream(Response& res, int request_no, int healthy_after) {
    co_await delay(std::chrono::milliseconds(5));
    if (request_no < healthy_after) {
        res.status(502).send("Bad Gateway");
    } else {
        res.status(200).send("ok");
    }
}

Async<void> run(boost::asio::io_context& ioc, std::shared_ptr<CircuitBreaker> breaker) {
    auto guarded = middleware::circuit_breaker(breaker);
    auto stats = middleware::breaker_stats(breaker);

    for (int i = 0; i < 40; ++i) {
        Request req;
        req.path = "/quotes";
        Response res;

        co_await guarded(req, res, [&res, i]() -> Async<void> {
            co_await flaky_downstream(res, i, 15);
        });

        std::cout << "request " << i << " -> " << res.get_status()
                  << " (" << to_string(breaker->state()) << ")" << std::endl;

        co_await delay(std::chrono::milliseconds(25));
    }

    Request req;
    req.path = "/stats";
    Response res;
    co_await stats(req, res);
    std::cout << res.body() << std::endl;

    breaker->shutdown();
    ioc.stop();
}

} // namespace

int main() {
    load_env();
    Logger::instance().configure(env<std::string>("LOG_PATH", "stdout"));

    boost::asio::io_context ioc;
    auto scheduler = std::make_shared<AsioScheduler>(ioc.get_executor());

    BreakerOptions defaults;
    defaults.with_name("quotes")
        .with_timeout(Millis(200))
        .with_reset_timeout(Millis(300))
        .with_window(Millis(1000), 10)
        .with_volume_threshold(5);

    std::shared_ptr<CircuitBreaker> breaker;
    try {
        breaker = std::make_shared<CircuitBreaker>(options_from_env("CIRCUIT_BREAKER", defaults), scheduler);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    boost::asio::co_spawn(ioc, run(ioc, breaker), [](std::exception_ptr e) {
        if (e) std::rethrow_exception(e);
    });
    ioc.run();

    Logger::instance().flush();
    return 0;
}
