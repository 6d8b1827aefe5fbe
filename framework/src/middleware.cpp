#include <tripwire/middleware.h>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace tripwire {

Async<void> delay(std::chrono::milliseconds ms) {
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer timer(executor, ms);
    co_await timer.async_wait(boost::asio::use_awaitable);
}

namespace middleware {

Middleware circuit_breaker(std::shared_ptr<InvocationGuard> guard) {
    return [guard](Request& req, Response& res, Next next) -> Async<void> {
        auto invocation = guard->begin();
        if (!invocation) {
            res.status(503).send("Service Unavailable");
            co_return;
        }

        try {
            co_await next();
        } catch (...) {
            invocation->abort();
            throw;
        }

        invocation->complete(res.get_status());
    };
}

Middleware circuit_breaker(std::shared_ptr<CircuitBreaker> breaker) {
    return circuit_breaker(std::make_shared<InvocationGuard>(std::move(breaker)));
}

Handler breaker_stats(std::shared_ptr<CircuitBreaker> breaker) {
    return [breaker](Request&, Response& res) -> Async<void> {
        boost::json::value stats = boost::json::value_from(breaker->stats());
        auto& obj = stats.as_object();
        obj["name"] = breaker->name();
        obj["state"] = std::string(to_string(breaker->state()));
        res.json(stats);
        co_return;
    };
}

} // namespace middleware

} // namespace tripwire
