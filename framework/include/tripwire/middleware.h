#ifndef TRIPWIRE_MIDDLEWARE_H
#define TRIPWIRE_MIDDLEWARE_H

#include <tripwire/circuit_breaker.h>
#include <tripwire/invocation_guard.h>
#include <tripwire/request.h>
#include <tripwire/response.h>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <functional>
#include <memory>

namespace tripwire {

template <typename T = void>
using Async = boost::asio::awaitable<T>;

using Next = std::function<Async<void>()>;
using Middleware = std::function<Async<void>(Request&, Response&, Next)>;
using Handler = std::function<Async<void>(Request&, Response&)>;

/**
 * @brief Asynchronously waits for a specified duration.
 * usage: co_await tripwire::delay(std::chrono::milliseconds(50));
 */
Async<void> delay(std::chrono::milliseconds ms);

namespace middleware {

    /**
     * @brief Guards everything after it in the chain.
     *
     * usage: app.use(middleware::circuit_breaker(guard));
     *
     * An open breaker answers 503 "Service Unavailable" without calling next().
     * The response status is classified once next() returns; an exception
     * escaping next() counts as an abrupt termination and is rethrown.
     */
    Middleware circuit_breaker(std::shared_ptr<InvocationGuard> guard);

    Middleware circuit_breaker(std::shared_ptr<CircuitBreaker> breaker);

    /** @brief Serves the breaker's name, state and aggregate window as JSON. */
    Handler breaker_stats(std::shared_ptr<CircuitBreaker> breaker);

} // namespace middleware

} // namespace tripwire

#endif
