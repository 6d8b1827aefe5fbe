#ifndef TRIPWIRE_STATE_MACHINE_H
#define TRIPWIRE_STATE_MACHINE_H

#include <cstdint>
#include <string_view>

namespace tripwire {

enum class State {
    closed,
    open,
    half_open,
    shutdown
};

enum class Event {
    failure,        // a failure was recorded; `trip` carries the open-guard verdict
    success,
    reset_elapsed,  // the cooldown timer fired
    open,           // explicit open()
    close,          // explicit close()
    shutdown
};

std::string_view to_string(State state);
std::string_view to_string(Event event);

/**
 * @brief Side effects the owner of the state must carry out, in this order:
 * cancel timers, start the reset timer, update the window flag, stop rotation.
 */
struct Effects {
    bool cancel_reset_timer = false;
    bool cancel_warm_up_timer = false;
    bool start_reset_timer = false;
    bool mark_open = false;
    bool mark_closed = false;
    bool stop_rotation = false;

    bool operator==(const Effects&) const = default;
};

struct Transition {
    State next;
    Effects effects;

    bool changed(State from) const { return next != from; }
};

/**
 * @brief The breaker's transition table.
 *
 * closed    + failure(trip)  -> open       start reset timer, mark open
 * half_open + failure(trip)  -> open       start reset timer, mark open
 * open      + reset_elapsed  -> half_open  (no effects)
 * half_open + success        -> closed     cancel reset timer, mark closed
 * !open     + open           -> open       start reset timer, mark open
 * !closed   + close          -> closed     cancel reset timer, mark closed
 * any       + shutdown       -> shutdown   cancel both timers, stop rotation
 *
 * Every other pair leaves the state untouched with no effects. shutdown
 * absorbs every event except a repeated shutdown, which re-issues its
 * (idempotent) cancellations.
 */
Transition apply_event(State state, Event event, bool trip = false);

struct OpenGuardInput {
    State state = State::closed;
    bool warming_up = false;
    std::uint64_t invocations = 0;
    double error_percentage = 0.0;
    std::uint64_t volume_threshold = 0;
    double error_threshold_percentage = 50.0;
};

/**
 * @brief Decides whether a just-recorded failure trips the breaker.
 *
 * Failures during warm-up never trip. Below the volume threshold nothing
 * trips unless the breaker is probing in half_open, where any failure
 * trips regardless of rate.
 */
bool should_trip(const OpenGuardInput& input);

} // namespace tripwire

#endif // TRIPWIRE_STATE_MACHINE_H
