#include <tripwire/state_machine.h>

namespace tripwire {

std::string_view to_string(State state) {
    switch (state) {
        case State::closed:    return "closed";
        case State::open:      return "open";
        case State::half_open: return "half-open";
        case State::shutdown:  return "shutdown";
    }
    return "unknown";
}

std::string_view to_string(Event event) {
    switch (event) {
        case Event::failure:       return "failure";
        case Event::success:       return "success";
        case Event::reset_elapsed: return "reset_elapsed";
        case Event::open:          return "open";
        case Event::close:         return "close";
        case Event::shutdown:      return "shutdown";
    }
    return "unknown";
}

namespace {

Transition to_open() {
    Transition t{State::open, {}};
    t.effects.start_reset_timer = true;
    t.effects.mark_open = true;
    return t;
}

Transition to_closed() {
    Transition t{State::closed, {}};
    t.effects.cancel_reset_timer = true;
    t.effects.mark_closed = true;
    return t;
}

} // namespace

Transition apply_event(State state, Event event, bool trip) {
    const Transition unchanged{state, {}};

    if (event == Event::shutdown) {
        Transition t{State::shutdown, {}};
        t.effects.cancel_reset_timer = true;
        t.effects.cancel_warm_up_timer = true;
        t.effects.stop_rotation = true;
        return t;
    }

    switch (state) {
        case State::shutdown:
            return unchanged;

        case State::closed:
            if (event == Event::failure && trip) return to_open();
            if (event == Event::open) return to_open();
            return unchanged;

        case State::half_open:
            if (event == Event::failure && trip) return to_open();
            if (event == Event::success) return to_closed();
            if (event == Event::open) return to_open();
            if (event == Event::close) return to_closed();
            return unchanged;

        case State::open:
            if (event == Event::reset_elapsed) return Transition{State::half_open, {}};
            if (event == Event::close) return to_closed();
            return unchanged;
    }
    return unchanged;
}

bool should_trip(const OpenGuardInput& input) {
    if (input.warming_up) return false;

    const bool probing = input.state == State::half_open;
    if (input.invocations < input.volume_threshold && !probing) return false;

    return input.error_percentage > input.error_threshold_percentage || probing;
}

} // namespace tripwire
