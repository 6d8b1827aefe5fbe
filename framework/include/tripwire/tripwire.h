#ifndef TRIPWIRE_TRIPWIRE_H
#define TRIPWIRE_TRIPWIRE_H

#include <tripwire/circuit_breaker.h>
#include <tripwire/environment.h>
#include <tripwire/exceptions.h>
#include <tripwire/invocation_guard.h>
#include <tripwire/logger.h>
#include <tripwire/middleware.h>
#include <tripwire/options.h>
#include <tripwire/rolling_window.h>
#include <tripwire/rotation.h>
#include <tripwire/scheduler.h>
#include <tripwire/state_machine.h>

#endif
