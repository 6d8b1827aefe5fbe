#ifndef TRIPWIRE_EXCEPTIONS_H
#define TRIPWIRE_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace tripwire {

/**
 * @brief Base class for all exceptions thrown by tripwire.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Invalid thresholds, durations or bucket counts.
 * Raised from constructors only, never while a call is being guarded.
 */
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& msg) : Error("Invalid configuration: " + msg) {}
};

} // namespace tripwire

#endif
