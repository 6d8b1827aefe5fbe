#ifndef TRIPWIRE_OPTIONS_H
#define TRIPWIRE_OPTIONS_H

#include <tripwire/logger.h>
#include <tripwire/rolling_window.h>
#include <tripwire/scheduler.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace tripwire {

/** @brief Returns true when a completed call should count as a failure. */
using ErrorPredicate = std::function<bool(int status)>;

/** @brief Client or server error: status >= 400. */
bool default_is_error(int status);

struct BreakerOptions {
    std::string name;                          // empty: "circuit-breaker-<n>"
    bool log_only = false;                     // count and log, never reject
    std::optional<Millis> timeout = Millis{10000};  // nullopt: no completion deadline
    Millis reset_timeout{30000};               // open -> half-open cooldown
    Millis rolling_count_timeout{10000};       // window duration
    std::size_t rolling_count_buckets = 10;
    bool rolling_percentiles_enabled = true;
    double error_threshold_percentage = 50.0;
    bool enabled = true;
    bool allow_warm_up = false;
    std::uint64_t volume_threshold = 0;
    ErrorPredicate is_error = default_is_error;
    std::shared_ptr<Logger> logger;            // null: Logger::instance()

    /** @throws ConfigError */
    void validate() const;

    WindowOptions window_options() const;

    // Fluent setters
    BreakerOptions& with_name(std::string value) { name = std::move(value); return *this; }
    BreakerOptions& with_timeout(std::optional<Millis> value) { timeout = value; return *this; }
    BreakerOptions& with_reset_timeout(Millis value) { reset_timeout = value; return *this; }
    BreakerOptions& with_window(Millis duration, std::size_t buckets) {
        rolling_count_timeout = duration;
        rolling_count_buckets = buckets;
        return *this;
    }
    BreakerOptions& with_error_threshold(double percentage) { error_threshold_percentage = percentage; return *this; }
    BreakerOptions& with_volume_threshold(std::uint64_t value) { volume_threshold = value; return *this; }
    BreakerOptions& with_warm_up(bool value = true) { allow_warm_up = value; return *this; }
    BreakerOptions& with_log_only(bool value = true) { log_only = value; return *this; }
    BreakerOptions& with_error_predicate(ErrorPredicate value) { is_error = std::move(value); return *this; }
    BreakerOptions& with_logger(std::shared_ptr<Logger> value) { logger = std::move(value); return *this; }
};

/**
 * @brief Overlays environment variables onto `base`.
 *
 * Reads <PREFIX>_NAME, _TIMEOUT_MS (0 or "false" disables), _RESET_TIMEOUT_MS,
 * _WINDOW_MS, _BUCKETS, _PERCENTILES, _ERROR_THRESHOLD, _VOLUME_THRESHOLD,
 * _WARM_UP, _LOG_ONLY and _ENABLED. Unset variables keep the base value.
 *
 * @throws ConfigError when a variable cannot be parsed or the result is invalid.
 */
BreakerOptions options_from_env(const std::string& prefix = "CIRCUIT_BREAKER",
                                BreakerOptions base = {});

} // namespace tripwire

#endif // TRIPWIRE_OPTIONS_H
