#include <tripwire/options.h>
#include <tripwire/environment.h>
#include <tripwire/exceptions.h>
#include <cmath>
#include <stdexcept>

namespace tripwire {

bool default_is_error(int status) {
    return status >= 400;
}

void BreakerOptions::validate() const {
    window_options().validate();

    if (timeout && timeout->count() <= 0) {
        throw ConfigError("timeout must be positive (use nullopt to disable it)");
    }
    if (reset_timeout.count() <= 0) {
        throw ConfigError("reset timeout must be positive");
    }
    if (!std::isfinite(error_threshold_percentage) ||
        error_threshold_percentage < 0.0 || error_threshold_percentage > 100.0) {
        throw ConfigError("error threshold percentage must be within [0, 100]");
    }
    if (!is_error) {
        throw ConfigError("error predicate must be callable");
    }
}

WindowOptions BreakerOptions::window_options() const {
    WindowOptions window;
    window.bucket_count = rolling_count_buckets;
    window.window_duration = rolling_count_timeout;
    window.percentiles_enabled = rolling_percentiles_enabled;
    return window;
}

namespace {

template <typename T>
std::optional<T> read(const std::string& key) {
    try {
        if (std::getenv(key.c_str()) == nullptr) return std::nullopt;
        return env<T>(key);
    } catch (const std::invalid_argument&) {
        throw ConfigError(key + " is not a valid value");
    } catch (const std::out_of_range&) {
        throw ConfigError(key + " is out of range");
    }
}

Millis read_millis(const std::string& key, std::int64_t value) {
    if (value <= 0) {
        throw ConfigError(key + " must be positive");
    }
    return Millis(value);
}

} // namespace

BreakerOptions options_from_env(const std::string& prefix, BreakerOptions base) {
    const std::string p = prefix + "_";

    if (auto v = read<std::string>(p + "NAME")) base.name = *v;

    if (auto v = read<std::string>(p + "TIMEOUT_MS")) {
        if (*v == "false" || *v == "0") {
            base.timeout = std::nullopt;
        } else {
            base.timeout = read_millis(p + "TIMEOUT_MS", *read<std::int64_t>(p + "TIMEOUT_MS"));
        }
    }
    if (auto v = read<std::int64_t>(p + "RESET_TIMEOUT_MS")) {
        base.reset_timeout = read_millis(p + "RESET_TIMEOUT_MS", *v);
    }
    if (auto v = read<std::int64_t>(p + "WINDOW_MS")) {
        base.rolling_count_timeout = read_millis(p + "WINDOW_MS", *v);
    }
    if (auto v = read<int>(p + "BUCKETS")) {
        if (*v < 1) throw ConfigError(p + "BUCKETS must be at least 1");
        base.rolling_count_buckets = static_cast<std::size_t>(*v);
    }
    if (auto v = read<bool>(p + "PERCENTILES")) base.rolling_percentiles_enabled = *v;
    if (auto v = read<double>(p + "ERROR_THRESHOLD")) base.error_threshold_percentage = *v;
    if (auto v = read<std::int64_t>(p + "VOLUME_THRESHOLD")) {
        if (*v < 0) throw ConfigError(p + "VOLUME_THRESHOLD must not be negative");
        base.volume_threshold = static_cast<std::uint64_t>(*v);
    }
    if (auto v = read<bool>(p + "WARM_UP")) base.allow_warm_up = *v;
    if (auto v = read<bool>(p + "LOG_ONLY")) base.log_only = *v;
    if (auto v = read<bool>(p + "ENABLED")) base.enabled = *v;

    base.validate();
    return base;
}

} // namespace tripwire
