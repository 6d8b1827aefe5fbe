#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <type_traits>

namespace tripwire {

    /** @brief Loads KEY=VALUE lines from a .env file into the process environment. */
    bool load_env(const std::string& path = ".env");

    /**
     * @brief true/1/yes/on or false/0/no/off, case-insensitive.
     * @throws std::invalid_argument for any other spelling.
     */
    bool parse_bool(const std::string& value);

    template <typename T = std::string>
    T env(const std::string& key, std::optional<T> default_value = std::nullopt) {
        const char* val = std::getenv(key.c_str());

        if (val == nullptr) {
            if (default_value.has_value()) {
                return default_value.value();
            }
            throw std::runtime_error("Missing environment variable: " + key);
        }

        std::string s_val = val;

        std::size_t parsed = 0;
        auto whole = [&](auto value) {
            if (parsed != s_val.size()) {
                throw std::invalid_argument("Trailing characters in environment variable: " + key);
            }
            return value;
        };

        if constexpr (std::is_same_v<T, std::string>) {
            return s_val;
        }
        else if constexpr (std::is_same_v<T, int>) {
            return whole(std::stoi(s_val, &parsed));
        }
        else if constexpr (std::is_same_v<T, std::int64_t>) {
            return whole(static_cast<std::int64_t>(std::stoll(s_val, &parsed)));
        }
        else if constexpr (std::is_same_v<T, double>) {
            return whole(std::stod(s_val, &parsed));
        }
        else if constexpr (std::is_same_v<T, bool>) {
            return parse_bool(s_val);
        }
        else {
            static_assert(sizeof(T) == 0, "Unsupported type for tripwire::env");
        }
    }
}
