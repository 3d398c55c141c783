#pragma once

#include <string>
#include <optional>
#include <cstdlib>
#include <stdexcept>
#include <type_traits>

namespace relay {

    /**
     * @brief Loads KEY=VALUE lines from a dotenv file into the process environment.
     *
     * Blank lines and '#' comments are skipped, surrounding quotes are stripped,
     * and existing variables are overwritten.
     *
     * @return false if the file cannot be opened.
     */
    bool load_env(const std::string& path = ".env");

    /**
     * @brief Reads an environment variable converted to T.
     *
     * @throws std::runtime_error if the variable is unset and no default is given.
     * @throws std::invalid_argument if the value cannot be converted.
     */
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

        if constexpr (std::is_same_v<T, std::string>) {
            return s_val;
        }
        else if constexpr (std::is_same_v<T, int>) {
            try {
                size_t consumed = 0;
                int parsed = std::stoi(s_val, &consumed);
                if (consumed != s_val.size()) {
                    throw std::invalid_argument(s_val);
                }
                return parsed;
            } catch (const std::logic_error&) {
                throw std::invalid_argument("Invalid integer for " + key + ": " + s_val);
            }
        }
        else if constexpr (std::is_same_v<T, bool>) {
            if (s_val == "true" || s_val == "1" || s_val == "yes") return true;
            if (s_val == "false" || s_val == "0" || s_val == "no" || s_val.empty()) return false;
            throw std::invalid_argument("Invalid boolean for " + key + ": " + s_val);
        }
        else {
            static_assert(sizeof(T) == 0, "Unsupported type for relay::env");
        }
    }
}
