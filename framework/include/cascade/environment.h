#ifndef CASCADE_ENVIRONMENT_H
#define CASCADE_ENVIRONMENT_H

#include <cstddef>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace cascade {

/**
 * @brief Loads KEY=VALUE lines from a dotenv file into the process
 * environment, overwriting existing variables. Returns false when the file
 * cannot be opened.
 */
bool load_env(const std::string& path = ".env");

/**
 * @brief Reads an environment variable converted to T.
 *
 * Without a default, a missing variable throws std::runtime_error.
 * usage: auto port = env<int>("PORT", 8080);
 */
template <typename T = std::string>
T env(const std::string& key, std::optional<T> default_value = std::nullopt) {
    const char* val = std::getenv(key.c_str());

    if (val == nullptr || *val == '\0') {
        if (default_value.has_value()) {
            return default_value.value();
        }
        throw std::runtime_error("Missing environment variable: " + key);
    }

    std::string s_val = val;

    if constexpr (std::is_same_v<T, std::string>) {
        return s_val;
    } else if constexpr (std::is_same_v<T, bool>) {
        return s_val == "true" || s_val == "1" || s_val == "yes";
    } else if constexpr (std::is_same_v<T, int>) {
        return std::stoi(s_val);
    } else if constexpr (std::is_same_v<T, std::size_t>) {
        return static_cast<std::size_t>(std::stoull(s_val));
    } else if constexpr (std::is_same_v<T, double>) {
        return std::stod(s_val);
    } else {
        static_assert(sizeof(T) == 0, "Unsupported type for cascade::env");
    }
}

} // namespace cascade

#endif // CASCADE_ENVIRONMENT_H
