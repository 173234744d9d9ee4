#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace dply {

/**
 * @brief Read an environment variable. An unset or empty variable yields nullopt.
 */
std::optional<std::string> getenv(const std::string& name) noexcept;

/**
 * @brief Read an environment variable, falling back to the given default when it is unset or
 * empty.
 */
std::string getenv_or(const std::string& name, std::string_view default_value) noexcept;

}  // namespace dply
