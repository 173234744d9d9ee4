#include "./env.hpp"

#include <cstdlib>

std::optional<std::string> dply::getenv(const std::string& name) noexcept {
    auto cptr = std::getenv(name.c_str());
    if (cptr == nullptr || *cptr == '\0') {
        return std::nullopt;
    }
    return std::string(cptr);
}

std::string dply::getenv_or(const std::string& name, std::string_view default_value) noexcept {
    return getenv(name).value_or(std::string(default_value));
}
