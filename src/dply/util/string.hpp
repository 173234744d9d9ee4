#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace dply {

inline namespace string_utils {

inline std::string_view trim_view(std::string_view s) noexcept {
    constexpr std::string_view ws = " \t\n\r\f\v";
    auto                       beg = s.find_first_not_of(ws);
    if (beg == s.npos) {
        return {};
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(beg, end - beg + 1);
}

/**
 * @brief Trim and lowercase the given string. Target types compare in this form.
 */
inline std::string normalize_key(std::string_view s) {
    auto ret = std::string(trim_view(s));
    std::ranges::transform(ret, ret.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ret;
}

}  // namespace string_utils

}  // namespace dply
