#pragma once

#include <fmt/format.h>

#include <string_view>

namespace dply::log {

enum class level : int {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    silent,
};

inline level current_log_level = level::info;

/**
 * @brief Set up the logger that dply's messages are written to.
 *
 * Log messages go to stderr, so that stdout carries only deployment output and listings.
 */
void init_logger() noexcept;

void log_print(level l, std::string_view s) noexcept;

inline bool level_enabled(level l) noexcept { return int(l) >= int(current_log_level); }

template <typename... Args>
void log(level l, std::string_view s, const Args&... args) noexcept {
    if (!level_enabled(l)) {
        return;
    }
    try {
        log_print(l, fmt::vformat(s, fmt::make_format_args(args...)));
    } catch (const fmt::format_error& e) {
        log_print(level::error, fmt::format("Bad log message format '{}': {}", s, e.what()));
    }
}

#define dply_log(Level, str, ...)                                                                  \
    do {                                                                                           \
        if (::dply::log::level_enabled(::dply::log::level::Level)) {                               \
            ::dply::log::log(::dply::log::level::Level, str __VA_OPT__(, ) __VA_ARGS__);           \
        }                                                                                          \
    } while (0)

}  // namespace dply::log
