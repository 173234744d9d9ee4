#include "./log.hpp"

#include <neo/assert.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

spdlog::level::level_enum to_spdlog(dply::log::level l) noexcept {
    using dply::log::level;
    switch (l) {
    case level::trace:
        return spdlog::level::trace;
    case level::debug:
        return spdlog::level::debug;
    case level::info:
        return spdlog::level::info;
    case level::warn:
        return spdlog::level::warn;
    case level::error:
        return spdlog::level::err;
    case level::critical:
        return spdlog::level::critical;
    case level::silent:
        return spdlog::level::off;
    }
    neo_assert_always(invariant, false, "Invalid log level", int(l));
}

}  // namespace

void dply::log::init_logger() noexcept {
    auto logger = spdlog::get("dply");
    if (!logger) {
        logger = spdlog::stderr_color_mt("dply");
    }
    // Filtering happens in dply::log, against current_log_level
    logger->set_level(spdlog::level::trace);
    logger->set_pattern("[%^%-5l%$] %v");
    spdlog::set_default_logger(std::move(logger));
}

void dply::log::log_print(dply::log::level l, std::string_view msg) noexcept {
    spdlog::default_logger_raw()->log(to_spdlog(l), "{}", msg);
}
