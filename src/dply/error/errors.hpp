#pragma once

#include <fmt/core.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace dply {

enum class errc {
    none = 0,

    // Per-file pipeline failures
    unmappable_path,
    directory_failure,
    write_failure,
    transform_failure,

    // Workspace-level failures
    empty_target_failure,
    after_deployed_failure,

    // Configuration failures
    invalid_config_file,
    unknown_target_type,
    ambiguous_target_type,
    unknown_target,
    unknown_package,
    module_load_failure,
};

/// A long-form description of an error condition, shown after the error message
std::string_view explanation_of(errc) noexcept;

/**
 * @brief Base of every exception that dply raises for a known error condition.
 */
class error_base : public std::runtime_error {
    errc _ec;

public:
    error_base(errc ec, std::string message)
        : runtime_error(std::move(message))
        , _ec(ec) {}

    errc             get_errc() const noexcept { return _ec; }
    std::string_view explanation() const noexcept { return explanation_of(_ec); }
};

/// An error caused by the user's input or configuration
template <errc Code>
struct user_error : error_base {
    explicit user_error(std::string message)
        : error_base(Code, std::move(message)) {}
};

/// An error raised by the environment: the filesystem, a module, or a child process
template <errc Code>
struct external_error : error_base {
    explicit external_error(std::string message)
        : error_base(Code, std::move(message)) {}
};

/// A source file cannot be expressed relative to the base directory
using mapping_error = user_error<errc::unmappable_path>;
/// The destination directory of a file could not be created
using directory_error = external_error<errc::directory_failure>;
/// The transport failed to write a file
using write_error = external_error<errc::write_failure>;
/// A transform module is missing a direction or failed while running
using transform_error = external_error<errc::transform_failure>;
/// A target's type does not resolve to exactly one plugin
using unknown_target_type_error   = user_error<errc::unknown_target_type>;
using ambiguous_target_type_error = user_error<errc::ambiguous_target_type>;

template <errc Code, typename... Args>
user_error<Code> make_user_error(std::string_view fmt_str, const Args&... args) {
    return user_error<Code>(fmt::vformat(fmt_str, fmt::make_format_args(args...)));
}

template <errc Code, typename... Args>
external_error<Code> make_external_error(std::string_view fmt_str, const Args&... args) {
    return external_error<Code>(fmt::vformat(fmt_str, fmt::make_format_args(args...)));
}

template <errc Code, typename... Args>
[[noreturn]] void throw_external_error(std::string_view fmt_str, const Args&... args) {
    throw make_external_error<Code>(fmt_str, args...);
}

}  // namespace dply
