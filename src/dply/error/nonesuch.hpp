#pragma once

#include <dply/util/dym.hpp>

#include <optional>
#include <string>
#include <string_view>

#include <iosfwd>

namespace dply {

/**
 * @brief Error context for a name that was looked up but not found: a target, a package, or a
 * target type.
 */
struct e_nonesuch {
    /// What kind of thing was looked up, e.g. "target"
    std::string kind;
    /// The name that was given
    std::string given;
    /// The closest known name, if any
    std::optional<std::string> nearest;

    /**
     * @brief Build an e_nonesuch whose `nearest` is the closest of the given candidate names.
     */
    template <typename Range>
    static e_nonesuch among(std::string_view kind, std::string_view given, Range&& candidates) {
        return e_nonesuch{std::string(kind),
                          std::string(given),
                          did_you_mean(given, candidates)};
    }

    /// Log "Unknown <kind> '<given>'" and the suggestion, if there is one
    void log_error() const noexcept;

};

std::ostream& operator<<(std::ostream& out, const e_nonesuch& self) noexcept;

}  // namespace dply
