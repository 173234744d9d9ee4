#pragma once

#include <dply/util/fs/path.hpp>

#include <memory>
#include <string_view>

namespace dply {

namespace detail {

struct glob_impl;

}  // namespace detail

/**
 * @brief A path glob pattern.
 *
 * Patterns are split on '/' and each element is matched against one path element with shell
 * wildcard rules ('*', '?', '[...]'). An element spelled '**' matches any number of path
 * elements, including zero.
 */
class glob {
    std::shared_ptr<const detail::glob_impl> _impl;

    glob() = default;

public:
    static glob compile(std::string_view str);

    /// Check whether the given relative path matches this pattern.
    bool match(path_ref) const noexcept;

    std::string_view string() const noexcept;
};

}  // namespace dply
