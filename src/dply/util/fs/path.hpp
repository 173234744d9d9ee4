#pragma once

#include <dply/error/result.hpp>

#include <filesystem>
#include <optional>

namespace dply {

namespace fs = std::filesystem;

/**
 * @brief Alias of a const& to a std::filesystem::path
 */
using path_ref = const fs::path&;

/**
 * @brief An error occurring when resolving a filepath
 */
struct e_resolve_path {
    fs::path value;
};

/**
 * @brief Convert a path to its most-normal form.
 *
 * This removes redundant path elements (dots and dot-dots) and trailing directory separators.
 * No filesystem access is performed.
 */
[[nodiscard]] fs::path normalize_path(path_ref p) noexcept;

/**
 * @brief Obtain the normalized absolute path to a possibly-existing file or directory.
 */
[[nodiscard]] fs::path resolve_path_weak(path_ref p) noexcept;

/**
 * @brief Obtain the normalized path to an existing file or directory.
 */
[[nodiscard]] result<fs::path> resolve_path_strong(path_ref p) noexcept;

/**
 * @brief Lexically compute the path of `p` relative to `base`.
 *
 * Both paths are normalized first. If `p` is not `base` itself or a path below `base`, returns
 * nullopt. A relative `p` is taken to already be relative to `base`. The filesystem is not
 * consulted.
 */
[[nodiscard]] std::optional<fs::path> relative_within(path_ref p, path_ref base) noexcept;

/**
 * @brief Determine whether the leading elements of `p` are exactly the elements of `prefix`.
 *
 * Compares whole path elements: "src/ab" does not start with "src/a".
 */
[[nodiscard]] bool path_starts_with(path_ref p, path_ref prefix) noexcept;

}  // namespace dply
