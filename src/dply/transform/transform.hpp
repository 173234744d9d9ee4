#pragma once

#include <yaml-cpp/node/node.h>

#include <functional>
#include <string>
#include <string_view>

namespace dply {

enum class transform_mode {
    /// Applied to file contents before they are written to a target
    transform,
    /// Applied to contents read back from a target, reversing `transform`
    restore,
};

std::string_view to_string(transform_mode) noexcept;

/**
 * @brief The input of a transform function.
 */
struct transform_context {
    /// The bytes to transform
    std::string_view data;
    transform_mode   mode = transform_mode::transform;
    /// The target's free-form transformer options. May be null.
    YAML::Node options;
};

using transform_function = std::function<std::string(const transform_context&)>;

/**
 * @brief A named pair of byte transformations.
 *
 * For any options, restore_data(transform_data(b)) must yield b. Either direction may be
 * missing, in which case applying the module in that direction is an error.
 */
struct transform_module {
    std::string        id;
    transform_function transform_data;
    transform_function restore_data;
};

struct e_transform_module {
    std::string value;
};

struct e_transform_mode {
    transform_mode value;
};

/**
 * @brief Pass `data` through the given transform module in the given direction.
 *
 * If `module` is null, returns `data` unchanged. Throws `transform_error` if the module does
 * not implement the requested direction or if the transform function throws. The message of
 * the original exception is kept.
 */
[[nodiscard]] std::string apply_transform(std::string             data,
                                          transform_mode          mode,
                                          const transform_module* module,
                                          const YAML::Node&       options = YAML::Node());

}  // namespace dply
