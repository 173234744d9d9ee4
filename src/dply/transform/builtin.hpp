#pragma once

#include "./transform.hpp"

#include <optional>
#include <string_view>

namespace dply {

std::string base64_encode(std::string_view data);
/// Throws std::invalid_argument on malformed input
std::string base64_decode(std::string_view data);

/**
 * @brief Get the transform module built into dply with the given ID, if there is one.
 *
 * - `base64`: Base64 encoding of the contents.
 * - `xor`: XOR of every byte with the repeating `key` option (a string, defaulting to a
 *   single 0x5a byte). Self-inverse.
 */
std::optional<transform_module> builtin_transform_module(std::string_view id);

}  // namespace dply
