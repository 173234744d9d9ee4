#pragma once

#include <dply/error/errors.hpp>

#include <string>
#include <string_view>

namespace dply {

/**
 * @brief Write an error marker string to the file named by DPLY_WRITE_ERROR_MARKER, if set.
 *
 * Used by scripted callers to tell which error condition caused dply to exit.
 */
void write_error_marker(std::string_view) noexcept;

/**
 * @brief The marker string for an error code: its name, in kebab-case (e.g.
 * "unmappable-path").
 */
std::string error_marker_of(errc) noexcept;

}  // namespace dply
