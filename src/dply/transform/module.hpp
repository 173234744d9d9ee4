#pragma once

#include "./transform.hpp"

#include <dply/util/dynlib.hpp>

#include <memory>

namespace dply {

/**
 * @brief Create a transform_module whose directions call into the given shared object.
 *
 * The module keeps the library loaded for as long as it (or a copy of it) lives. Throws
 * user_error<errc::module_load_failure> if the library exports neither direction.
 */
[[nodiscard]] transform_module make_shared_object_transform(std::string                     id,
                                                            std::shared_ptr<shared_library> lib);

}  // namespace dply
