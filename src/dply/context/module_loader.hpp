#pragma once

#include <dply/transform/transform.hpp>
#include <dply/util/fs/path.hpp>

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>

namespace dply {

struct e_transform_module_id {
    std::string value;
};

/**
 * @brief Resolves transform module IDs to loaded transform modules.
 *
 * An ID naming a built-in module (see builtin_transform_module()) yields that module. Any other
 * ID is the path of a shared object, relative to the workspace root if not absolute. Modules are
 * loaded once and cached for the lifetime of the loader.
 */
class module_loader {
    fs::path                                           _workspace_root;
    std::map<std::string, transform_module, std::less<>> _cache;

public:
    explicit module_loader(fs::path workspace_root) noexcept
        : _workspace_root(std::move(workspace_root)) {}

    /**
     * @brief Obtain the transform module with the given ID, loading it if needed.
     *
     * Throws user_error<errc::module_load_failure> if the module cannot be loaded.
     */
    const transform_module& require(std::string_view id);
};

}  // namespace dply
