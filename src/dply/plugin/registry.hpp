#pragma once

#include "./plugin.hpp"

#include <dply/util/dynlib.hpp>
#include <dply/util/fs/path.hpp>

#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace dply {

/**
 * @brief Where a plugin instance came from. Assigned once when the plugin is registered.
 */
struct plugin_identity {
    /// The full path of the module that provided the plugin. Empty for built-in plugins.
    fs::path file_path;
    /// The file name of the module, or the name of a built-in plugin
    std::string file;
    /// The order in which the plugin was registered, starting at zero
    std::size_t index = 0;
    /// The target type that the plugin handles
    std::string type;
};

struct e_target_type {
    std::string value;
};

/**
 * @brief A plugin and its identity, as seen from outside of the registry.
 */
struct registered_plugin {
    const plugin_identity& identity;
    deploy_plugin&         plugin;
};

/**
 * @brief The set of plugins loaded for a session, keyed by the target type they handle.
 *
 * Type comparisons ignore case and surrounding whitespace.
 */
class plugin_registry {
    struct entry {
        // Declared first so that it is destroyed last: the plugin's code may live in the library
        std::shared_ptr<shared_library> library;
        std::unique_ptr<deploy_plugin>  plugin;
        plugin_identity                 identity;
    };

    std::deque<entry> _entries;

public:
    plugin_registry() = default;

    plugin_registry(const plugin_registry&) = delete;
    plugin_registry& operator=(const plugin_registry&) = delete;

    /**
     * @brief Register a plugin for the given type.
     *
     * @param type The target type that the plugin handles
     * @param file_path The path of the module that the plugin came from, if any
     * @param plugin The plugin instance
     * @param library The library that must stay loaded while the plugin exists, if any
     */
    const plugin_identity& add(std::string                     type,
                               fs::path                        file_path,
                               std::unique_ptr<deploy_plugin>  plugin,
                               std::shared_ptr<shared_library> library = nullptr);

    /**
     * @brief Register the plugins that are built into dply ("local").
     */
    void load_builtins(deploy_context& ctx);

    /**
     * @brief Load a plugin module from a shared object and register its plugin.
     *
     * Throws user_error<errc::module_load_failure> if the module cannot be loaded or does not
     * provide a plugin.
     */
    const plugin_identity& load_module(deploy_context& ctx, path_ref filepath);

    /**
     * @brief Load each of the given modules. Relative paths are resolved against the workspace
     * root of the context.
     */
    void load_modules(deploy_context& ctx, const std::vector<std::string>& modules);

    /// Every registered plugin handling the given type
    [[nodiscard]] std::vector<registered_plugin> find(std::string_view type) const;

    /**
     * @brief Obtain the one plugin that handles the given type.
     *
     * Throws unknown_target_type_error if no plugin handles the type, and
     * ambiguous_target_type_error if more than one does.
     */
    [[nodiscard]] registered_plugin resolve(std::string_view type) const;

    [[nodiscard]] std::vector<registered_plugin> plugins() const;

    [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }
};

/// The plugin type provided by a module file: its stem without a leading "lib"
[[nodiscard]] std::string plugin_type_of_module(path_ref filepath);

}  // namespace dply
