#pragma once

#include "./module_loader.hpp"
#include "./output.hpp"

#include <dply/config/config.hpp>
#include <dply/util/fs/path.hpp>
#include <dply/util/signal.hpp>

#include <string_view>
#include <vector>

namespace dply {

class plugin_registry;

/**
 * @brief The session-wide state that every plugin is given.
 *
 * The referenced objects are fixed when the context is constructed. The context does not own
 * them, and they must outlive it.
 */
class deploy_context {
    const deploy_config&   _config;
    fs::path               _workspace_root;
    cancel_token           _cancel;
    output_channel&        _output;
    module_loader&         _modules;
    const plugin_registry& _plugins;

public:
    deploy_context(const deploy_config&   config,
                   fs::path               workspace_root,
                   cancel_token           cancel,
                   output_channel&        output,
                   module_loader&         modules,
                   const plugin_registry& plugins) noexcept
        : _config(config)
        , _workspace_root(std::move(workspace_root))
        , _cancel(std::move(cancel))
        , _output(output)
        , _modules(modules)
        , _plugins(plugins) {}

    deploy_context(const deploy_context&) = delete;
    deploy_context& operator=(const deploy_context&) = delete;

    /// Whether the operator has asked for the current deployment to stop
    [[nodiscard]] bool is_cancelling() const noexcept { return _cancel.is_requested(); }

    output_channel& output() const noexcept { return _output; }
    path_ref        workspace_root() const noexcept { return _workspace_root; }

    const deploy_config&               config() const noexcept { return _config; }
    const std::vector<deploy_target>&  targets() const noexcept { return _config.targets; }
    const std::vector<deploy_package>& packages() const noexcept { return _config.packages; }
    const plugin_registry&             plugins() const noexcept { return _plugins; }

    /**
     * @brief Load the transform module with the given ID. See module_loader::require().
     */
    const transform_module& require(std::string_view id) const { return _modules.require(id); }

    /// Report a failure to the operator through the log, as opposed to the deployment output
    void error(std::string_view message) const;
};

}  // namespace dply
