#pragma once

#include <dply/config/config.hpp>
#include <dply/context/context.hpp>
#include <dply/context/module_loader.hpp>
#include <dply/context/output.hpp>
#include <dply/plugin/registry.hpp>
#include <dply/util/signal.hpp>

#include <iosfwd>

namespace dply {

/**
 * @brief Owns everything a deployment needs: the configuration, the output channel, the loaded
 * modules and plugins, and the context that ties them together.
 *
 * On construction, the built-in plugins and every module listed in the configuration's
 * `modules` are loaded.
 */
class deploy_session {
    deploy_config   _config;
    output_channel  _output;
    module_loader   _modules;
    deploy_context  _context;
    // Destroyed before the context that the plugins refer to
    plugin_registry _registry;

public:
    deploy_session(deploy_config config,
                   fs::path      workspace_root,
                   cancel_token  cancel,
                   std::ostream& output);

    deploy_session(const deploy_session&) = delete;
    deploy_session& operator=(const deploy_session&) = delete;

    /**
     * @brief Open the workspace at the given directory, loading its configuration file.
     *
     * @param config_file The configuration file. Defaults to default_config_path()
     */
    static std::unique_ptr<deploy_session> open(path_ref                       workspace_root,
                                                const std::optional<fs::path>& config_file,
                                                cancel_token                   cancel,
                                                std::ostream&                  output);

    deploy_context&        context() noexcept { return _context; }
    const deploy_config&   config() const noexcept { return _config; }
    plugin_registry&       registry() noexcept { return _registry; }
    const plugin_registry& registry() const noexcept { return _registry; }
};

}  // namespace dply
