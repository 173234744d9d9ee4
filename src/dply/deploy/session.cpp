#include "./session.hpp"

#include <dply/error/result.hpp>
#include <dply/util/log.hpp>

using namespace dply;

deploy_session::deploy_session(deploy_config config,
                               fs::path      workspace_root,
                               cancel_token  cancel,
                               std::ostream& output)
    : _config(std::move(config))
    , _output(output)
    , _modules(workspace_root)
    , _context(_config, workspace_root, std::move(cancel), _output, _modules, _registry) {
    _registry.load_builtins(_context);
    _registry.load_modules(_context, _config.modules);
    dply_log(debug,
             "Session for [{}]: {} target(s), {} package(s), {} plugin(s)",
             workspace_root.string(),
             _config.targets.size(),
             _config.packages.size(),
             _registry.size());
}

std::unique_ptr<deploy_session> deploy_session::open(path_ref                       workspace_root,
                                                     const std::optional<fs::path>& config_file,
                                                     cancel_token                   cancel,
                                                     std::ostream&                  output) {
    auto root = resolve_path_strong(workspace_root).value();
    auto cfg_path = config_file.value_or(default_config_path(root));
    if (cfg_path.is_relative()) {
        cfg_path = root / cfg_path;
    }
    auto config = deploy_config::load_file(cfg_path);
    return std::make_unique<deploy_session>(std::move(config), root, std::move(cancel), output);
}
