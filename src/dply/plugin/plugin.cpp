#include "./plugin.hpp"

#include <dply/context/context.hpp>
#include <dply/util/log.hpp>

using namespace dply;

void deploy_plugin_base::deploy_workspace(const std::vector<fs::path>&    files,
                                          const deploy_target&            target,
                                          const deploy_workspace_options& opts) {
    bool canceled = false;
    for (auto& file : files) {
        if (!canceled && context().is_cancelling()) {
            dply_log(info, "Deployment to [{}] was canceled", target.display_name());
            canceled = true;
        }
        if (canceled) {
            if (opts.on_file_completed) {
                opts.on_file_completed(file_completed_event{
                    .file     = file,
                    .target   = target,
                    .canceled = true,
                    .error    = nullptr,
                });
            }
            continue;
        }

        bool                completed = false;
        deploy_file_options file_opts;
        file_opts.base_directory   = opts.base_directory;
        file_opts.on_before_deploy = opts.on_before_deploy_file;
        file_opts.on_completed     = [&](const file_completed_event& ev) {
            completed = true;
            if (ev.canceled) {
                canceled = true;
            }
            if (opts.on_file_completed) {
                opts.on_file_completed(ev);
            }
        };

        try {
            deploy_file(file, target, file_opts);
        } catch (const std::exception& e) {
            if (completed) {
                throw;
            }
            dply_log(debug, "Deploying [{}] raised an exception: {}", file.string(), e.what());
            file_opts.on_completed(file_completed_event{
                .file     = file,
                .target   = target,
                .canceled = false,
                .error    = std::current_exception(),
            });
        }
    }

    if (opts.on_completed) {
        opts.on_completed(workspace_completed_event{
            .target   = target,
            .canceled = canceled,
            .error    = nullptr,
        });
    }
}
