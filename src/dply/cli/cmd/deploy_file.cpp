#include "../options.hpp"
#include "./deploy_common.hpp"

#include <dply/context/context.hpp>
#include <dply/error/result.hpp>
#include <dply/plugin/registry.hpp>
#include <dply/util/log.hpp>

#include <fansi/styled.hpp>

using namespace fansi::literals;

namespace dply::cli::cmd {

int deploy_file(const options& opts) {
    auto  session = open_session(opts);
    auto& ctx     = session->context();
    auto  targets = selected_targets(opts, session->config());

    // Fail on a bad target type before anything is deployed
    for (auto t : targets) {
        DPLY_E_SCOPE(e_deploy_target{t->name});
        (void)ctx.plugins().resolve(t->type);
    }

    std::vector<fs::path> files;
    for (auto& file : opts.deploy_file.files) {
        files.push_back(resolve_path_weak(file));
    }

    auto wopts = console_workspace_options(ctx);
    if (opts.deploy_file.base_dir) {
        wopts.base_directory = resolve_path_weak(*opts.deploy_file.base_dir);
    }

    deploy_orchestrator           orch{ctx};
    std::vector<workspace_report> reports;
    for (auto t : targets) {
        if (files.size() == 1) {
            // A single file goes through the plugin's single-file entry point
            auto outcome = orch.deploy_file(files.front(),
                                            *t,
                                            deploy_file_options{
                                                .base_directory   = wopts.base_directory,
                                                .on_before_deploy = wopts.on_before_deploy_file,
                                                .on_completed     = wopts.on_file_completed,
                                            });
            workspace_report report{.target = t};
            report.succeeded = outcome.succeeded() ? 1 : 0;
            report.failed    = outcome.error ? 1 : 0;
            report.canceled  = outcome.canceled ? 1 : 0;
            report.files.push_back(std::move(outcome));
            reports.push_back(std::move(report));
        } else {
            reports.push_back(orch.deploy_workspace(files, *t, wopts));
        }
    }
    return summarize(reports);
}

}  // namespace dply::cli::cmd
