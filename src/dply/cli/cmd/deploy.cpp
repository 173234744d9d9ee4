#include "../options.hpp"
#include "./deploy_common.hpp"

#include <dply/util/log.hpp>

#include <fansi/styled.hpp>

using namespace fansi::literals;

namespace dply::cli::cmd {

int deploy(const options& opts) {
    auto  session = open_session(opts);
    auto& config  = session->config();
    auto& pkg     = config.get_package(opts.deploy.package);
    auto  targets = selected_targets(opts, config);
    if (targets.empty()) {
        dply_log(warn, "The configuration declares no targets. Nothing was deployed.");
        return 0;
    }

    auto& ctx = session->context();
    dply_log(info,
             "Deploying package .bold.cyan[{}] to {} target(s)"_styled,
             pkg.name,
             targets.size());
    deploy_orchestrator orch{ctx};
    auto reports = orch.deploy_package(pkg, targets, console_workspace_options(ctx));
    return summarize(reports);
}

}  // namespace dply::cli::cmd
