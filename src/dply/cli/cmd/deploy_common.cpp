#include "./deploy_common.hpp"

#include <dply/context/context.hpp>
#include <dply/error/marker.hpp>
#include <dply/util/log.hpp>
#include <dply/util/signal.hpp>

#include <fansi/styled.hpp>
#include <neo/assert.hpp>

#include <algorithm>
#include <iostream>

using namespace dply;
using namespace fansi::literals;

namespace {

std::string display_path(const deploy_context& ctx, path_ref file) {
    auto rel = relative_within(file, ctx.workspace_root());
    return rel ? rel->generic_string() : file.string();
}

}  // namespace

std::unique_ptr<deploy_session> cli::open_session(const options& opts) {
    return deploy_session::open(opts.absolute_workspace_dir_path(),
                                opts.config_file,
                                cancel_token::follow_signals(),
                                std::cout);
}

std::vector<const deploy_target*> cli::selected_targets(const options&       opts,
                                                        const deploy_config& cfg) {
    if (opts.targets.empty()) {
        return cfg.sorted_targets();
    }
    std::vector<const deploy_target*> ret;
    for (auto& name : opts.targets) {
        auto& target = cfg.get_target(name);
        if (std::ranges::find(ret, &target) == ret.end()) {
            ret.push_back(&target);
        }
    }
    sort_targets(ret);
    return ret;
}

std::string cli::describe_error(const std::exception_ptr& err) {
    try {
        std::rethrow_exception(err);
    } catch (const std::exception& e) {
        return e.what();
    }
    neo::unreachable();
}

void cli::log_file_outcome(const deploy_context& ctx,
                           const file_outcome&   outcome,
                           const deploy_target&  target) {
    auto shown = display_path(ctx, outcome.file);
    if (outcome.canceled) {
        dply_log(warn, "Canceled [{}] for .bold.cyan[{}]"_styled, shown, target.display_name());
    } else if (outcome.error) {
        dply_log(error,
                 "Failed to deploy [.bold.yellow[{}]] to .bold.cyan[{}]: .bold.red[{}]"_styled,
                 shown,
                 target.display_name(),
                 describe_error(outcome.error));
    } else {
        dply_log(info, "Deployed [{}] to .bold.cyan[{}]"_styled, shown, target.display_name());
    }
}

deploy_workspace_options cli::console_workspace_options(const deploy_context& ctx) {
    return deploy_workspace_options{
        .on_before_deploy_file =
            [&ctx](const before_deploy_file_event& ev) {
                dply_log(debug,
                         "Deploying [{}] to [{}]",
                         display_path(ctx, ev.file),
                         ev.destination_file.string());
            },
        .on_file_completed =
            [&ctx](const file_completed_event& ev) {
                log_file_outcome(ctx,
                                 file_outcome{.file     = ev.file,
                                              .canceled = ev.canceled,
                                              .error    = ev.error},
                                 ev.target);
            },
        .on_completed =
            [](const workspace_completed_event& ev) {
                if (ev.error) {
                    dply_log(error,
                             "Deployment to .bold.cyan[{}] failed: .bold.red[{}]"_styled,
                             ev.target.display_name(),
                             describe_error(ev.error));
                } else if (ev.canceled) {
                    dply_log(warn,
                             "Deployment to .bold.cyan[{}] was canceled"_styled,
                             ev.target.display_name());
                }
            },
    };
}

int cli::summarize(const std::vector<workspace_report>& reports) {
    bool all_okay = true;
    for (auto& report : reports) {
        if (report.after_deployed_error) {
            dply_log(error,
                     "After-deployment operations of .bold.cyan[{}] failed: .bold.red[{}]"_styled,
                     report.target->display_name(),
                     describe_error(report.after_deployed_error));
        }
        if (report.okay()) {
            dply_log(info,
                     ".bold.cyan[{}]: .bold.green[{}] file(s) deployed"_styled,
                     report.target->display_name(),
                     report.succeeded);
        } else {
            all_okay = false;
            dply_log(warn,
                     ".bold.cyan[{}]: {} deployed, .bold.red[{}] failed, .bold.yellow[{}] canceled"_styled,
                     report.target->display_name(),
                     report.succeeded,
                     report.failed,
                     report.canceled);
        }
    }
    // Turn an interrupted deployment into the cancellation exit code
    cancellation_point();
    if (!all_okay) {
        write_error_marker("deployment-failed");
        return 1;
    }
    return 0;
}
