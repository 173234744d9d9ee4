#include "./orchestrator.hpp"

#include "./after_deployed.hpp"
#include "./package_files.hpp"

#include <dply/config/config.hpp>
#include <dply/context/context.hpp>
#include <dply/error/errors.hpp>
#include <dply/error/result.hpp>
#include <dply/plugin/registry.hpp>
#include <dply/util/fs/path.hpp>
#include <dply/util/log.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <map>

using namespace dply;

namespace {

/**
 * Keeps track of which files of a deployment have reached a terminal state, and forwards each
 * file's first completion to the caller.
 */
class completion_tracker {
    workspace_report&             _report;
    const file_completed_handler& _relay;
    std::vector<bool>             _done;
    // Indices of not-yet-completed files, by normalized path. A path may be given more than once.
    std::map<fs::path, std::vector<std::size_t>> _pending;

public:
    completion_tracker(workspace_report&             report,
                       const std::vector<fs::path>&  files,
                       const file_completed_handler& relay)
        : _report(report)
        , _relay(relay)
        , _done(files.size(), false) {
        _report.files.reserve(files.size());
        for (std::size_t idx = 0; idx < files.size(); ++idx) {
            _report.files.push_back(file_outcome{.file = files[idx]});
            _pending[normalize_path(files[idx])].push_back(idx);
        }
    }

    void complete(const file_completed_event& ev) {
        auto found = _pending.find(normalize_path(ev.file));
        if (found == _pending.end() || found->second.empty()) {
            dply_log(warn,
                     "Ignoring a repeated or unexpected completion of [{}] for [{}]",
                     ev.file.string(),
                     ev.target.display_name());
            return;
        }
        auto idx = found->second.front();
        found->second.erase(found->second.begin());
        _done[idx] = true;

        auto& out    = _report.files[idx];
        out.canceled = ev.canceled;
        out.error    = ev.canceled ? nullptr : ev.error;
        if (out.canceled) {
            ++_report.canceled;
        } else if (out.error) {
            ++_report.failed;
        } else {
            ++_report.succeeded;
        }
        if (_relay) {
            // Relay the path as the caller spelled it
            auto relayed = ev;
            relayed.file = out.file;
            _relay(relayed);
        }
    }

    /// Complete every file that has not completed yet
    void complete_rest(const deploy_target& target, bool canceled, std::exception_ptr error) {
        for (std::size_t idx = 0; idx < _done.size(); ++idx) {
            if (_done[idx]) {
                continue;
            }
            complete(file_completed_event{
                .file     = _report.files[idx].file,
                .target   = target,
                .canceled = canceled,
                .error    = error,
            });
        }
    }

    bool all_done() const noexcept {
        return std::ranges::all_of(_done, [](bool b) { return b; });
    }
};

}  // namespace

workspace_report deploy_orchestrator::deploy_workspace(const std::vector<fs::path>&    files,
                                                       const deploy_target&            target,
                                                       const deploy_workspace_options& opts) {
    DPLY_E_SCOPE(e_deploy_target{target.name});
    auto plugin = _ctx.plugins().resolve(target.type);

    workspace_report report;
    report.target = &target;
    completion_tracker tracker{report, files, opts.on_file_completed};

    auto finish = [&] {
        if (opts.on_completed) {
            opts.on_completed(workspace_completed_event{
                .target   = target,
                .canceled = report.workspace_canceled,
                .error    = report.workspace_error,
            });
        }
        dply_log(debug,
                 "Deployment to [{}] finished: {} succeeded, {} failed, {} canceled",
                 target.display_name(),
                 report.succeeded,
                 report.failed,
                 report.canceled);
    };

    if (_ctx.is_cancelling()) {
        report.workspace_canceled = true;
        tracker.complete_rest(target, true, nullptr);
        finish();
        return report;
    }

    dply_log(info,
             "Deploying {} file(s) to [{}] ({})",
             files.size(),
             target.display_name(),
             plugin.identity.type);

    bool                     workspace_completed = false;
    deploy_workspace_options plugin_opts;
    plugin_opts.base_directory        = opts.base_directory;
    plugin_opts.on_before_deploy_file = opts.on_before_deploy_file;
    plugin_opts.on_file_completed     = [&](const file_completed_event& ev) { tracker.complete(ev); };
    plugin_opts.on_completed          = [&](const workspace_completed_event& ev) {
        if (workspace_completed) {
            dply_log(warn,
                     "Ignoring a repeated workspace completion for [{}]",
                     target.display_name());
            return;
        }
        workspace_completed       = true;
        report.workspace_canceled = ev.canceled;
        report.workspace_error    = ev.error;
    };

    try {
        plugin.plugin.deploy_workspace(files, target, plugin_opts);
    } catch (const std::exception& e) {
        if (!workspace_completed) {
            dply_log(debug, "Plugin [{}] raised an exception: {}", plugin.identity.file, e.what());
            workspace_completed    = true;
            report.workspace_error = std::current_exception();
        } else {
            dply_log(warn,
                     "Plugin [{}] raised an exception after completing the deployment to "
                     "[{}]: {}",
                     plugin.identity.file,
                     target.display_name(),
                     e.what());
        }
    }

    if (!workspace_completed) {
        dply_log(warn,
                 "Plugin [{}] did not report the completion of the deployment to [{}]",
                 plugin.identity.file,
                 target.display_name());
        report.workspace_canceled = _ctx.is_cancelling();
    }

    if (!tracker.all_done()) {
        if (report.workspace_error) {
            tracker.complete_rest(target, false, report.workspace_error);
        } else if (report.workspace_canceled || _ctx.is_cancelling()) {
            tracker.complete_rest(target, true, nullptr);
        } else {
            dply_log(warn,
                     "Plugin [{}] did not report a result for every file",
                     plugin.identity.file);
            tracker.complete_rest(target,
                                  false,
                                  std::make_exception_ptr(make_external_error<errc::write_failure>(
                                      "The '{}' plugin did not report a result for the file",
                                      plugin.identity.type)));
        }
    }

    finish();
    return report;
}

file_outcome deploy_orchestrator::deploy_file(path_ref                   file,
                                              const deploy_target&       target,
                                              const deploy_file_options& opts) {
    DPLY_E_SCOPE(e_deploy_target{target.name});
    auto plugin = _ctx.plugins().resolve(target.type);

    workspace_report   report;
    std::vector<fs::path> files = {file};
    completion_tracker tracker{report, files, opts.on_completed};

    if (_ctx.is_cancelling()) {
        tracker.complete_rest(target, true, nullptr);
        return report.files.front();
    }

    deploy_file_options plugin_opts;
    plugin_opts.base_directory   = opts.base_directory;
    plugin_opts.on_before_deploy = opts.on_before_deploy;
    plugin_opts.on_completed     = [&](const file_completed_event& ev) { tracker.complete(ev); };

    try {
        plugin.plugin.deploy_file(file, target, plugin_opts);
    } catch (const std::exception& e) {
        if (tracker.all_done()) {
            dply_log(warn,
                     "Plugin [{}] raised an exception after completing [{}]: {}",
                     plugin.identity.file,
                     file.string(),
                     e.what());
        } else {
            dply_log(debug, "Plugin [{}] raised an exception: {}", plugin.identity.file, e.what());
            tracker.complete_rest(target, false, std::current_exception());
        }
    }

    if (!tracker.all_done()) {
        if (_ctx.is_cancelling()) {
            tracker.complete_rest(target, true, nullptr);
        } else {
            tracker.complete_rest(target,
                                  false,
                                  std::make_exception_ptr(make_external_error<errc::write_failure>(
                                      "The '{}' plugin did not report a result for the file",
                                      plugin.identity.type)));
        }
    }
    return report.files.front();
}

std::vector<workspace_report>
deploy_orchestrator::deploy_package(const deploy_package&                    pkg,
                                    const std::vector<const deploy_target*>& targets_,
                                    const deploy_workspace_options&          opts) {
    auto targets = targets_;
    sort_targets(targets);

    // Resolve every plugin first so that a bad target type fails before anything is deployed
    for (auto t : targets) {
        DPLY_E_SCOPE(e_deploy_target{t->name});
        (void)_ctx.plugins().resolve(t->type);
    }

    auto files = resolve_package_files(pkg, _ctx.workspace_root());
    _ctx.output().write_line(fmt::format("Deploying package '{}' ({} file(s)) to {} target(s)",
                                         pkg.name,
                                         files.size(),
                                         targets.size()));

    std::vector<workspace_report> reports;
    for (auto t : targets) {
        auto report = deploy_workspace(files, *t, opts);
        if (report.okay() && !t->deployed.empty()) {
            try {
                run_after_deployed_operations(*t, _ctx);
            } catch (const error_base& e) {
                dply_log(error, "{}", e.what());
                report.after_deployed_error = std::current_exception();
            }
        }
        reports.push_back(std::move(report));
    }
    return reports;
}
