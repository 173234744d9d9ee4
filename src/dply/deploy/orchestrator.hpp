#pragma once

#include <dply/config/package.hpp>
#include <dply/config/target.hpp>
#include <dply/plugin/plugin.hpp>
#include <dply/util/fs/path.hpp>

#include <cstddef>
#include <exception>
#include <string>
#include <vector>

namespace dply {

class deploy_context;

/// The name of the target that a deployment was running against
struct e_deploy_target {
    std::string value;
};

/**
 * @brief The recorded terminal state of one file
 */
struct file_outcome {
    fs::path           file;
    bool               canceled = false;
    std::exception_ptr error;

    bool succeeded() const noexcept { return !canceled && !error; }
};

/**
 * @brief The aggregated result of deploying a set of files to one target
 */
struct workspace_report {
    const deploy_target*      target = nullptr;
    std::vector<file_outcome> files;

    std::size_t succeeded = 0;
    std::size_t failed    = 0;
    std::size_t canceled  = 0;

    /// Whether the workspace deployment as a whole was canceled
    bool workspace_canceled = false;
    /// A failure that affected the workspace deployment as a whole
    std::exception_ptr workspace_error;
    /// The failure of the target's after-deployed operations, if they ran and failed
    std::exception_ptr after_deployed_error;

    /// Every file was deployed, and nothing failed or was canceled
    bool okay() const noexcept {
        return failed == 0 && canceled == 0 && !workspace_canceled && !workspace_error
            && !after_deployed_error;
    }
};

/**
 * @brief Drives deployments through the plugins of a context.
 *
 * Whatever the plugin does, a deployment of N files through the orchestrator raises exactly N
 * file completions and, for workspace deployments, exactly one workspace completion. A plugin's
 * file completion is matched to a given file by normalized path, and relayed with the path as
 * the caller gave it.
 */
class deploy_orchestrator {
    deploy_context& _ctx;

public:
    explicit deploy_orchestrator(deploy_context& ctx) noexcept
        : _ctx(ctx) {}

    /**
     * @brief Deploy a set of files to a target.
     *
     * The plugin for the target's type is resolved first: if there is not exactly one, the
     * error is thrown and no callback is invoked. If cancellation was requested before the
     * deployment starts, every file and the workspace complete as canceled without involving
     * the plugin.
     *
     * File completions that the plugin raises more than once are dropped. Files that the plugin
     * never completes are completed afterwards with the workspace's error, or as canceled.
     */
    workspace_report deploy_workspace(const std::vector<fs::path>&    files,
                                      const deploy_target&            target,
                                      const deploy_workspace_options& opts = {});

    /**
     * @brief Deploy a single file to a target.
     *
     * Resolves the plugin like deploy_workspace(), and raises exactly one completion.
     */
    file_outcome deploy_file(path_ref                   file,
                             const deploy_target&       target,
                             const deploy_file_options& opts = {});

    /**
     * @brief Deploy the files of a package to each of the given targets.
     *
     * Targets are deployed one after another, ordered by sort order and then name. After a
     * target's deployment completes without any failure or cancellation, its after-deployed
     * operations are run.
     */
    std::vector<workspace_report> deploy_package(const deploy_package&                    pkg,
                                                 const std::vector<const deploy_target*>& targets,
                                                 const deploy_workspace_options& opts = {});
};

}  // namespace dply
