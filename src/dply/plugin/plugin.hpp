#pragma once

#include <dply/config/target.hpp>
#include <dply/util/fs/path.hpp>

#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace dply {

class deploy_context;

/**
 * @brief Raised before a file is written to its destination.
 */
struct before_deploy_file_event {
    fs::path             file;
    const deploy_target& target;
    /// The directory that will receive the file
    fs::path destination;
    /// The full path of the file at the destination
    fs::path destination_file;
};

/**
 * @brief The terminal state of a single file's deployment.
 *
 * Exactly one of these is raised for every file that is handed to a plugin.
 */
struct file_completed_event {
    fs::path             file;
    const deploy_target& target;
    bool                 canceled = false;
    /// The reason the file failed, if it failed
    std::exception_ptr error;

    bool succeeded() const noexcept { return !canceled && !error; }
};

/**
 * @brief The terminal state of a workspace deployment.
 */
struct workspace_completed_event {
    const deploy_target& target;
    bool                 canceled = false;
    std::exception_ptr   error;
};

using before_deploy_file_handler    = std::function<void(const before_deploy_file_event&)>;
using file_completed_handler        = std::function<void(const file_completed_event&)>;
using workspace_completed_handler   = std::function<void(const workspace_completed_event&)>;

struct deploy_file_options {
    /// The directory that file paths are made relative to. Default is the workspace root.
    std::optional<fs::path>    base_directory;
    before_deploy_file_handler on_before_deploy;
    file_completed_handler     on_completed;
};

struct deploy_workspace_options {
    std::optional<fs::path>     base_directory;
    before_deploy_file_handler  on_before_deploy_file;
    file_completed_handler      on_file_completed;
    workspace_completed_handler on_completed;
};

struct plugin_info {
    std::string description;
};

/**
 * @brief Interface of a transport plugin: deploys files to targets of one kind.
 *
 * Implementations report every outcome through the callbacks of the given options rather than
 * by throwing. For each call to deploy_file(), `on_completed` is invoked exactly once. For each
 * call to deploy_workspace(), `on_file_completed` is invoked once per file and `on_completed`
 * once at the end.
 */
class deploy_plugin {
public:
    virtual ~deploy_plugin() = default;

    virtual void
    deploy_file(path_ref file, const deploy_target& target, const deploy_file_options& opts)
        = 0;

    virtual void deploy_workspace(const std::vector<fs::path>& files,
                                  const deploy_target&         target,
                                  const deploy_workspace_options& opts)
        = 0;

    virtual plugin_info info() const = 0;
};

/**
 * @brief Base class for plugins. Provides a deploy_workspace() that deploys the files one at a
 * time through deploy_file().
 */
class deploy_plugin_base : public deploy_plugin {
    deploy_context& _ctx;

public:
    explicit deploy_plugin_base(deploy_context& ctx) noexcept
        : _ctx(ctx) {}

    deploy_context& context() const noexcept { return _ctx; }

    void deploy_workspace(const std::vector<fs::path>&    files,
                          const deploy_target&            target,
                          const deploy_workspace_options& opts) override;

    plugin_info info() const override { return {}; }
};

}  // namespace dply
