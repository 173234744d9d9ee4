#pragma once

#include "./plugin.hpp"

#include <memory>

namespace dply {

/**
 * @brief Deploys files to a directory on a local or mounted filesystem.
 *
 * The destination of a file is computed with resolve_target_path(). Files are copied over any
 * existing destination file, keeping their last-write time. If the target names a transformer,
 * the file contents are passed through that transform module and written instead.
 *
 * If the target sets `empty`, its root directory is emptied before a workspace is deployed.
 */
class local_plugin : public deploy_plugin_base {
public:
    using deploy_plugin_base::deploy_plugin_base;

    void deploy_file(path_ref                   file,
                     const deploy_target&       target,
                     const deploy_file_options& opts) override;

    void deploy_workspace(const std::vector<fs::path>&    files,
                          const deploy_target&            target,
                          const deploy_workspace_options& opts) override;

    plugin_info info() const override;
};

std::unique_ptr<deploy_plugin> create_local_plugin(deploy_context& ctx);

}  // namespace dply
