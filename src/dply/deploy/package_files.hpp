#pragma once

#include <dply/config/package.hpp>
#include <dply/util/fs/path.hpp>

#include <vector>

namespace dply {

struct e_package_glob {
    std::string value;
};

/**
 * @brief Find the files in a workspace that belong to the given package.
 *
 * A file belongs to the package if its path relative to the workspace root matches at least one
 * of the package's `files` globs (every file, if there are none) and none of its `exclude`
 * globs. Directories are never returned. The result holds absolute paths in lexical order.
 */
[[nodiscard]] std::vector<fs::path> resolve_package_files(const deploy_package& pkg,
                                                          path_ref              workspace_root);

}  // namespace dply
