#pragma once

#include <string>
#include <vector>

namespace dply {

/**
 * @brief A named group of workspace files, selected by include and exclude globs.
 */
struct deploy_package {
    std::string name;
    std::string description;
    /// Include globs, relative to the workspace root. Empty means every file.
    std::vector<std::string> files;
    std::vector<std::string> exclude;
    int                      sort_order = 0;
};

}  // namespace dply
