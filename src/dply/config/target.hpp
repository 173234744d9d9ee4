#pragma once

#include <yaml-cpp/node/node.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dply {

/**
 * @brief A directory-prefix rewrite rule applied when computing destination paths.
 */
struct target_mapping {
    /// The directory prefix (relative to the base directory) that this mapping claims
    std::filesystem::path source;
    /// The replacement for the `source` prefix
    std::filesystem::path target;
};

/**
 * @brief An operation that runs after all files of a workspace deployment have been deployed.
 */
struct after_deployed_operation {
    /// The kind of operation. Currently only "open" is known.
    std::string type;
    /// For "open": the URL, file or executable that should be opened
    std::string target;
};

/**
 * @brief A configured deployment destination.
 */
struct deploy_target {
    std::string name;
    /// Selects the plugin that deploys to this target
    std::string type;
    int         sort_order = 0;
    std::string description;

    /// The root directory of the target. Relative paths are resolved against the workspace root
    std::optional<std::filesystem::path> dir;
    /// Empty the root directory before deploying a workspace
    bool empty = false;

    /// Evaluated in order. The first mapping that claims a file wins.
    std::vector<target_mapping>           mappings;
    std::vector<after_deployed_operation> deployed;

    /// The ID of the transform module that is applied to file contents
    std::optional<std::string> transformer;
    /// Free-form options passed to the transform module
    YAML::Node transformer_options;

    /// The target's declaration as written, for plugins that need their own properties
    YAML::Node declaration;

    /// Display name: the name, or a placeholder for unnamed targets
    std::string display_name() const noexcept {
        return name.empty() ? std::string("(unnamed target)") : name;
    }
};

}  // namespace dply
