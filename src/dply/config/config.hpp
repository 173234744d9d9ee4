#pragma once

#include "./package.hpp"
#include "./target.hpp"

#include <dply/util/fs/path.hpp>

#include <yaml-cpp/node/node.h>

#include <string>
#include <string_view>
#include <vector>

namespace dply {

/**
 * @brief The contents of a workspace's deployment configuration (deploy.yaml)
 */
struct deploy_config {
    std::vector<deploy_target>  targets;
    std::vector<deploy_package> packages;
    /// Paths of additional plugin modules to load, as written (relative to the workspace root)
    std::vector<std::string> modules;

    /**
     * @brief Build a configuration from a parsed YAML document.
     *
     * A null document yields an empty configuration. Throws
     * user_error<errc::invalid_config_file> with an e_config_key naming the offending property
     * if the document is malformed.
     */
    [[nodiscard]] static deploy_config from_yaml(const YAML::Node& doc);

    /**
     * @brief Load and parse the given configuration file.
     */
    [[nodiscard]] static deploy_config load_file(path_ref filepath);

    /**
     * @brief Find the target with the given name.
     *
     * Throws user_error<errc::unknown_target> with an e_nonesuch if there is no such target.
     */
    [[nodiscard]] const deploy_target& get_target(std::string_view name) const;

    /**
     * @brief Find the package with the given name.
     *
     * Throws user_error<errc::unknown_package> with an e_nonesuch if there is no such package.
     */
    [[nodiscard]] const deploy_package& get_package(std::string_view name) const;

    /// The targets, ordered by their sort order and then by name
    [[nodiscard]] std::vector<const deploy_target*> sorted_targets() const;
    /// The packages, ordered by their sort order and then by name
    [[nodiscard]] std::vector<const deploy_package*> sorted_packages() const;
};

/// The default location of the configuration file within a workspace
inline fs::path default_config_path(path_ref workspace_root) {
    return workspace_root / "deploy.yaml";
}

/**
 * @brief Order a list of targets by their sort order, breaking ties by name.
 */
void sort_targets(std::vector<const deploy_target*>& targets);

}  // namespace dply
