#pragma once

#include <dply/config/target.hpp>
#include <dply/util/fs/path.hpp>

#include <optional>

namespace dply {

struct e_source_file {
    fs::path value;
};

struct e_base_directory {
    fs::path value;
};

/**
 * @brief Compute the root directory of a target.
 *
 * This is the target's `dir`, or the workspace root if it has none. A relative `dir` is
 * resolved against the workspace root.
 */
[[nodiscard]] fs::path target_root_directory(const deploy_target& target, path_ref workspace_root);

/**
 * @brief Compute the destination path of a source file for the given target.
 *
 * The file is made relative to `base_dir` (which defaults to the workspace root). The target's
 * mappings are tried in the order they are declared: the first mapping whose `source` is a
 * prefix of the file's relative directory replaces that prefix with its `target`. If no mapping
 * applies, the relative path is kept unchanged. The result is placed beneath the target's root
 * directory, unless the applied mapping's `target` is absolute.
 *
 * Relative source and base paths are taken to be relative to the workspace root.
 *
 * Purely lexical. Throws `mapping_error` (with e_source_file and e_base_directory) if the
 * source file is not within the base directory.
 */
[[nodiscard]] fs::path resolve_target_path(path_ref                       source_file,
                                           const deploy_target&           target,
                                           path_ref                       workspace_root,
                                           const std::optional<fs::path>& base_dir = std::nullopt);

}  // namespace dply
