#pragma once

#include <dply/util/log.hpp>
#include <debate/argument_parser.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dply {

namespace fs = std::filesystem;

namespace cli {

/**
 * @brief Top-level dply subcommands
 */
enum class subcommand {
    _none_,
    deploy,
    deploy_file,
    ls,
};

/**
 * @brief 'dply ls' subcommands
 */
enum class ls_subcommand {
    _none_,
    targets,
    packages,
    plugins,
};

/**
 * @brief Complete aggregate of all dply command-line options, and some utilities
 */
struct options {
    using path       = fs::path;
    using opt_path   = std::optional<fs::path>;
    using string     = std::string;
    using opt_string = std::optional<std::string>;

    options() noexcept;

    // The `--log-level` argument
    log::level log_level = log::level::info;

    // The top-most selected subcommand
    enum subcommand subcommand;

    // The `--workspace` argument, using the CWD as the default
    path workspace_dir = fs::current_path();
    // The `--config` argument. Relative paths are resolved against the workspace directory
    opt_path config_file;

    // Obtain the absolute path specified by 'workspace_dir' (resolve using the CWD)
    path absolute_workspace_dir_path() const noexcept;

    // All `--target` arguments
    std::vector<string> targets;

    /**
     * @brief Parameters specific to 'dply deploy'
     */
    struct {
        /// The name of the package to deploy
        string package;
    } deploy;

    /**
     * @brief Parameters specific to 'dply deploy-file'
     */
    struct {
        /// The files that the user has requested to be deployed
        std::vector<fs::path> files;
        /// The directory that the files are made relative to, if not the workspace
        opt_path base_dir;
    } deploy_file;

    /**
     * @brief Parameters for 'dply ls'
     */
    struct {
        /// What to list
        ls_subcommand subcommand;
    } ls;

    /**
     * @brief Attach arguments and subcommands to the given argument parser, binding those arguments
     * to the values in this object.
     */
    void setup_parser(debate::argument_parser& parser) noexcept;
};

}  // namespace cli
}  // namespace dply
