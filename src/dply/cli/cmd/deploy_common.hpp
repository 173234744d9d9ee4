#pragma once

#include "../options.hpp"

#include <dply/deploy/orchestrator.hpp>
#include <dply/deploy/session.hpp>

#include <exception>
#include <memory>
#include <string>
#include <vector>

namespace dply::cli {

/**
 * @brief Open the workspace and configuration selected by the `--workspace` and `--config`
 * options. The session follows SIGINT/SIGTERM for cancellation and writes output to stdout.
 */
std::unique_ptr<deploy_session> open_session(const options& opts);

/**
 * @brief The targets named with `--target`, or every target if none were named.
 */
std::vector<const deploy_target*> selected_targets(const options& opts, const deploy_config& cfg);

/**
 * @brief Workspace options that log the outcome of each file and workspace as it completes.
 */
deploy_workspace_options console_workspace_options(const deploy_context& ctx);

/// Log the outcome of a single file
void log_file_outcome(const deploy_context& ctx, const file_outcome& outcome, const deploy_target&);

/// The message of the given error
std::string describe_error(const std::exception_ptr& err);

/**
 * @brief Log a summary of the given reports.
 *
 * @return The exit code for the command: zero if every report is okay.
 */
int summarize(const std::vector<workspace_report>& reports);

}  // namespace dply::cli
