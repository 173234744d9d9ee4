#pragma once

namespace dply::cli {

struct options;

/**
 * @brief Run the subcommand selected by the given options.
 *
 * @return The process exit code
 */
int dispatch_main(const options&) noexcept;

}  // namespace dply::cli
