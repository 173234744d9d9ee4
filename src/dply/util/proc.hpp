#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dply {

/**
 * @brief Render a command line for display, quoting the arguments that need it.
 */
std::string quote_command(const std::vector<std::string>& command);

struct proc_result {
    int signal = 0;
    int retc   = 0;
    /// The combined stdout/stderr of the process, if it was captured
    std::string output;

    bool okay() const noexcept { return retc == 0 && signal == 0; }
};

struct proc_options {
    std::vector<std::string> command;

    std::optional<std::filesystem::path> cwd = std::nullopt;

    /**
     * Collect the output of the process. When false, the output is discarded. Programs that
     * leave long-running children behind (desktop openers, for one) should not be captured:
     * collecting would wait for those children to close the output pipe.
     */
    bool capture_output = true;
};

/**
 * @brief Spawn a subprocess and wait for it to exit.
 *
 * Throws std::system_error if the process cannot be spawned. A program that cannot be found
 * results in a nonzero exit code.
 */
proc_result run_proc(const proc_options& opts);

}  // namespace dply
