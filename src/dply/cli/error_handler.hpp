#pragma once

#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace debate {
class argument_parser;
}

namespace dply {

/**
 * @brief Invoke the given function, handling any error that escapes it by logging a message
 * for the user.
 *
 * @return The return value of the function, or the exit code chosen by the handler of the error
 * that occurred.
 */
int handle_cli_errors(std::function<int()>) noexcept;

/**
 * @brief Parse `argv` with the given parser.
 *
 * A help request prints the help text to `out`. A usage error prints the usage and a one-line
 * message to `err`.
 *
 * @return nullopt if the parsed command should be run, otherwise the exit code: 0 after help was
 * printed and 2 after a usage error.
 */
std::optional<int> parse_command_line(const debate::argument_parser& parser,
                                      std::string_view               program_name,
                                      const std::vector<std::string>& argv,
                                      std::ostream&                   out,
                                      std::ostream&                   err) noexcept;

}  // namespace dply
