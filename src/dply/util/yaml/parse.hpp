#pragma once

#include <yaml-cpp/node/node.h>

#include <filesystem>
#include <string>
#include <string_view>

namespace dply {

struct e_parse_yaml_file_path {
    std::filesystem::path value;
};

/**
 * @brief Where and why a YAML document failed to parse. Line and column count from one; both
 * are zero if the parser did not report a position.
 */
struct e_yaml_parse_error {
    std::string message;
    int         line   = 0;
    int         column = 0;
};

/**
 * @brief Parse the YAML document in the given file.
 *
 * A read failure throws std::system_error. A syntax error throws
 * user_error<errc::invalid_config_file> with an e_yaml_parse_error. Both carry the file's path
 * as an e_parse_yaml_file_path.
 */
YAML::Node parse_yaml_file(const std::filesystem::path&);

/// Parse a YAML document held in memory. Errors are reported as with parse_yaml_file()
YAML::Node parse_yaml_string(std::string_view);

}  // namespace dply
