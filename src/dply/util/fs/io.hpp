#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace dply {

struct e_write_file_path {
    std::filesystem::path value;
};

struct e_read_file_path {
    std::filesystem::path value;
};

/**
 * @brief Replace the contents of the given file, creating it if needed. The file's parent
 * directory must exist.
 *
 * Throws std::system_error on failure, with an e_write_file_path attached.
 */
void write_file(std::filesystem::path const& path, std::string_view content);

/**
 * @brief Read the entire content of the given file as bytes.
 *
 * Throws std::system_error on failure, with an e_read_file_path attached.
 */
[[nodiscard]] std::string read_file(std::filesystem::path const& path);

}  // namespace dply
