#pragma once

#include "./path.hpp"

#include <dply/error/result.hpp>

#include <ostream>

namespace dply::inline file_utils {

struct e_create_directory {
    fs::path value;
};

struct e_empty_directory {
    fs::path value;
};

struct e_copy_file {
    fs::path source;
    fs::path dest;

    friend std::ostream& operator<<(std::ostream& out, const e_copy_file& self) noexcept {
        out << "e_copy_file: From [" << self.source.string() << "] to [" << self.dest.string()
            << "]";
        return out;
    }
};

/**
 * @brief Ensure that the named directory exists, creating it and its parents if needed.
 *
 * An existing non-directory file at the path is an error.
 */
[[nodiscard]] result<void> ensure_directory(path_ref dir) noexcept;

/**
 * @brief Ensure that `dir` exists and contains nothing.
 *
 * Every entry inside of the directory is removed, but the directory itself is kept. If the
 * directory does not exist, it is created.
 */
[[nodiscard]] result<void> empty_directory(path_ref dir) noexcept;

/**
 * @brief Copy the file 'source' to 'dest', overwriting 'dest' if it exists.
 *
 * The last-write time of 'source' is applied to 'dest'.
 *
 * @param source The file to copy
 * @param dest The destination of the copied file (not the parent directory!)
 */
[[nodiscard]] result<void> copy_file_overwrite(path_ref source, path_ref dest) noexcept;

}  // namespace dply::inline file_utils
