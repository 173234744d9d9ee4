#pragma once

#include <dply/util/fs/path.hpp>

#include <string_view>
#include <utility>

namespace dply {

/**
 * @brief Owns a freshly created, uniquely named directory, and removes it with all of its
 * content on destruction. Move-only.
 */
class temporary_dir {
    fs::path _path;

    explicit temporary_dir(fs::path p) noexcept
        : _path(std::move(p)) {}

public:
    /**
     * @brief Create a directory named "<prefix>-XXXXXX" within `parent`.
     *
     * Throws std::system_error if the directory cannot be created.
     */
    static temporary_dir create_in(path_ref parent, std::string_view prefix = "dply");
    static temporary_dir create(std::string_view prefix = "dply") {
        return create_in(fs::temp_directory_path(), prefix);
    }

    temporary_dir(temporary_dir&& other) noexcept
        : _path(std::exchange(other._path, fs::path())) {}
    temporary_dir& operator=(temporary_dir&&) = delete;
    temporary_dir(const temporary_dir&)      = delete;
    ~temporary_dir();

    path_ref path() const noexcept { return _path; }
};

}  // namespace dply
