#pragma once

#include <dply/util/fs/path.hpp>

#include <string>
#include <string_view>
#include <utility>

namespace dply {

struct e_module_path {
    fs::path value;
};

struct e_module_symbol {
    std::string value;
};

/**
 * @brief An owning handle to a dynamically loaded shared object.
 *
 * The object is unloaded when the handle is destroyed. Anything obtained from the library
 * (function pointers, objects created by its code) must be released before that.
 */
class shared_library {
    void*    _handle = nullptr;
    fs::path _path;

    shared_library(void* h, fs::path p) noexcept
        : _handle(h)
        , _path(std::move(p)) {}

public:
    shared_library() = default;
    ~shared_library();

    shared_library(shared_library&& other) noexcept
        : _handle(std::exchange(other._handle, nullptr))
        , _path(std::move(other._path)) {}

    shared_library& operator=(shared_library&& other) noexcept;

    /**
     * @brief Load the shared object at the given path.
     *
     * Throws user_error<errc::module_load_failure> if the object cannot be loaded.
     */
    [[nodiscard]] static shared_library open(path_ref filepath);

    path_ref path() const noexcept { return _path; }

    /// Obtain the address of the named symbol, or nullptr if it is not exported
    [[nodiscard]] void* find_symbol(std::string_view name) const noexcept;

    template <typename Func>
    [[nodiscard]] Func* find_function(std::string_view name) const noexcept {
        return reinterpret_cast<Func*>(find_symbol(name));
    }
};

}  // namespace dply
