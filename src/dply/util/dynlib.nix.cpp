#ifndef _WIN32
#include "./dynlib.hpp"

#include <dply/error/errors.hpp>
#include <dply/error/result.hpp>
#include <dply/util/log.hpp>

#include <boost/leaf/exception.hpp>

#include <dlfcn.h>

using namespace dply;

shared_library::~shared_library() {
    if (_handle) {
        ::dlclose(_handle);
    }
}

shared_library& shared_library::operator=(shared_library&& other) noexcept {
    if (this != &other) {
        if (_handle) {
            ::dlclose(_handle);
        }
        _handle = std::exchange(other._handle, nullptr);
        _path   = std::move(other._path);
    }
    return *this;
}

shared_library shared_library::open(path_ref filepath) {
    DPLY_E_SCOPE(e_module_path{filepath});
    auto handle = ::dlopen(filepath.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (handle == nullptr) {
        const char* message = ::dlerror();
        BOOST_LEAF_THROW_EXCEPTION(
            make_user_error<errc::module_load_failure>("Failed to load module [{}]: {}",
                                                       filepath.string(),
                                                       message ? message : "unknown error"));
    }
    dply_log(debug, "Loaded module [{}]", filepath.string());
    return shared_library{handle, filepath};
}

void* shared_library::find_symbol(std::string_view name) const noexcept {
    if (!_handle) {
        return nullptr;
    }
    auto sym_name = std::string(name);
    return ::dlsym(_handle, sym_name.c_str());
}
#endif  // _WIN32
