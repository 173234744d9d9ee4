#ifndef _WIN32
#include "./temp.hpp"

#include <dply/util/log.hpp>

#include <fmt/core.h>

#include <cerrno>
#include <cstdlib>
#include <system_error>

using namespace dply;

temporary_dir temporary_dir::create_in(path_ref parent, std::string_view prefix) {
    auto templ = (parent / fmt::format("{}-XXXXXX", prefix)).string();
    if (::mkdtemp(templ.data()) == nullptr) {
        throw std::system_error(std::error_code(errno, std::system_category()),
                                fmt::format("Failed to create a temporary directory in [{}]",
                                            parent.string()));
    }
    return temporary_dir{fs::path(templ)};
}

temporary_dir::~temporary_dir() {
    if (_path.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(_path, ec);
    if (ec) {
        dply_log(warn,
                 "Failed to remove temporary directory [{}]: {}",
                 _path.string(),
                 ec.message());
    }
}
#endif
