#include "./shutil.hpp"

#include <dply/error/result.hpp>
#include <dply/util/log.hpp>

#include <system_error>
#include <vector>

using namespace dply;

result<void> dply::ensure_directory(path_ref dir) noexcept {
    DPLY_E_SCOPE(e_create_directory{dir});
    std::error_code ec;
    if (fs::is_directory(dir, ec)) {
        return {};
    }
    fs::create_directories(dir, ec);
    if (ec) {
        return new_error(ec);
    }
    if (!fs::is_directory(dir, ec)) {
        return new_error(std::make_error_code(std::errc::not_a_directory));
    }
    return {};
}

result<void> dply::empty_directory(path_ref dir) noexcept {
    DPLY_E_SCOPE(e_empty_directory{dir});
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        if (ec) {
            return new_error(ec);
        }
        fs::create_directories(dir, ec);
        if (ec) {
            return new_error(ec);
        }
        return {};
    }
    if (!fs::is_directory(dir, ec)) {
        return new_error(std::make_error_code(std::errc::not_a_directory));
    }
    std::vector<fs::path> children;
    for (auto iter = fs::directory_iterator{dir, ec}; !ec && iter != fs::directory_iterator{};
         iter.increment(ec)) {
        children.push_back(iter->path());
    }
    if (ec) {
        return new_error(ec);
    }
    for (auto& child : children) {
        dply_log(trace, "Removing [{}]", child.string());
        fs::remove_all(child, ec);
        if (ec) {
            return new_error(ec, child);
        }
    }
    return {};
}

result<void> dply::copy_file_overwrite(path_ref source, path_ref dest) noexcept {
    std::error_code ec;
    DPLY_E_SCOPE(e_copy_file{source, dest});
    DPLY_E_SCOPE(ec);
    fs::copy_file(source, dest, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return BOOST_LEAF_NEW_ERROR();
    }
    auto mtime = fs::last_write_time(source, ec);
    if (!ec) {
        fs::last_write_time(dest, mtime, ec);
    }
    if (ec) {
        // Not fatal: the content is already in place
        dply_log(debug,
                 "Failed to carry over the timestamp of [{}]: {}",
                 source.string(),
                 ec.message());
    }
    return {};
}
