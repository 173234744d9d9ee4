#include "./marker.hpp"

#include <dply/util/env.hpp>
#include <dply/util/fs/io.hpp>
#include <dply/util/log.hpp>

#include <magic_enum.hpp>

#include <algorithm>
#include <exception>

void dply::write_error_marker(std::string_view error) noexcept {
    dply_log(trace, "[error marker {}]", error);
    auto efile_path = dply::getenv("DPLY_WRITE_ERROR_MARKER");
    if (!efile_path) {
        return;
    }
    try {
        dply::write_file(*efile_path, error);
        dply_log(trace, "[error marker written to [{}]]", *efile_path);
    } catch (const std::exception& e) {
        dply_log(warn, "Failed to write error marker to [{}]: {}", *efile_path, e.what());
    }
}

std::string dply::error_marker_of(errc ec) noexcept {
    std::string ret{magic_enum::enum_name(ec)};
    std::ranges::replace(ret, '_', '-');
    return ret;
}
