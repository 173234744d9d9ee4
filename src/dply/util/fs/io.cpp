#include "./io.hpp"

#include <dply/error/result.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/core.h>

#include <cerrno>
#include <fstream>
#include <iterator>

using namespace dply;

using path_ref = const std::filesystem::path&;

namespace {

[[noreturn]] void throw_io_error(int e, std::string_view what, path_ref fpath) {
    auto ec = std::error_code{e ? e : EIO, std::system_category()};
    BOOST_LEAF_THROW_EXCEPTION(std::system_error(ec, fmt::format("{} [{}]", what, fpath.string())),
                               boost::leaf::e_errno{ec.value()},
                               ec);
}

}  // namespace

void dply::write_file(path_ref dest, std::string_view content) {
    DPLY_E_SCOPE(e_write_file_path{dest});
    errno = 0;
    std::ofstream ofile{dest, std::ios::binary | std::ios::out | std::ios::trunc};
    if (!ofile) {
        throw_io_error(errno, "Failed to open file for writing", dest);
    }
    ofile.write(content.data(), static_cast<std::streamsize>(content.size()));
    ofile.flush();
    if (!ofile) {
        throw_io_error(errno, "Failed to write to file", dest);
    }
}

std::string dply::read_file(path_ref path) {
    DPLY_E_SCOPE(e_read_file_path{path});
    errno = 0;
    std::ifstream infile{path, std::ios::binary | std::ios::in};
    if (!infile) {
        throw_io_error(errno, "Failed to open file for reading", path);
    }
    std::string content{std::istreambuf_iterator<char>{infile}, std::istreambuf_iterator<char>{}};
    if (infile.bad()) {
        throw_io_error(errno, "Failed to read from file", path);
    }
    return content;
}
