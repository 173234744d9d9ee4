#pragma once

#include <dply/util/fs/io.hpp>
#include <dply/util/fs/path.hpp>
#include <dply/util/temp.hpp>

#include <catch2/catch.hpp>

#include <boost/leaf/handle_errors.hpp>

#include <exception>
#include <sstream>
#include <string_view>

namespace dply::testing {

/// The checked-in fixture tree used by the tests that read real files
const auto DATA_DIR = fs::canonical((fs::path(__FILE__) / "../../../data").lexically_normal());

/**
 * @brief Invoke `fn` and return its result. Any error that escapes it fails the current test with
 * the full LEAF diagnostic.
 */
template <typename Fn>
auto require_no_error(Fn&& fn) -> decltype(fn()) {
    return boost::leaf::try_catch(
        fn,
        [](const boost::leaf::verbose_diagnostic_info& info) -> decltype(fn()) {
            std::ostringstream diag;
            diag << info;
            FAIL("Operation failed: " << diag.str());
            std::terminate();
        });
}
#define REQUIRES_LEAF_NOFAIL(...) (::dply::testing::require_no_error([&] { return (__VA_ARGS__); }))

/**
 * @brief A scratch workspace directory that is removed at the end of a test.
 */
struct scratch_workspace {
    temporary_dir      dir = temporary_dir::create();
    std::ostringstream output;

    path_ref root() const noexcept { return dir.path(); }

    fs::path add_file(path_ref rel, std::string_view content) const {
        auto full = root() / rel;
        fs::create_directories(full.parent_path());
        dply::write_file(full, content);
        return full;
    }
};

}  // namespace dply::testing
