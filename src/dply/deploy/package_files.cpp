#include "./package_files.hpp"

#include <dply/error/errors.hpp>
#include <dply/error/result.hpp>
#include <dply/util/glob.hpp>
#include <dply/util/log.hpp>

#include <boost/leaf/exception.hpp>

#include <algorithm>
#include <stdexcept>

using namespace dply;

namespace {

std::vector<glob> compile_globs(const std::vector<std::string>& patterns) {
    std::vector<glob> ret;
    for (auto& pat : patterns) {
        DPLY_E_SCOPE(e_package_glob{pat});
        try {
            ret.push_back(glob::compile(pat));
        } catch (const std::runtime_error& e) {
            BOOST_LEAF_THROW_EXCEPTION(
                make_user_error<errc::invalid_config_file>("Invalid glob pattern '{}': {}",
                                                           pat,
                                                           e.what()));
        }
    }
    return ret;
}

bool any_match(const std::vector<glob>& globs, path_ref rel) {
    return std::ranges::any_of(globs, [&](const glob& g) { return g.match(rel); });
}

}  // namespace

std::vector<fs::path> dply::resolve_package_files(const deploy_package& pkg,
                                                  path_ref              workspace_root) {
    auto includes = compile_globs(pkg.files.empty() ? std::vector<std::string>{"**"} : pkg.files);
    auto excludes = compile_globs(pkg.exclude);

    std::vector<fs::path> ret;
    for (auto& entry : fs::recursive_directory_iterator{workspace_root}) {
        if (!entry.is_regular_file()) {
            continue;
        }
        auto rel = entry.path().lexically_relative(workspace_root);
        if (!any_match(includes, rel)) {
            continue;
        }
        if (any_match(excludes, rel)) {
            dply_log(trace, "Excluding [{}] from package '{}'", rel.string(), pkg.name);
            continue;
        }
        ret.push_back(entry.path());
    }
    std::ranges::sort(ret);
    dply_log(debug, "Package '{}' has {} file(s)", pkg.name, ret.size());
    return ret;
}
