#include "./module_loader.hpp"

#include <dply/error/errors.hpp>
#include <dply/error/result.hpp>
#include <dply/transform/builtin.hpp>
#include <dply/transform/module.hpp>
#include <dply/util/dynlib.hpp>
#include <dply/util/log.hpp>
#include <dply/util/string.hpp>

#include <boost/leaf/exception.hpp>

#include <memory>

using namespace dply;

const transform_module& module_loader::require(std::string_view id_) {
    auto id = std::string(trim_view(id_));
    DPLY_E_SCOPE(e_transform_module_id{id});
    if (auto found = _cache.find(id); found != _cache.end()) {
        return found->second;
    }

    if (id.empty()) {
        BOOST_LEAF_THROW_EXCEPTION(
            make_user_error<errc::module_load_failure>("An empty transform module ID was given"));
    }

    if (auto builtin = builtin_transform_module(id)) {
        dply_log(debug, "Using built-in transform module [{}]", id);
        return _cache.emplace(id, std::move(*builtin)).first->second;
    }

    auto filepath = fs::path(id);
    if (filepath.is_relative()) {
        filepath = _workspace_root / filepath;
    }
    auto lib = std::make_shared<shared_library>(shared_library::open(normalize_path(filepath)));
    auto mod = make_shared_object_transform(id, std::move(lib));
    return _cache.emplace(id, std::move(mod)).first->second;
}
