#include "./transform.hpp"

#include <dply/error/errors.hpp>
#include <dply/error/result.hpp>
#include <dply/util/log.hpp>

#include <boost/leaf/exception.hpp>

using namespace dply;

std::string_view dply::to_string(transform_mode m) noexcept {
    switch (m) {
    case transform_mode::transform:
        return "transform";
    case transform_mode::restore:
        return "restore";
    }
    return "(invalid transform mode)";
}

std::string dply::apply_transform(std::string             data,
                                  transform_mode          mode,
                                  const transform_module* module,
                                  const YAML::Node&       options) {
    if (module == nullptr) {
        return data;
    }
    DPLY_E_SCOPE(e_transform_module{module->id});
    DPLY_E_SCOPE(e_transform_mode{mode});

    auto& func = mode == transform_mode::transform ? module->transform_data : module->restore_data;
    if (!func) {
        BOOST_LEAF_THROW_EXCEPTION(make_external_error<errc::transform_failure>(
            "Transform module [{}] does not support the '{}' direction",
            module->id,
            to_string(mode)));
    }

    dply_log(trace,
             "Applying transform module [{}] ({}) to {} bytes",
             module->id,
             to_string(mode),
             data.size());
    transform_context ctx{.data = data, .mode = mode, .options = options};
    try {
        return func(ctx);
    } catch (const transform_error&) {
        throw;
    } catch (const std::exception& e) {
        BOOST_LEAF_THROW_EXCEPTION(
            make_external_error<errc::transform_failure>("Transform module [{}] failed ({}): {}",
                                                         module->id,
                                                         to_string(mode),
                                                         e.what()));
    }
}
