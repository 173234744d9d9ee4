#include "./module.hpp"

#include "./module_abi.h"

#include <dply/error/errors.hpp>
#include <dply/error/result.hpp>
#include <dply/util/log.hpp>

#include <boost/leaf/exception.hpp>
#include <yaml-cpp/emitter.h>
#include <yaml-cpp/node/emit.h>

#include <array>

using namespace dply;

namespace {

void append_to_string(void* sink, const char* data, size_t size) {
    static_cast<std::string*>(sink)->append(data, size);
}

transform_function wrap_abi_function(std::string                     id,
                                     dply_transform_fn               fn,
                                     std::shared_ptr<shared_library> lib) {
    if (fn == nullptr) {
        return {};
    }
    return [id, fn, lib](const transform_context& ctx) {
        std::string options_yaml;
        if (ctx.options.IsDefined() && !ctx.options.IsNull()) {
            YAML::Emitter em;
            em << ctx.options;
            options_yaml = em.c_str();
        }
        std::string                ret;
        std::array<char, 1024>     error_buf{};
        const dply_transform_args args{
            .abi_version    = DPLY_TRANSFORM_ABI_VERSION,
            .data           = ctx.data.data(),
            .size           = ctx.data.size(),
            .options_yaml   = options_yaml.c_str(),
            .sink           = &ret,
            .emit           = append_to_string,
            .error_buf      = error_buf.data(),
            .error_buf_size = error_buf.size(),
        };
        auto rc = fn(&args);
        if (rc != 0) {
            error_buf.back() = '\0';
            throw_external_error<errc::transform_failure>(
                "Transform module [{}] reported failure {}: {}",
                id,
                rc,
                error_buf[0] ? error_buf.data() : "(no message)");
        }
        return ret;
    };
}

}  // namespace

transform_module dply::make_shared_object_transform(std::string                     id,
                                                    std::shared_ptr<shared_library> lib) {
    DPLY_E_SCOPE(e_module_path{lib->path()});
    auto fwd = lib->find_function<int(const dply_transform_args*)>("dply_transform_data");
    auto rev = lib->find_function<int(const dply_transform_args*)>("dply_restore_data");
    if (fwd == nullptr && rev == nullptr) {
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::module_load_failure>(
            "[{}] does not export dply_transform_data or dply_restore_data",
            lib->path().string()));
    }
    dply_log(debug,
             "Transform module [{}] from [{}] (transform: {}, restore: {})",
             id,
             lib->path().string(),
             fwd != nullptr,
             rev != nullptr);
    return transform_module{
        .id             = id,
        .transform_data = wrap_abi_function(id, fwd, lib),
        .restore_data   = wrap_abi_function(id, rev, lib),
    };
}
