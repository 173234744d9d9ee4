#include "./registry.hpp"

#include "./local.hpp"
#include "./module_abi.hpp"

#include <dply/context/context.hpp>
#include <dply/error/errors.hpp>
#include <dply/error/nonesuch.hpp>
#include <dply/error/result.hpp>
#include <dply/util/dym.hpp>
#include <dply/util/log.hpp>
#include <dply/util/string.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/format.h>
#include <neo/assert.hpp>

#include <ranges>
#include <vector>

using namespace dply;

std::string dply::plugin_type_of_module(path_ref filepath) {
    auto stem = filepath.stem().string();
    if (stem.starts_with("lib") && stem.size() > 3) {
        stem = stem.substr(3);
    }
    return stem;
}

const plugin_identity& plugin_registry::add(std::string                     type,
                                            fs::path                        file_path,
                                            std::unique_ptr<deploy_plugin>  plugin,
                                            std::shared_ptr<shared_library> library) {
    neo_assert(invariant,
               plugin != nullptr,
               "Attempted to register a null plugin",
               type,
               file_path.string());
    auto file = file_path.empty() ? type : file_path.filename().string();
    auto& ent = _entries.emplace_back(entry{
        .library  = std::move(library),
        .plugin   = std::move(plugin),
        .identity = plugin_identity{
            .file_path = std::move(file_path),
            .file      = std::move(file),
            .index     = _entries.size(),
            .type      = std::move(type),
        },
    });
    dply_log(debug,
             "Registered plugin #{} for type '{}' from [{}]",
             ent.identity.index,
             ent.identity.type,
             ent.identity.file);
    return ent.identity;
}

void plugin_registry::load_builtins(deploy_context& ctx) {
    add("local", fs::path(), create_local_plugin(ctx));
}

const plugin_identity& plugin_registry::load_module(deploy_context& ctx, path_ref filepath) {
    DPLY_E_SCOPE(e_module_path{filepath});
    auto lib    = std::make_shared<shared_library>(shared_library::open(filepath));
    auto create = lib->find_function<create_plugin_fn>(create_plugin_symbol);
    if (create == nullptr) {
        BOOST_LEAF_THROW_EXCEPTION(
            make_user_error<errc::module_load_failure>("Module [{}] does not export {}()",
                                                       filepath.string(),
                                                       create_plugin_symbol),
            e_module_symbol{create_plugin_symbol});
    }
    auto plugin = std::unique_ptr<deploy_plugin>(create(ctx));
    if (plugin == nullptr) {
        BOOST_LEAF_THROW_EXCEPTION(
            make_user_error<errc::module_load_failure>("Module [{}] did not create a plugin",
                                                       filepath.string()));
    }
    return add(plugin_type_of_module(filepath), filepath, std::move(plugin), std::move(lib));
}

void plugin_registry::load_modules(deploy_context& ctx, const std::vector<std::string>& modules) {
    for (auto& mod : modules) {
        auto filepath = fs::path(std::string(trim_view(mod)));
        if (filepath.empty()) {
            continue;
        }
        if (filepath.is_relative()) {
            filepath = ctx.workspace_root() / filepath;
        }
        load_module(ctx, normalize_path(filepath));
    }
}

std::vector<registered_plugin> plugin_registry::find(std::string_view type) const {
    auto                           key = normalize_key(type);
    std::vector<registered_plugin> ret;
    for (auto& ent : _entries) {
        if (normalize_key(ent.identity.type) == key) {
            ret.push_back(registered_plugin{ent.identity, *ent.plugin});
        }
    }
    return ret;
}

registered_plugin plugin_registry::resolve(std::string_view type) const {
    DPLY_E_SCOPE(e_target_type{std::string(type)});
    auto found = find(type);
    if (found.empty()) {
        auto types = _entries | std::views::transform([](auto& ent) -> const std::string& {
                         return ent.identity.type;
                     });
        BOOST_LEAF_THROW_EXCEPTION(
            make_user_error<errc::unknown_target_type>("No plugin handles the target type '{}'",
                                                       type),
            e_nonesuch{.kind    = "target type",
                       .given   = std::string(type),
                       .nearest = did_you_mean(normalize_key(type), types)});
    }
    if (found.size() > 1) {
        auto files = found | std::views::transform([](auto& reg) { return reg.identity.file; });
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::ambiguous_target_type>(
            "{} plugins handle the target type '{}': {}",
            found.size(),
            type,
            fmt::join(files, ", ")));
    }
    return found.front();
}

std::vector<registered_plugin> plugin_registry::plugins() const {
    std::vector<registered_plugin> ret;
    for (auto& ent : _entries) {
        ret.push_back(registered_plugin{ent.identity, *ent.plugin});
    }
    return ret;
}
