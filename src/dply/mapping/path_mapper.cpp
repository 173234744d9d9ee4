#include "./path_mapper.hpp"

#include <dply/error/errors.hpp>
#include <dply/util/log.hpp>

#include <boost/leaf/exception.hpp>

using namespace dply;

namespace {

/// Drop the leading elements of `p` that make up `prefix`. `p` must start with `prefix`.
fs::path strip_prefix(path_ref p, path_ref prefix) {
    auto it = p.begin();
    for ([[maybe_unused]] auto& elem : prefix) {
        ++it;
    }
    fs::path ret;
    for (; it != p.end(); ++it) {
        ret /= *it;
    }
    return ret;
}

fs::path anchored(path_ref p, path_ref workspace_root) {
    if (p.is_relative()) {
        return workspace_root / p;
    }
    return p;
}

}  // namespace

fs::path dply::target_root_directory(const deploy_target& target, path_ref workspace_root) {
    auto dir = target.dir.value_or(fs::path("./"));
    if (dir.empty()) {
        dir = "./";
    }
    return normalize_path(anchored(dir, workspace_root));
}

fs::path dply::resolve_target_path(path_ref                       source_file,
                                   const deploy_target&           target,
                                   path_ref                       workspace_root,
                                   const std::optional<fs::path>& base_dir) {
    auto base   = anchored(base_dir.value_or(workspace_root), workspace_root);
    auto source = anchored(source_file, workspace_root);

    auto rel = relative_within(source, base);
    if (!rel || rel->empty()) {
        BOOST_LEAF_THROW_EXCEPTION(
            make_user_error<errc::unmappable_path>("Could not get relative path for [{}]",
                                                   source_file.string()),
            e_source_file{source_file},
            e_base_directory{base});
    }

    const auto rel_dir  = rel->parent_path();
    const auto filename = rel->filename();
    const auto root     = target_root_directory(target, workspace_root);

    for (auto& mapping : target.mappings) {
        auto prefix = normalize_path(mapping.source.relative_path());
        if (!path_starts_with(rel_dir, prefix)) {
            continue;
        }
        auto mapped = normalize_path(mapping.target) / strip_prefix(rel_dir, prefix) / filename;
        dply_log(trace,
                 "Mapping [{}] -> [{}] applies to [{}]",
                 mapping.source.string(),
                 mapping.target.string(),
                 rel->string());
        if (mapping.target.is_absolute()) {
            return normalize_path(mapped);
        }
        return normalize_path(root / mapped);
    }

    return normalize_path(root / *rel);
}
