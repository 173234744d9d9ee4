#include "./config.hpp"

#include "./error.hpp"

#include <dply/error/errors.hpp>
#include <dply/error/nonesuch.hpp>
#include <dply/error/result.hpp>
#include <dply/util/log.hpp>
#include <dply/util/yaml/parse.hpp>

#include <boost/leaf/exception.hpp>
#include <yaml-cpp/exceptions.h>
#include <yaml-cpp/node/convert.h>
#include <yaml-cpp/node/impl.h>
#include <yaml-cpp/node/iterator.h>

#include <algorithm>
#include <optional>
#include <ranges>

using namespace dply;

namespace {

std::string key_at(std::string_view parent, std::string_view key) {
    if (parent.empty()) {
        return std::string(key);
    }
    return fmt::format("{}.{}", parent, key);
}

std::string index_at(std::string_view parent, std::size_t idx) {
    return fmt::format("{}[{}]", parent, idx);
}

[[noreturn]] void bad_key(const std::string& where, std::string_view message) {
    BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::invalid_config_file>("Invalid value for [{}]: {}",
                                                                          where,
                                                                          message),
                               e_config_key{where});
}

bool is_absent(const YAML::Node& node) noexcept { return !node.IsDefined() || node.IsNull(); }

std::optional<std::string>
get_string(const YAML::Node& parent, const char* key, std::string_view where) {
    auto node = parent[key];
    if (is_absent(node)) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        bad_key(key_at(where, key), "Expected a string");
    }
    return node.as<std::string>();
}

template <typename T>
std::optional<T> get_scalar(const YAML::Node& parent,
                            const char*       key,
                            std::string_view  where,
                            std::string_view  expected) {
    auto node = parent[key];
    if (is_absent(node)) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        bad_key(key_at(where, key), expected);
    }
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion&) {
        bad_key(key_at(where, key), expected);
    }
}

/// Accepts a single string or a sequence of strings
std::vector<std::string>
get_string_list(const YAML::Node& parent, const char* key, std::string_view where) {
    auto node = parent[key];
    if (is_absent(node)) {
        return {};
    }
    auto here = key_at(where, key);
    if (node.IsScalar()) {
        return {node.as<std::string>()};
    }
    if (!node.IsSequence()) {
        bad_key(here, "Expected a string or a list of strings");
    }
    std::vector<std::string> ret;
    std::size_t              idx = 0;
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            bad_key(index_at(here, idx), "Expected a string");
        }
        ret.push_back(item.as<std::string>());
        ++idx;
    }
    return ret;
}

void require_map(const YAML::Node& node, const std::string& where) {
    if (!node.IsMap()) {
        bad_key(where, "Expected a mapping");
    }
}

target_mapping parse_mapping(const YAML::Node& node, const std::string& where) {
    require_map(node, where);
    auto source = get_string(node, "source", where);
    auto target = get_string(node, "target", where);
    if (!source) {
        bad_key(key_at(where, "source"), "A mapping requires a 'source' directory");
    }
    if (!target) {
        bad_key(key_at(where, "target"), "A mapping requires a 'target' directory");
    }
    return target_mapping{.source = *source, .target = *target};
}

std::vector<target_mapping> parse_mappings(const YAML::Node& parent, const std::string& where) {
    auto node = parent["mappings"];
    if (is_absent(node)) {
        return {};
    }
    auto here = key_at(where, "mappings");
    if (node.IsMap()) {
        return {parse_mapping(node, here)};
    }
    if (!node.IsSequence()) {
        bad_key(here, "Expected a mapping object or a list of mapping objects");
    }
    std::vector<target_mapping> ret;
    for (std::size_t idx = 0; idx < node.size(); ++idx) {
        ret.push_back(parse_mapping(node[idx], index_at(here, idx)));
    }
    return ret;
}

std::vector<after_deployed_operation> parse_deployed(const YAML::Node&  parent,
                                                     const std::string& where) {
    auto node = parent["deployed"];
    if (is_absent(node)) {
        return {};
    }
    auto here = key_at(where, "deployed");
    if (!node.IsSequence()) {
        bad_key(here, "Expected a list of operations");
    }
    std::vector<after_deployed_operation> ret;
    for (std::size_t idx = 0; idx < node.size(); ++idx) {
        auto item     = node[idx];
        auto item_key = index_at(here, idx);
        require_map(item, item_key);
        after_deployed_operation op;
        op.type   = get_string(item, "type", item_key).value_or("open");
        op.target = get_string(item, "target", item_key).value_or("");
        ret.push_back(std::move(op));
    }
    return ret;
}

deploy_target parse_target(const YAML::Node& node, const std::string& where) {
    require_map(node, where);
    deploy_target ret;
    ret.name        = get_string(node, "name", where).value_or("");
    ret.type        = get_string(node, "type", where).value_or("");
    ret.description = get_string(node, "description", where).value_or("");
    ret.sort_order
        = get_scalar<int>(node, "sortOrder", where, "Expected an integer sort order").value_or(0);
    if (auto dir = get_string(node, "dir", where)) {
        ret.dir = fs::path(*dir);
    }
    ret.empty    = get_scalar<bool>(node, "empty", where, "Expected a boolean").value_or(false);
    ret.mappings = parse_mappings(node, where);
    ret.deployed = parse_deployed(node, where);
    ret.transformer = get_string(node, "transformer", where);
    if (auto opts = node["transformerOptions"]; opts.IsDefined()) {
        ret.transformer_options = YAML::Clone(opts);
    }
    ret.declaration = YAML::Clone(node);
    return ret;
}

deploy_package parse_package(const YAML::Node& node, const std::string& where) {
    require_map(node, where);
    deploy_package ret;
    ret.name        = get_string(node, "name", where).value_or("");
    ret.description = get_string(node, "description", where).value_or("");
    ret.files       = get_string_list(node, "files", where);
    ret.exclude     = get_string_list(node, "exclude", where);
    ret.sort_order
        = get_scalar<int>(node, "sortOrder", where, "Expected an integer sort order").value_or(0);
    return ret;
}

template <typename T, typename Parse>
std::vector<T> parse_list(const YAML::Node& doc, const char* key, Parse&& parse) {
    auto node = doc[key];
    if (is_absent(node)) {
        return {};
    }
    if (!node.IsSequence()) {
        bad_key(key, "Expected a list");
    }
    std::vector<T> ret;
    for (std::size_t idx = 0; idx < node.size(); ++idx) {
        ret.push_back(parse(node[idx], index_at(key, idx)));
    }
    return ret;
}

template <typename T>
bool sort_order_less(const T* lhs, const T* rhs) noexcept {
    if (lhs->sort_order != rhs->sort_order) {
        return lhs->sort_order < rhs->sort_order;
    }
    return lhs->name < rhs->name;
}

}  // namespace

deploy_config deploy_config::from_yaml(const YAML::Node& doc) {
    deploy_config ret;
    if (is_absent(doc)) {
        dply_log(debug, "Configuration document is empty");
        return ret;
    }
    if (!doc.IsMap()) {
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::invalid_config_file>(
                                       "The top-level of the configuration must be a mapping"),
                                   e_config_key{"(root)"});
    }
    ret.targets  = parse_list<deploy_target>(doc, "targets", parse_target);
    ret.packages = parse_list<deploy_package>(doc, "packages", parse_package);
    ret.modules  = get_string_list(doc, "modules", "");
    return ret;
}

deploy_config deploy_config::load_file(path_ref filepath) {
    DPLY_E_SCOPE(e_config_file_path{filepath});
    dply_log(debug, "Loading configuration from [{}]", filepath.string());
    auto doc = parse_yaml_file(filepath);
    return from_yaml(doc);
}

const deploy_target& deploy_config::get_target(std::string_view name) const {
    DPLY_E_SCOPE(e_target_name{std::string(name)});
    auto found = std::ranges::find(targets, name, &deploy_target::name);
    if (found == targets.end()) {
        auto names = targets | std::views::transform(&deploy_target::name);
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::unknown_target>("No target named [{}]",
                                                                         name),
                                   e_nonesuch::among("target", name, names));
    }
    return *found;
}

const deploy_package& deploy_config::get_package(std::string_view name) const {
    DPLY_E_SCOPE(e_package_name{std::string(name)});
    auto found = std::ranges::find(packages, name, &deploy_package::name);
    if (found == packages.end()) {
        auto names = packages | std::views::transform(&deploy_package::name);
        BOOST_LEAF_THROW_EXCEPTION(make_user_error<errc::unknown_package>("No package named [{}]",
                                                                          name),
                                   e_nonesuch::among("package", name, names));
    }
    return *found;
}

void dply::sort_targets(std::vector<const deploy_target*>& targets) {
    std::ranges::stable_sort(targets, sort_order_less<deploy_target>);
}

std::vector<const deploy_target*> deploy_config::sorted_targets() const {
    std::vector<const deploy_target*> ret;
    for (auto& t : targets) {
        ret.push_back(&t);
    }
    sort_targets(ret);
    return ret;
}

std::vector<const deploy_package*> deploy_config::sorted_packages() const {
    std::vector<const deploy_package*> ret;
    for (auto& p : packages) {
        ret.push_back(&p);
    }
    std::ranges::stable_sort(ret, sort_order_less<deploy_package>);
    return ret;
}
