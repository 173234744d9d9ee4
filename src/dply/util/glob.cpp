#include "./glob.hpp"

#include <fnmatch.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace dply::detail {

struct rglob_item {
    /// The element pattern. Empty for a '**' element.
    std::optional<std::string> pattern;

    bool match_element(const std::string& elem) const noexcept {
        return ::fnmatch(pattern->c_str(), elem.c_str(), FNM_PERIOD) == 0;
    }
};

struct glob_impl {
    std::string             spelling;
    std::vector<rglob_item> items;
};

}  // namespace dply::detail

namespace {

dply::detail::glob_impl compile_glob_expr(std::string_view pattern) {
    using namespace dply::detail;

    glob_impl acc{};
    acc.spelling = std::string(pattern);

    while (!pattern.empty()) {
        const auto next_slash = pattern.find('/');
        const auto next_part  = pattern.substr(0, next_slash);
        if (next_slash != pattern.npos) {
            pattern.remove_prefix(next_slash + 1);
        } else {
            pattern = "";
        }

        if (next_part.empty() || next_part == ".") {
            continue;
        }
        if (next_part == "**") {
            if (acc.items.empty() || acc.items.back().pattern.has_value()) {
                acc.items.emplace_back();
            }
        } else {
            acc.items.push_back({std::string(next_part)});
        }
    }

    if (acc.items.empty()) {
        throw std::runtime_error("Invalid path glob expression (Must not be empty!)");
    }

    return acc;
}

using path_iter = dply::fs::path::const_iterator;
using pat_iter  = std::vector<dply::detail::rglob_item>::const_iterator;

bool check_matches(path_iter       elem_it,
                   const path_iter elem_stop,
                   pat_iter        pat_it,
                   const pat_iter  pat_stop) noexcept {
    if (elem_it == elem_stop && pat_it == pat_stop) {
        return true;
    }
    if (pat_it == pat_stop) {
        return false;
    }
    if (pat_it->pattern.has_value()) {
        if (elem_it == elem_stop || !pat_it->match_element(elem_it->string())) {
            return false;
        }
        return check_matches(std::next(elem_it), elem_stop, std::next(pat_it), pat_stop);
    }
    // An rglob pattern "**". Check by peeling of individual path elements
    const auto next_pat = std::next(pat_it);
    if (next_pat == pat_stop) {
        // The "**" is at the end of the glob. This matches everything.
        return true;
    }
    for (; elem_it != elem_stop; ++elem_it) {
        if (check_matches(elem_it, elem_stop, next_pat, pat_stop)) {
            return true;
        }
    }
    return false;
}

}  // namespace

dply::glob dply::glob::compile(std::string_view pattern) {
    glob ret;
    ret._impl = std::make_shared<dply::detail::glob_impl>(compile_glob_expr(pattern));
    return ret;
}

bool dply::glob::match(dply::path_ref filepath) const noexcept {
    auto normal = dply::normalize_path(filepath);
    return check_matches(normal.begin(), normal.end(), _impl->items.cbegin(), _impl->items.cend());
}

std::string_view dply::glob::string() const noexcept { return _impl->spelling; }
