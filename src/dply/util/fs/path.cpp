#include "./path.hpp"

#include <boost/leaf/result.hpp>

#include <algorithm>

using namespace dply;

fs::path dply::normalize_path(path_ref p_) noexcept {
    auto p = p_.lexically_normal();
    while (p.has_relative_path() && p.filename().empty()) {
        p = p.parent_path();
    }
    if (p == ".") {
        return fs::path();
    }
    return p;
}

fs::path dply::resolve_path_weak(path_ref p) noexcept {
    std::error_code ec;
    auto            abs = fs::weakly_canonical(p, ec);
    if (ec) {
        abs = fs::absolute(p, ec);
    }
    return normalize_path(abs);
}

result<fs::path> dply::resolve_path_strong(path_ref p_) noexcept {
    std::error_code ec;
    auto            p = fs::canonical(p_, ec);
    if (ec) {
        return boost::leaf::new_error(ec, p_, e_resolve_path{p_});
    }
    return normalize_path(p);
}

bool dply::path_starts_with(path_ref p_, path_ref prefix_) noexcept {
    auto p      = normalize_path(p_);
    auto prefix = normalize_path(prefix_);
    auto p_it   = p.begin();
    for (auto& elem : prefix) {
        if (p_it == p.end() || *p_it != elem) {
            return false;
        }
        ++p_it;
    }
    return true;
}

std::optional<fs::path> dply::relative_within(path_ref p_, path_ref base_) noexcept {
    auto p = normalize_path(p_);
    if (p.is_relative()) {
        if (!p.empty() && *p.begin() == "..") {
            return std::nullopt;
        }
        return p;
    }
    auto base = normalize_path(base_);
    if (base.is_relative() || !path_starts_with(p, base)) {
        return std::nullopt;
    }
    return normalize_path(p.lexically_relative(base));
}
