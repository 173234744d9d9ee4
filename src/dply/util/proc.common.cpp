#include "./proc.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>

using namespace dply;

namespace {

bool needs_quoting(std::string_view s) {
    if (s.empty()) {
        return true;
    }
    std::string_view okay_chars = "@%-+=:,./_";
    return !std::ranges::all_of(s, [&](char c) {
        return std::isalnum(static_cast<unsigned char>(c))
            || (okay_chars.find(c) != okay_chars.npos);
    });
}

std::string quote_argument(std::string_view s) {
    if (!needs_quoting(s)) {
        return std::string(s);
    }
    std::string ret = "'";
    for (char c : s) {
        if (c == '\'') {
            ret += "'\\''";
        } else {
            ret.push_back(c);
        }
    }
    ret.push_back('\'');
    return ret;
}

}  // namespace

std::string dply::quote_command(const std::vector<std::string>& command) {
    std::string acc;
    for (const auto& arg : command) {
        if (!acc.empty()) {
            acc.push_back(' ');
        }
        acc += quote_argument(arg);
    }
    return acc;
}
