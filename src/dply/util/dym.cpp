#include "./dym.hpp"

#include <numeric>
#include <vector>

std::size_t dply::lev_edit_distance(std::string_view a, std::string_view b) noexcept {
    // Two rows of the distance matrix: distances from a prefix of `b` to every prefix of `a`
    std::vector<std::size_t> prev(a.size() + 1);
    std::vector<std::size_t> cur(a.size() + 1);
    std::iota(prev.begin(), prev.end(), std::size_t{0});

    for (std::size_t row = 1; row <= b.size(); ++row) {
        cur[0] = row;
        for (std::size_t col = 1; col <= a.size(); ++col) {
            auto subst = prev[col - 1] + (a[col - 1] == b[row - 1] ? 0 : 1);
            cur[col]   = std::min({prev[col] + 1, cur[col - 1] + 1, subst});
        }
        std::swap(prev, cur);
    }
    return prev.back();
}
