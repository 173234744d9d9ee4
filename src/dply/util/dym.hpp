#pragma once

#include <algorithm>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>

namespace dply {

/// The Levenshtein distance between two strings
std::size_t lev_edit_distance(std::string_view a, std::string_view b) noexcept;

/**
 * @brief Find the candidate that `given` was most likely meant to be.
 *
 * Returns the candidate with the smallest edit distance to `given`, unless even that candidate
 * shares nothing with it (every character would have to change). Returns nullopt if there are
 * no candidates.
 */
template <typename Range>
std::optional<std::string> did_you_mean(std::string_view given, Range&& candidates) {
    std::optional<std::string> best;
    std::size_t                best_dist = 0;
    for (std::string_view cand : candidates) {
        auto dist = lev_edit_distance(cand, given);
        if (dist >= std::max(cand.size(), given.size())) {
            continue;
        }
        if (!best || dist < best_dist) {
            best      = std::string(cand);
            best_dist = dist;
        }
    }
    return best;
}

}  // namespace dply
