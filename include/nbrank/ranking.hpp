#ifndef NBRANK_RANKING_HPP
#define NBRANK_RANKING_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <stdexcept>
#include <vector>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include "nbrank/metric_spec.hpp"

namespace nbrank {

/**
 * @brief Indices of the scores sorted in the given order.
 *
 * The sort is stable in both orders: equal scores keep their input order.
 * NaN scores rank last.
 */
[[nodiscard]] inline std::vector<std::size_t> compute_ranking_indices(
    const std::vector<double> & scores, RankingOrder order) {
    std::vector<std::size_t> ranking(scores.size());
    std::iota(ranking.begin(), ranking.end(), std::size_t{0});
    if(order == RankingOrder::descending) {
        std::ranges::stable_sort(ranking, [&scores](auto && i1, auto && i2) {
            const double s1 = scores[i1], s2 = scores[i2];
            if(std::isnan(s1) != std::isnan(s2)) return std::isnan(s2);
            return s1 > s2;
        });
    } else {
        std::ranges::stable_sort(ranking, [&scores](auto && i1, auto && i2) {
            const double s1 = scores[i1], s2 = scores[i2];
            if(std::isnan(s1) != std::isnan(s2)) return std::isnan(s2);
            return s1 < s2;
        });
    }
    return ranking;
}

[[nodiscard]] inline bool is_permutation_of_indices(
    const std::vector<std::size_t> & ranking, std::size_t n) {
    if(ranking.size() != n) return false;
    std::vector<bool> seen(n, false);
    for(std::size_t i : ranking) {
        if(i >= n || seen[i]) return false;
        seen[i] = true;
    }
    return true;
}

// values_out[j] = values[ranking[j]]
template <typename T>
[[nodiscard]] std::vector<T> apply_ranking(
    const std::vector<T> & values, const std::vector<std::size_t> & ranking) {
    if(values.size() != ranking.size())
        throw std::invalid_argument(
            "Ranking and ranked values have different sizes");
    return ranking | ranges::views::transform([&values](std::size_t i) {
               return values[i];
           }) |
           ranges::to<std::vector>();
}

}  // namespace nbrank

#endif  // NBRANK_RANKING_HPP
