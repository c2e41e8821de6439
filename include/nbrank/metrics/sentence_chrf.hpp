#ifndef NBRANK_METRICS_SENTENCE_CHRF_HPP
#define NBRANK_METRICS_SENTENCE_CHRF_HPP

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

#include "nbrank/metrics/ngrams.hpp"
#include "nbrank/utils/text.hpp"

namespace nbrank {
namespace metrics {

struct SentenceChrf {
    std::size_t char_order = 6;
    double beta = 2.0;

    /**
     * @brief chrF of a single hypothesis, in [0,100].
     *
     * Whitespace is removed before extracting the character n-grams. The
     * F-beta score is computed per order and averaged over the orders for
     * which both sides have n-grams. With several references the best one is
     * kept.
     */
    [[nodiscard]] double operator()(
        const std::string & hypothesis,
        const std::vector<std::string> & references) const {
        const auto hypothesis_counts = count_ngrams(
            utils::utf8_characters_no_space(hypothesis), char_order, "");
        double best = 0.0;
        for(auto && reference : references) {
            const auto reference_counts = count_ngrams(
                utils::utf8_characters_no_space(reference), char_order, "");
            best = std::max(best, f_score(hypothesis_counts, reference_counts));
        }
        return best;
    }

private:
    [[nodiscard]] double f_score(
        const std::vector<ngram_counts_t> & hypothesis_counts,
        const std::vector<ngram_counts_t> & reference_counts) const {
        constexpr double eps = 1e-16;
        const double factor = beta * beta;
        double score = 0.0;
        std::size_t effective_order = 0;
        for(std::size_t n = 0; n < char_order; ++n) {
            const auto hypothesis_total = total_count(hypothesis_counts[n]);
            const auto reference_total = total_count(reference_counts[n]);
            const auto matches =
                clipped_matches(hypothesis_counts[n], reference_counts[n]);
            const double precision =
                hypothesis_total > 0
                    ? static_cast<double>(matches) / hypothesis_total
                    : eps;
            const double recall =
                reference_total > 0
                    ? static_cast<double>(matches) / reference_total
                    : eps;
            const double denominator = factor * precision + recall;
            score += denominator > 0.0
                         ? (1.0 + factor) * precision * recall / denominator
                         : eps;
            if(hypothesis_total > 0 && reference_total > 0) ++effective_order;
        }
        if(effective_order == 0) return 0.0;
        return 100.0 * score / static_cast<double>(effective_order);
    }
};

}  // namespace metrics
}  // namespace nbrank

#endif  // NBRANK_METRICS_SENTENCE_CHRF_HPP
