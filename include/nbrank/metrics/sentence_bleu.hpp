#ifndef NBRANK_METRICS_SENTENCE_BLEU_HPP
#define NBRANK_METRICS_SENTENCE_BLEU_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

#include "nbrank/metrics/ngrams.hpp"
#include "nbrank/utils/text.hpp"

namespace nbrank {
namespace metrics {

struct SentenceBleu {
    std::size_t max_order = 4;
    // add-k smoothing constant, applied to orders above 1
    double smooth_k = 1.0;

    /**
     * @brief BLEU of a single hypothesis, in [0,100].
     *
     * Hypothesis and references are tokenized on whitespace. With several
     * references, the n-gram counts are clipped by their maximum count over
     * the references and the brevity penalty uses the closest reference
     * length. Orders for which the hypothesis has no n-gram are left out of
     * the geometric mean.
     */
    [[nodiscard]] double operator()(
        const std::string & hypothesis,
        const std::vector<std::string> & references) const {
        const auto hypothesis_tokens = utils::split_whitespace(hypothesis);
        const std::size_t hypothesis_length = hypothesis_tokens.size();
        if(hypothesis_length == 0) return 0.0;

        const auto hypothesis_counts =
            count_ngrams(hypothesis_tokens, max_order, " ");

        std::vector<ngram_counts_t> max_reference_counts(max_order);
        std::size_t closest_reference_length =
            std::numeric_limits<std::size_t>::max();
        for(auto && reference : references) {
            const auto reference_tokens = utils::split_whitespace(reference);
            const std::size_t length = reference_tokens.size();
            const auto distance = [hypothesis_length](std::size_t l) {
                return l > hypothesis_length ? l - hypothesis_length
                                             : hypothesis_length - l;
            };
            if(closest_reference_length ==
                   std::numeric_limits<std::size_t>::max() ||
               distance(length) < distance(closest_reference_length) ||
               (distance(length) == distance(closest_reference_length) &&
                length < closest_reference_length))
                closest_reference_length = length;

            const auto reference_counts =
                count_ngrams(reference_tokens, max_order, " ");
            for(std::size_t n = 0; n < max_order; ++n) {
                for(auto && [ngram, count] : reference_counts[n]) {
                    auto & max_count = max_reference_counts[n][ngram];
                    max_count = std::max(max_count, count);
                }
            }
        }
        if(closest_reference_length == std::numeric_limits<std::size_t>::max())
            closest_reference_length = 0;

        double log_precision_sum = 0.0;
        std::size_t effective_order = 0;
        for(std::size_t n = 0; n < max_order; ++n) {
            double total = static_cast<double>(total_count(hypothesis_counts[n]));
            if(total == 0.0) break;
            double correct = static_cast<double>(
                clipped_matches(hypothesis_counts[n], max_reference_counts[n]));
            if(n > 0) {
                correct += smooth_k;
                total += smooth_k;
            }
            if(correct == 0.0) return 0.0;
            log_precision_sum += std::log(100.0 * correct / total);
            ++effective_order;
        }

        const double brevity_penalty =
            hypothesis_length < closest_reference_length
                ? std::exp(1.0 - static_cast<double>(closest_reference_length) /
                                     static_cast<double>(hypothesis_length))
                : 1.0;
        return brevity_penalty *
               std::exp(log_precision_sum /
                        static_cast<double>(effective_order));
    }
};

}  // namespace metrics
}  // namespace nbrank

#endif  // NBRANK_METRICS_SENTENCE_BLEU_HPP
