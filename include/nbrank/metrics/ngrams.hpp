#ifndef NBRANK_METRICS_NGRAMS_HPP
#define NBRANK_METRICS_NGRAMS_HPP

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace nbrank {
namespace metrics {

using ngram_counts_t = phmap::flat_hash_map<std::string, std::size_t>;

/**
 * @brief Counts the n-grams of order 1 to max_order of a symbol sequence.
 *
 * The n-gram keys are the symbols joined by separator, an empty separator is
 * only unambiguous for character sequences.
 *
 * @return one count map per order, index 0 holding the unigrams
 */
template <typename Symbols>
[[nodiscard]] std::vector<ngram_counts_t> count_ngrams(
    const Symbols & symbols, std::size_t max_order,
    std::string_view separator) {
    std::vector<ngram_counts_t> counts(max_order);
    for(std::size_t order = 1; order <= max_order; ++order) {
        if(symbols.size() < order) break;
        auto & order_counts = counts[order - 1];
        for(std::size_t i = 0; i + order <= symbols.size(); ++i) {
            std::string key(symbols[i]);
            for(std::size_t k = i + 1; k < i + order; ++k) {
                key.append(separator);
                key.append(symbols[k]);
            }
            ++order_counts[key];
        }
    }
    return counts;
}

[[nodiscard]] inline std::size_t total_count(
    const ngram_counts_t & counts) noexcept {
    std::size_t total = 0;
    for(auto && [ngram, count] : counts) total += count;
    return total;
}

// Sum over the n-grams of min(hypothesis count, reference count).
[[nodiscard]] inline std::size_t clipped_matches(
    const ngram_counts_t & hypothesis_counts,
    const ngram_counts_t & reference_counts) {
    std::size_t matches = 0;
    for(auto && [ngram, count] : hypothesis_counts) {
        auto it = reference_counts.find(ngram);
        if(it == reference_counts.end()) continue;
        matches += std::min(count, it->second);
    }
    return matches;
}

}  // namespace metrics
}  // namespace nbrank

#endif  // NBRANK_METRICS_NGRAMS_HPP
