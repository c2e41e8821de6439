#ifndef NBRANK_METRICS_SCORE_PROVIDER_HPP
#define NBRANK_METRICS_SCORE_PROVIDER_HPP

#include <string>
#include <vector>

#include "nbrank/metric_spec.hpp"

namespace nbrank {
namespace metrics {

/**
 * @brief Sentence-level scoring functions consumed by the Reranker.
 *
 * Implementations must be pure: identical inputs give identical scores and
 * no call modifies shared state.
 */
class ScoreProvider {
public:
    virtual ~ScoreProvider() {}

    // Higher is better.
    virtual double bleu_like(
        const std::string & hypothesis,
        const std::vector<std::string> & references) const = 0;
    // Higher is better.
    virtual double chrf_like(
        const std::string & hypothesis,
        const std::vector<std::string> & references) const = 0;
    // Lower is better for isometric-lc, higher for the other variants.
    virtual double isometric_score(MetricFamily family,
                                   const std::string & hypothesis,
                                   double model_score,
                                   const std::string & source,
                                   double alpha) const = 0;
};

}  // namespace metrics
}  // namespace nbrank

#endif  // NBRANK_METRICS_SCORE_PROVIDER_HPP
