#ifndef NBRANK_METRICS_ISOMETRIC_HPP
#define NBRANK_METRICS_ISOMETRIC_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>

#include "nbrank/metric_spec.hpp"
#include "nbrank/utils/text.hpp"

namespace nbrank {
namespace metrics {

// Lengths are counted in UTF-8 code points.
struct IsometricScore {
    /**
     * @brief Blends a hypothesis model score with its length compliance to
     * the source.
     *
     * isometric-ratio and isometric-diff are rewards (higher is better),
     * isometric-lc is a cost (lower is better).
     *
     * @throws std::invalid_argument if family is not an isometric family
     */
    [[nodiscard]] double operator()(MetricFamily family,
                                    const std::string & hypothesis,
                                    double model_score,
                                    const std::string & source,
                                    double alpha) const {
        const double h = static_cast<double>(utils::utf8_length(hypothesis));
        const double s = static_cast<double>(utils::utf8_length(source));
        switch(family) {
            case MetricFamily::isometric_ratio: {
                const double longest = std::max(h, s);
                const double reward =
                    longest == 0.0 ? 100.0 : 100.0 * std::min(h, s) / longest;
                return (1.0 - alpha) * model_score + alpha * reward;
            }
            case MetricFamily::isometric_diff: {
                const double reward = -std::abs(h - s);
                return (1.0 - alpha) * model_score + alpha * reward;
            }
            case MetricFamily::isometric_lc: {
                const double penalty =
                    100.0 * std::abs(h - s) / std::max(s, 1.0);
                return (1.0 - alpha) * -model_score + alpha * penalty;
            }
            default:
                throw std::invalid_argument(
                    std::string("Metric '") +
                    std::string(metric_name(family)) +
                    "' is not an isometric metric");
        }
    }
};

}  // namespace metrics
}  // namespace nbrank

#endif  // NBRANK_METRICS_ISOMETRIC_HPP
