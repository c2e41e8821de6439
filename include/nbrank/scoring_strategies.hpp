#ifndef NBRANK_SCORING_STRATEGIES_HPP
#define NBRANK_SCORING_STRATEGIES_HPP

#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include <range/v3/view/zip.hpp>

#include "nbrank/metric_spec.hpp"
#include "nbrank/metrics/score_provider.hpp"
#include "nbrank/schema_error.hpp"

#include "nbest_record.hpp"

namespace nbrank {

struct BleuStrategy {
    [[nodiscard]] std::vector<double> operator()(
        const NBestRecord & record, const std::string & reference,
        const metrics::ScoreProvider & provider) const {
        const std::vector<std::string> references{reference};
        std::vector<double> scores;
        scores.reserve(record.num_hypotheses());
        for(auto && hypothesis : record.translations())
            scores.emplace_back(provider.bleu_like(hypothesis, references));
        return scores;
    }
};

struct ChrfStrategy {
    [[nodiscard]] std::vector<double> operator()(
        const NBestRecord & record, const std::string & reference,
        const metrics::ScoreProvider & provider) const {
        const std::vector<std::string> references{reference};
        std::vector<double> scores;
        scores.reserve(record.num_hypotheses());
        for(auto && hypothesis : record.translations())
            scores.emplace_back(provider.chrf_like(hypothesis, references));
        return scores;
    }
};

// The reference is unused, hypotheses are compared to the record text.
struct IsometricStrategy {
    MetricFamily family;
    double alpha;

    [[nodiscard]] std::vector<double> operator()(
        const NBestRecord & record, const std::string &,
        const metrics::ScoreProvider & provider) const {
        if(!record.has_text())
            throw schema_error(
                fmt::format("Metric '{}' requires the source sentence in the "
                            "'text' field",
                            metric_name(family)));
        if(!record.has_scores())
            throw schema_error(
                fmt::format("Metric '{}' requires the hypotheses model scores "
                            "in the 'scores' field",
                            metric_name(family)));
        const std::string & source = record.text();
        std::vector<double> scores;
        scores.reserve(record.num_hypotheses());
        for(auto && [hypothesis, hypothesis_scores] :
            ranges::views::zip(record.translations(), record.scores())) {
            if(hypothesis_scores.empty())
                throw schema_error(fmt::format(
                    "Hypothesis {} has an empty 'scores' entry",
                    scores.size()));
            scores.emplace_back(provider.isometric_score(
                family, hypothesis, hypothesis_scores.front(), source, alpha));
        }
        return scores;
    }
};

using scoring_strategy_t =
    std::variant<BleuStrategy, ChrfStrategy, IsometricStrategy>;

[[nodiscard]] inline scoring_strategy_t make_scoring_strategy(
    const MetricSpec & metric) {
    if(is_isometric(metric.family))
        return IsometricStrategy{metric.family, metric.isometric_alpha};
    switch(metric.family) {
        case MetricFamily::bleu:
            return BleuStrategy{};
        case MetricFamily::chrf:
            return ChrfStrategy{};
        default:
            throw std::invalid_argument("Unhandled metric family for metric '" +
                                        metric.name + "'");
    }
}

}  // namespace nbrank

#endif  // NBRANK_SCORING_STRATEGIES_HPP
