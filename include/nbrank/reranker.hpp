#ifndef NBRANK_RERANKER_HPP
#define NBRANK_RERANKER_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "nbrank/event_sink.hpp"
#include "nbrank/metric_spec.hpp"
#include "nbrank/metrics/score_provider.hpp"
#include "nbrank/scoring_strategies.hpp"

#include "nbest_record.hpp"

namespace nbrank {

struct RankingResult {
    NBestRecord record;
    // record hypothesis j is the input hypothesis ranking[j]
    std::vector<std::size_t> ranking;
    // set when the Reranker attaches scores
    std::optional<std::vector<double>> sorted_scores;
    std::optional<double> best_score;
};

/**
 * @brief Reorders the hypotheses of n-best records by a sentence-level
 * metric.
 *
 * The metric, its scoring strategy and its ranking direction are fixed at
 * construction. rerank() has no side effect besides notifying the event
 * sink, so a Reranker can be shared between threads if its sink can.
 */
class Reranker {
private:
    MetricSpec _metric;
    bool _return_score;
    std::shared_ptr<const metrics::ScoreProvider> _score_provider;
    std::shared_ptr<RerankEventSink> _event_sink;
    scoring_strategy_t _strategy;

public:
    /**
     * @param metric one of the identifiers of metric_descriptions
     * @param isometric_alpha length weight of the isometric metrics, in [0,1]
     * @param return_score attach the sorted scores to the results
     * @param score_provider defaults to metrics::DefaultScoreProvider
     * @param event_sink defaults to a sink ignoring every event
     *
     * @throws std::invalid_argument if the metric is unknown, the message
     * lists the valid identifiers
     */
    explicit Reranker(
        const std::string & metric, double isometric_alpha = 0.5,
        bool return_score = false,
        std::shared_ptr<const metrics::ScoreProvider> score_provider = nullptr,
        std::shared_ptr<RerankEventSink> event_sink = nullptr);

    [[nodiscard]] const MetricSpec & metric() const noexcept;
    [[nodiscard]] bool return_score() const noexcept;

    /**
     * @brief Ranks the hypotheses of record from best to worst.
     *
     * Records with less than two hypotheses are returned unchanged without
     * computing any score.
     *
     * @param reference the reference translation of the record
     * @param line position of the record in its input, for the event sink
     *
     * @throws schema_error if record lacks a field required by the metric
     */
    [[nodiscard]] RankingResult rerank(const NBestRecord & record,
                                       const std::string & reference,
                                       std::size_t line = 0) const;

    [[nodiscard]] std::vector<double> compute_scores(
        const NBestRecord & record, const std::string & reference) const;
};

}  // namespace nbrank

#endif  // NBRANK_RERANKER_HPP
