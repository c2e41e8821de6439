#include "nbrank/reranker.hpp"

#include <numeric>
#include <utility>
#include <variant>

#include "nbrank/metrics/default_score_provider.hpp"
#include "nbrank/ranking.hpp"

using namespace nbrank;

Reranker::Reranker(const std::string & metric, double isometric_alpha,
                   bool return_score,
                   std::shared_ptr<const metrics::ScoreProvider> score_provider,
                   std::shared_ptr<RerankEventSink> event_sink)
    : _metric(make_metric_spec(metric, isometric_alpha))
    , _return_score(return_score)
    , _score_provider(std::move(score_provider))
    , _event_sink(std::move(event_sink))
    , _strategy(make_scoring_strategy(_metric)) {
    if(!_score_provider)
        _score_provider = std::make_shared<metrics::DefaultScoreProvider>();
    if(!_event_sink) _event_sink = std::make_shared<RerankEventSink>();
}

[[nodiscard]] const MetricSpec & Reranker::metric() const noexcept {
    return _metric;
}
[[nodiscard]] bool Reranker::return_score() const noexcept {
    return _return_score;
}

[[nodiscard]] std::vector<double> Reranker::compute_scores(
    const NBestRecord & record, const std::string & reference) const {
    return std::visit(
        [&](auto && strategy) {
            return strategy(record, reference, *_score_provider);
        },
        _strategy);
}

[[nodiscard]] RankingResult Reranker::rerank(const NBestRecord & record,
                                             const std::string & reference,
                                             std::size_t line) const {
    const std::size_t num_hypotheses = record.num_hypotheses();
    if(num_hypotheses <= 1) {
        _event_sink->no_op(line, num_hypotheses);
        std::vector<std::size_t> identity(num_hypotheses);
        std::iota(identity.begin(), identity.end(), std::size_t{0});
        return RankingResult{record, std::move(identity), std::nullopt,
                             std::nullopt};
    }

    const std::vector<double> scores = compute_scores(record, reference);
    std::vector<std::size_t> ranking =
        compute_ranking_indices(scores, _metric.order);

    RankingResult result{record.permuted(ranking), {}, std::nullopt,
                         std::nullopt};
    if(_return_score) {
        result.sorted_scores.emplace(apply_ranking(scores, ranking));
        result.best_score.emplace(result.sorted_scores->front());
    }
    result.ranking = std::move(ranking);
    return result;
}
