#ifndef NBRANK_METRICS_DEFAULT_SCORE_PROVIDER_HPP
#define NBRANK_METRICS_DEFAULT_SCORE_PROVIDER_HPP

#include <string>
#include <vector>

#include "nbrank/metrics/isometric.hpp"
#include "nbrank/metrics/score_provider.hpp"
#include "nbrank/metrics/sentence_bleu.hpp"
#include "nbrank/metrics/sentence_chrf.hpp"

namespace nbrank {
namespace metrics {

class DefaultScoreProvider : public ScoreProvider {
private:
    SentenceBleu _bleu;
    SentenceChrf _chrf;
    IsometricScore _isometric;

public:
    DefaultScoreProvider() = default;

    double bleu_like(const std::string & hypothesis,
                     const std::vector<std::string> & references) const {
        return _bleu(hypothesis, references);
    }
    double chrf_like(const std::string & hypothesis,
                     const std::vector<std::string> & references) const {
        return _chrf(hypothesis, references);
    }
    double isometric_score(MetricFamily family, const std::string & hypothesis,
                           double model_score, const std::string & source,
                           double alpha) const {
        return _isometric(family, hypothesis, model_score, source, alpha);
    }
};

}  // namespace metrics
}  // namespace nbrank

#endif  // NBRANK_METRICS_DEFAULT_SCORE_PROVIDER_HPP
