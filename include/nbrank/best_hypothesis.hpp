#ifndef NBRANK_BEST_HYPOTHESIS_HPP
#define NBRANK_BEST_HYPOTHESIS_HPP

#include <cstddef>
#include <string>

#include "nbrank/event_sink.hpp"

#include "nbest_record.hpp"

namespace nbrank {

struct BlankFallbackPolicy {
    bool reference_instead_of_blank = false;
    bool best_non_blank = false;
};

/**
 * @brief Selects the hypothesis to output for a ranked record.
 *
 * A blank best hypothesis is replaced by the reference if the policy allows
 * it, otherwise by the first non-blank hypothesis in ranked order if the
 * policy allows it. The result stays blank if no fallback applies.
 */
[[nodiscard]] inline std::string select_best_hypothesis(
    const NBestRecord & ranked_record, const std::string & reference,
    const BlankFallbackPolicy & policy, RerankEventSink & event_sink,
    std::size_t line = 0) {
    const std::size_t num_hypotheses = ranked_record.num_hypotheses();
    std::string best =
        num_hypotheses > 0 ? ranked_record.translation(0) : std::string();

    if(best.empty() && policy.reference_instead_of_blank) {
        event_sink.replaced_by_reference(line);
        best = reference;
    }

    if(best.empty() && policy.best_non_blank && num_hypotheses > 1) {
        for(std::size_t i = 1; i < num_hypotheses; ++i) {
            const std::string & hypothesis = ranked_record.translation(i);
            if(hypothesis.empty()) continue;
            event_sink.replaced_by_non_blank(line, i, hypothesis);
            best = hypothesis;
            break;
        }
    }

    return best;
}

}  // namespace nbrank

#endif  // NBRANK_BEST_HYPOTHESIS_HPP
