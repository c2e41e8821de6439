#ifndef NBRANK_METRIC_SPEC_HPP
#define NBRANK_METRIC_SPEC_HPP

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/core.h>

namespace nbrank {

enum class MetricFamily {
    bleu,
    chrf,
    isometric_ratio,
    isometric_diff,
    isometric_lc
};

enum class RankingOrder { descending, ascending };

inline constexpr std::string_view isometric_prefix = "isometric-";

struct MetricDescription {
    std::string_view name;
    MetricFamily family;
    RankingOrder order;
    std::string_view description;
};

inline constexpr std::array<MetricDescription, 5> metric_descriptions{
    {{"bleu", MetricFamily::bleu, RankingOrder::descending,
      "Sentence-level BLEU against the reference, with add-k smoothing of "
      "the higher order n-gram precisions."},
     {"chrf", MetricFamily::chrf, RankingOrder::descending,
      "Sentence-level character n-gram F-score against the reference."},
     {"isometric-ratio", MetricFamily::isometric_ratio,
      RankingOrder::descending,
      "Model score blended with the hypothesis to source length ratio. "
      "Requires 'text' and 'scores' in the input."},
     {"isometric-diff", MetricFamily::isometric_diff, RankingOrder::descending,
      "Model score blended with the negated hypothesis to source length "
      "difference. Requires 'text' and 'scores' in the input."},
     {"isometric-lc", MetricFamily::isometric_lc, RankingOrder::ascending,
      "Length-controlled cost: negated model score blended with the relative "
      "length deviation from the source, lower is better. Requires 'text' "
      "and 'scores' in the input."}}};

[[nodiscard]] constexpr bool is_isometric(MetricFamily family) noexcept {
    return family == MetricFamily::isometric_ratio ||
           family == MetricFamily::isometric_diff ||
           family == MetricFamily::isometric_lc;
}

[[nodiscard]] inline std::string metric_choices() {
    std::string choices;
    for(auto && m : metric_descriptions) {
        if(!choices.empty()) choices += ", ";
        choices += '\'';
        choices += m.name;
        choices += '\'';
    }
    return choices;
}

[[nodiscard]] inline std::string_view metric_name(MetricFamily family) {
    auto it = std::ranges::find(metric_descriptions, family,
                                &MetricDescription::family);
    return it->name;
}

/**
 * @brief Immutable description of the metric a Reranker ranks with.
 */
struct MetricSpec {
    std::string name;
    MetricFamily family;
    RankingOrder order;
    double isometric_alpha;
};

/**
 * @brief Resolves a metric identifier.
 *
 * @throws std::invalid_argument if the identifier is unknown, the message
 * lists the valid identifiers, or if isometric_alpha is not in [0,1].
 */
[[nodiscard]] inline MetricSpec make_metric_spec(const std::string & name,
                                                 double isometric_alpha = 0.5) {
    auto it = std::ranges::find(metric_descriptions, std::string_view(name),
                                &MetricDescription::name);
    if(it == metric_descriptions.end())
        throw std::invalid_argument(
            fmt::format("Scoring metric '{}' unknown. Choices are: {}", name,
                        metric_choices()));
    if(!(isometric_alpha >= 0.0 && isometric_alpha <= 1.0))
        throw std::invalid_argument(fmt::format(
            "Isometric alpha must lie in [0,1], got {}", isometric_alpha));
    return MetricSpec{name, it->family, it->order, isometric_alpha};
}

}  // namespace nbrank

#endif  // NBRANK_METRIC_SPEC_HPP
