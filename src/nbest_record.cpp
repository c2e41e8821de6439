#include "nbest_record.hpp"

#include <stdexcept>

#include <fmt/core.h>

#include "nbrank/ranking.hpp"
#include "nbrank/schema_error.hpp"

using namespace nbrank;

NBestRecord::NBestRecord(std::vector<std::string> translations)
    : _translations(std::move(translations)) {}

[[nodiscard]] std::size_t NBestRecord::num_hypotheses() const noexcept {
    return _translations.size();
}
[[nodiscard]] const std::vector<std::string> & NBestRecord::translations()
    const noexcept {
    return _translations;
}
[[nodiscard]] const std::string & NBestRecord::translation(
    std::size_t i) const {
    return _translations.at(i);
}

[[nodiscard]] bool NBestRecord::has_scores() const noexcept {
    return _scores.has_value();
}
[[nodiscard]] const std::vector<NBestRecord::hypothesis_scores_t> &
NBestRecord::scores() const {
    if(!_scores.has_value())
        throw schema_error("N-best record has no 'scores' field");
    return _scores.value();
}
[[nodiscard]] bool NBestRecord::has_text() const noexcept {
    return _text.has_value();
}
[[nodiscard]] const std::string & NBestRecord::text() const {
    if(!_text.has_value())
        throw schema_error("N-best record has no 'text' field");
    return _text.value();
}

[[nodiscard]] const std::map<std::string, NBestRecord::parallel_field_t> &
NBestRecord::parallel_fields() const noexcept {
    return _parallel_fields;
}
[[nodiscard]] const std::map<std::string, nlohmann::json> &
NBestRecord::scalar_fields() const noexcept {
    return _scalar_fields;
}

void NBestRecord::set_scores(std::vector<hypothesis_scores_t> scores) {
    if(scores.size() != _translations.size())
        throw schema_error(fmt::format(
            "N-best record has {} score entries for {} translations",
            scores.size(), _translations.size()));
    _scores.emplace(std::move(scores));
}
void NBestRecord::set_text(std::string text) { _text.emplace(std::move(text)); }

void NBestRecord::set_parallel_field(const std::string & name,
                                     parallel_field_t values) {
    if(values.size() != _translations.size())
        throw schema_error(fmt::format(
            "Field '{}' has {} values for {} translations", name,
            values.size(), _translations.size()));
    _scalar_fields.erase(name);
    _parallel_fields.insert_or_assign(name, std::move(values));
}
void NBestRecord::set_scalar_field(const std::string & name,
                                   nlohmann::json value) {
    _parallel_fields.erase(name);
    _scalar_fields.insert_or_assign(name, std::move(value));
}

[[nodiscard]] NBestRecord NBestRecord::permuted(
    const std::vector<std::size_t> & ranking) const {
    if(!is_permutation_of_indices(ranking, _translations.size()))
        throw std::invalid_argument(fmt::format(
            "Ranking is not a permutation of the {} hypotheses",
            _translations.size()));

    NBestRecord record(apply_ranking(_translations, ranking));
    if(_scores.has_value())
        record._scores.emplace(apply_ranking(_scores.value(), ranking));
    record._text = _text;
    for(auto && [name, values] : _parallel_fields)
        record._parallel_fields.emplace(name, apply_ranking(values, ranking));
    record._scalar_fields = _scalar_fields;
    return record;
}
