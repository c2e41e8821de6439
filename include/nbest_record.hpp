#ifndef NBEST_RECORD_HPP
#define NBEST_RECORD_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace nbrank {

/**
 * @brief The candidate translations of one source sentence.
 *
 * Besides the known fields, a record keeps the other fields of its input
 * object by role: parallel fields hold one value per hypothesis and follow
 * the order of the translations, scalar fields are carried unchanged.
 */
class NBestRecord {
public:
    using hypothesis_scores_t = std::vector<double>;
    using parallel_field_t = std::vector<nlohmann::json>;

private:
    std::vector<std::string> _translations;
    std::optional<std::vector<hypothesis_scores_t>> _scores;
    std::optional<std::string> _text;
    std::map<std::string, parallel_field_t> _parallel_fields;
    std::map<std::string, nlohmann::json> _scalar_fields;

public:
    NBestRecord() = default;
    explicit NBestRecord(std::vector<std::string> translations);

    [[nodiscard]] std::size_t num_hypotheses() const noexcept;
    [[nodiscard]] const std::vector<std::string> & translations()
        const noexcept;
    [[nodiscard]] const std::string & translation(std::size_t i) const;

    [[nodiscard]] bool has_scores() const noexcept;
    // @throws schema_error if the record has no scores
    [[nodiscard]] const std::vector<hypothesis_scores_t> & scores() const;
    [[nodiscard]] bool has_text() const noexcept;
    // @throws schema_error if the record has no text
    [[nodiscard]] const std::string & text() const;

    [[nodiscard]] const std::map<std::string, parallel_field_t> &
    parallel_fields() const noexcept;
    [[nodiscard]] const std::map<std::string, nlohmann::json> & scalar_fields()
        const noexcept;

    // @throws schema_error if scores is not parallel to the translations
    void set_scores(std::vector<hypothesis_scores_t> scores);
    void set_text(std::string text);
    // @throws schema_error if values is not parallel to the translations
    void set_parallel_field(const std::string & name, parallel_field_t values);
    void set_scalar_field(const std::string & name, nlohmann::json value);

    /**
     * @brief Builds the record whose hypothesis j is the hypothesis
     * ranking[j] of this record.
     *
     * Translations, scores and every parallel field are reordered together,
     * the text and scalar fields are copied.
     *
     * @throws std::invalid_argument if ranking is not a permutation of
     * 0..num_hypotheses()-1
     */
    [[nodiscard]] NBestRecord permuted(
        const std::vector<std::size_t> & ranking) const;

    friend bool operator==(const NBestRecord &, const NBestRecord &) = default;
};

}  // namespace nbrank

#endif  // NBEST_RECORD_HPP
