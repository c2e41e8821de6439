#ifndef PARSE_NBEST_HPP
#define PARSE_NBEST_HPP

#include <string>

#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>

#include "nbrank/reranker.hpp"
#include "nbrank/schema_error.hpp"

#include "nbest_record.hpp"

namespace nbrank {

/**
 * @brief Builds a record from a decoded n-best JSON object.
 *
 * The object must validate against the n-best schema. Unknown arrays with
 * one element per translation become parallel fields, every other unknown
 * value becomes a scalar field.
 *
 * @throws schema_error if the object does not validate
 */
NBestRecord parse_nbest_json(const nlohmann::json & record_json);
// @throws schema_error if the line is not valid JSON or does not validate
NBestRecord parse_nbest_line(const std::string & line);

nlohmann::json nbest_to_json(const NBestRecord & record);
/**
 * @brief Serializes a reranked record.
 *
 * Attached scores replace the model scores under "scores" and the best score
 * is written under "score".
 */
nlohmann::json ranking_result_to_json(const RankingResult & result);
// Compact JSON with sorted keys.
std::string dump_nbest_line(const nlohmann::json & record_json);

}  // namespace nbrank

#endif  // PARSE_NBEST_HPP
