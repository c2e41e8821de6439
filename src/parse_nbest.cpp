#include "parse_nbest.hpp"

#include <utility>
#include <vector>

#include <fmt/core.h>

namespace nbrank {

static const nlohmann::json nbest_schema = R"(
{
    "$schema": "http://json-schema.org/draft-07/schema#",
    "type": "object",
    "properties": {
        "translations": {
            "type": "array",
            "items": {
                "type": "string"
            }
        },
        "scores": {
            "type": "array",
            "items": {
                "type": "array",
                "items": {
                    "type": "number"
                }
            }
        },
        "text": {
            "type": "string"
        }
    },
    "required": [
        "translations"
    ]
}
)"_json;

namespace {
struct NBestValidator {
    nlohmann::json_schema::json_validator validator;
    NBestValidator() { validator.set_root_schema(nbest_schema); }
};
}  // namespace

NBestRecord parse_nbest_json(const nlohmann::json & record_json) {
    static NBestValidator nbest_validator;
    try {
        nbest_validator.validator.validate(record_json);
    } catch(const std::invalid_argument & e) {
        throw schema_error(
            fmt::format("Reranking requires n-best JSON input with a "
                        "'translations' array of strings: {}",
                        e.what()));
    }

    NBestRecord record(
        record_json.at("translations").get<std::vector<std::string>>());
    const std::size_t num_hypotheses = record.num_hypotheses();

    for(auto && [key, value] : record_json.items()) {
        if(key == "translations") continue;
        if(key == "scores") {
            record.set_scores(
                value.get<std::vector<NBestRecord::hypothesis_scores_t>>());
            continue;
        }
        if(key == "text") {
            record.set_text(value.get<std::string>());
            continue;
        }
        if(value.is_array() && value.size() == num_hypotheses) {
            record.set_parallel_field(
                key, value.get<NBestRecord::parallel_field_t>());
        } else {
            record.set_scalar_field(key, value);
        }
    }
    return record;
}

NBestRecord parse_nbest_line(const std::string & line) {
    nlohmann::json record_json;
    try {
        record_json = nlohmann::json::parse(line);
    } catch(const nlohmann::json::parse_error & e) {
        throw schema_error(fmt::format("Invalid n-best JSON: {}", e.what()));
    }
    return parse_nbest_json(record_json);
}

nlohmann::json nbest_to_json(const NBestRecord & record) {
    nlohmann::json record_json = nlohmann::json::object();
    for(auto && [name, value] : record.scalar_fields())
        record_json[name] = value;
    for(auto && [name, values] : record.parallel_fields())
        record_json[name] = values;
    record_json["translations"] = record.translations();
    if(record.has_scores()) record_json["scores"] = record.scores();
    if(record.has_text()) record_json["text"] = record.text();
    return record_json;
}

nlohmann::json ranking_result_to_json(const RankingResult & result) {
    nlohmann::json record_json = nbest_to_json(result.record);
    if(result.sorted_scores.has_value())
        record_json["scores"] = result.sorted_scores.value();
    if(result.best_score.has_value())
        record_json["score"] = result.best_score.value();
    return record_json;
}

std::string dump_nbest_line(const nlohmann::json & record_json) {
    return record_json.dump(-1, ' ', false,
                            nlohmann::json::error_handler_t::replace);
}

}  // namespace nbrank
