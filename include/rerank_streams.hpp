#ifndef RERANK_STREAMS_HPP
#define RERANK_STREAMS_HPP

#include <cstddef>
#include <filesystem>
#include <istream>
#include <stdexcept>
#include <string>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include <spdlog/spdlog.h>

#include "nbrank/best_hypothesis.hpp"
#include "nbrank/event_sink.hpp"
#include "nbrank/reranker.hpp"
#include "nbrank/schema_error.hpp"
#include "nbrank/utils/text.hpp"

#include "nbest_record.hpp"
#include "parse_nbest.hpp"

namespace nbrank {

struct RerankOutputOptions {
    bool output_best = false;
    BlankFallbackPolicy blank_policy;
};

// @throws std::logic_error if both inputs read the standard input
inline void check_input_files(const std::filesystem::path & reference_file,
                              const std::filesystem::path & hypotheses_file) {
    if(reference_file == "-" && hypotheses_file == "-")
        throw std::logic_error(
            "Options '--reference' and '--hypotheses' cannot both read stdin.");
}

// Blank fallbacks only apply to the best hypothesis output.
[[nodiscard]] inline bool has_ignored_blank_fallbacks(
    const RerankOutputOptions & options) noexcept {
    return !options.output_best &&
           (options.blank_policy.reference_instead_of_blank ||
            options.blank_policy.best_non_blank);
}

struct RerankStreamsResult {
    std::size_t num_lines;
    bool length_mismatch;
};

/**
 * @brief Reranks the n-best records of hypotheses paired line by line with
 * the references.
 *
 * Each output line, either the reranked record as JSON or its best
 * hypothesis, is passed to emit. Processing stops at the end of the shorter
 * input, a length mismatch is logged as a warning.
 *
 * @throws schema_error prefixed with the line number if a record is invalid
 */
template <typename Emit>
RerankStreamsResult rerank_streams(std::istream & references,
                                   std::istream & hypotheses,
                                   const Reranker & reranker,
                                   const RerankOutputOptions & options,
                                   RerankEventSink & event_sink, Emit && emit) {
    std::string reference_line;
    std::string hypotheses_line;
    std::size_t line = 0;
    for(;;) {
        const bool has_reference =
            static_cast<bool>(std::getline(references, reference_line));
        const bool has_hypotheses =
            static_cast<bool>(std::getline(hypotheses, hypotheses_line));
        if(!has_reference || !has_hypotheses) {
            const bool length_mismatch = has_reference || has_hypotheses;
            if(length_mismatch)
                spdlog::warn(
                    "Reference and hypotheses inputs have different lengths, "
                    "stopped after {} lines",
                    line);
            return RerankStreamsResult{line, length_mismatch};
        }
        ++line;

        const std::string reference = utils::strip(reference_line);
        RankingResult result;
        try {
            result = reranker.rerank(parse_nbest_line(hypotheses_line),
                                     reference, line);
        } catch(const schema_error & e) {
            throw schema_error(fmt::format("Line {}: {}", line, e.what()));
        }
        spdlog::trace("Line {}: ranking [{}]", line,
                      fmt::join(result.ranking, ", "));

        if(options.output_best) {
            emit(select_best_hypothesis(result.record, reference,
                                        options.blank_policy, event_sink,
                                        line));
        } else {
            emit(dump_nbest_line(ranking_result_to_json(result)));
        }
    }
}

}  // namespace nbrank

#endif  // RERANK_STREAMS_HPP
