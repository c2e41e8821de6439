#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <vector>

#include "nbrank/event_sink.hpp"
#include "nbrank/reranker.hpp"
#include "nbrank/schema_error.hpp"

#include "rerank_streams.hpp"

using namespace nbrank;

class RecordingEventSink : public RerankEventSink {
public:
    std::vector<std::size_t> reference_replacements;
    std::vector<std::tuple<std::size_t, std::size_t, std::string>>
        non_blank_replacements;

    void replaced_by_reference(std::size_t line) {
        reference_replacements.push_back(line);
    }
    void replaced_by_non_blank(std::size_t line, std::size_t index,
                               const std::string & hypothesis) {
        non_blank_replacements.emplace_back(line, index, hypothesis);
    }
};

static RerankStreamsResult run(const std::string & references,
                               const std::string & hypotheses,
                               const Reranker & reranker,
                               const RerankOutputOptions & options,
                               RerankEventSink & event_sink,
                               std::vector<std::string> & output_lines) {
    std::istringstream references_stream(references);
    std::istringstream hypotheses_stream(hypotheses);
    return rerank_streams(references_stream, hypotheses_stream, reranker,
                          options, event_sink,
                          [&output_lines](const std::string & str) {
                              output_lines.push_back(str);
                          });
}

GTEST_TEST(rerank_streams, stops_at_shorter_hypotheses) {
    const Reranker reranker("bleu");
    RerankEventSink event_sink;
    std::vector<std::string> output_lines;
    const RerankStreamsResult result =
        run("r1\nr2\nr3\n",
            "{\"translations\": [\"a\"]}\n{\"translations\": [\"b\"]}\n",
            reranker, RerankOutputOptions{}, event_sink, output_lines);
    ASSERT_EQ(result.num_lines, 2);
    ASSERT_TRUE(result.length_mismatch);
    ASSERT_EQ(output_lines.size(), 2);
}

GTEST_TEST(rerank_streams, stops_at_shorter_references) {
    const Reranker reranker("bleu");
    RerankEventSink event_sink;
    std::vector<std::string> output_lines;
    const RerankStreamsResult result =
        run("r1\n",
            "{\"translations\": [\"a\"]}\n{\"translations\": [\"b\"]}\n",
            reranker, RerankOutputOptions{}, event_sink, output_lines);
    ASSERT_EQ(result.num_lines, 1);
    ASSERT_TRUE(result.length_mismatch);
    ASSERT_EQ(output_lines,
              (std::vector<std::string>{"{\"translations\":[\"a\"]}"}));
}

GTEST_TEST(rerank_streams, empty_inputs) {
    const Reranker reranker("chrf");
    RerankEventSink event_sink;
    std::vector<std::string> output_lines;
    const RerankStreamsResult result = run(
        "", "", reranker, RerankOutputOptions{}, event_sink, output_lines);
    ASSERT_EQ(result.num_lines, 0);
    ASSERT_FALSE(result.length_mismatch);
    ASSERT_TRUE(output_lines.empty());
}

GTEST_TEST(rerank_streams, output_best_reference_fallback) {
    const Reranker reranker("bleu");
    RecordingEventSink event_sink;
    RerankOutputOptions options;
    options.output_best = true;
    options.blank_policy.reference_instead_of_blank = true;
    std::vector<std::string> output_lines;
    const RerankStreamsResult result =
        run("keep\n  the reference \n",
            "{\"translations\": [\"kept\"]}\n{\"translations\": [\"\"]}\n",
            reranker, options, event_sink, output_lines);
    ASSERT_EQ(result.num_lines, 2);
    ASSERT_EQ(output_lines, (std::vector<std::string>{"kept", "the reference"}));
    ASSERT_EQ(event_sink.reference_replacements, (std::vector<std::size_t>{2}));
}

GTEST_TEST(rerank_streams, output_best_blank_top_hypothesis) {
    // the blank hypothesis matches the empty source length and ranks first
    const Reranker reranker("isometric-lc", 1.0);
    const std::string hypotheses =
        "{\"translations\": [\"abc\", \"\"], \"scores\": [[0], [0]], "
        "\"text\": \"\"}\n";

    RerankOutputOptions options;
    options.output_best = true;
    RecordingEventSink blank_sink;
    std::vector<std::string> blank_lines;
    (void)run("ref\n", hypotheses, reranker, options, blank_sink, blank_lines);
    ASSERT_EQ(blank_lines, (std::vector<std::string>{""}));

    options.blank_policy.best_non_blank = true;
    RecordingEventSink scan_sink;
    std::vector<std::string> scan_lines;
    (void)run("ref\n", hypotheses, reranker, options, scan_sink, scan_lines);
    ASSERT_EQ(scan_lines, (std::vector<std::string>{"abc"}));
    ASSERT_EQ(scan_sink.non_blank_replacements.size(), 1);
    ASSERT_EQ(scan_sink.non_blank_replacements[0],
              std::make_tuple(std::size_t{1}, std::size_t{1},
                              std::string("abc")));
}

GTEST_TEST(rerank_streams, schema_error_reports_line) {
    const Reranker reranker("bleu");
    RerankEventSink event_sink;
    std::vector<std::string> output_lines;
    try {
        (void)run("r1\nr2\n",
                  "{\"translations\": [\"a\"]}\n{\"scores\": []}\n", reranker,
                  RerankOutputOptions{}, event_sink, output_lines);
        FAIL() << "expected schema_error";
    } catch(const schema_error & e) {
        ASSERT_EQ(std::string(e.what()).rfind("Line 2: ", 0), 0);
    }
    ASSERT_EQ(output_lines.size(), 1);
}

GTEST_TEST(rerank_streams, both_inputs_on_stdin) {
    ASSERT_THROW(check_input_files("-", "-"), std::logic_error);
    ASSERT_NO_THROW(check_input_files("-", "nbest.jsonl"));
    ASSERT_NO_THROW(check_input_files("references.txt", "-"));
}

GTEST_TEST(rerank_streams, ignored_blank_fallbacks) {
    RerankOutputOptions options;
    ASSERT_FALSE(has_ignored_blank_fallbacks(options));
    options.blank_policy.best_non_blank = true;
    ASSERT_TRUE(has_ignored_blank_fallbacks(options));
    options.blank_policy.best_non_blank = false;
    options.blank_policy.reference_instead_of_blank = true;
    ASSERT_TRUE(has_ignored_blank_fallbacks(options));
    options.output_best = true;
    ASSERT_FALSE(has_ignored_blank_fallbacks(options));
}
