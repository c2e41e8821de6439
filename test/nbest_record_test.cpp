#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "nbrank/schema_error.hpp"

#include "nbest_record.hpp"

using namespace nbrank;

static NBestRecord make_record() {
    NBestRecord record({"a", "b", "c"});
    record.set_scores({{1.0, 10.0}, {2.0}, {3.0}});
    record.set_text("source");
    record.set_parallel_field("alignments", {"0-0", "1-1", "2-2"});
    record.set_scalar_field("sentence_id", 7);
    return record;
}

GTEST_TEST(nbest_record, accessors) {
    const NBestRecord record = make_record();
    ASSERT_EQ(record.num_hypotheses(), 3);
    ASSERT_EQ(record.translation(1), "b");
    ASSERT_THROW((void)record.translation(3), std::out_of_range);
    ASSERT_TRUE(record.has_scores());
    ASSERT_EQ(record.scores()[0], (std::vector<double>{1.0, 10.0}));
    ASSERT_TRUE(record.has_text());
    ASSERT_EQ(record.text(), "source");
    ASSERT_EQ(record.parallel_fields().size(), 1);
    ASSERT_EQ(record.scalar_fields().at("sentence_id"), 7);
}

GTEST_TEST(nbest_record, missing_fields) {
    const NBestRecord record({"a", "b"});
    ASSERT_FALSE(record.has_scores());
    ASSERT_FALSE(record.has_text());
    ASSERT_THROW((void)record.scores(), schema_error);
    ASSERT_THROW((void)record.text(), schema_error);
}

GTEST_TEST(nbest_record, misaligned_fields) {
    NBestRecord record({"a", "b"});
    ASSERT_THROW(record.set_scores({{1.0}}), schema_error);
    ASSERT_THROW(record.set_parallel_field("x", {1, 2, 3}), schema_error);
}

GTEST_TEST(nbest_record, field_role_is_exclusive) {
    NBestRecord record({"a", "b"});
    record.set_parallel_field("x", {1, 2});
    record.set_scalar_field("x", "scalar");
    ASSERT_TRUE(record.parallel_fields().empty());
    ASSERT_EQ(record.scalar_fields().at("x"), "scalar");
}

GTEST_TEST(nbest_record, permuted_keeps_fields_aligned) {
    const NBestRecord record = make_record();
    const std::vector<std::size_t> ranking{2, 0, 1};
    const NBestRecord permuted = record.permuted(ranking);

    ASSERT_EQ(permuted.translations(),
              (std::vector<std::string>{"c", "a", "b"}));
    for(std::size_t j = 0; j < ranking.size(); ++j) {
        ASSERT_EQ(permuted.translation(j), record.translation(ranking[j]));
        ASSERT_EQ(permuted.scores()[j], record.scores()[ranking[j]]);
        ASSERT_EQ(permuted.parallel_fields().at("alignments")[j],
                  record.parallel_fields().at("alignments")[ranking[j]]);
    }
    ASSERT_EQ(permuted.text(), record.text());
    ASSERT_EQ(permuted.scalar_fields(), record.scalar_fields());
}

GTEST_TEST(nbest_record, permuted_identity) {
    const NBestRecord record = make_record();
    ASSERT_EQ(record.permuted({0, 1, 2}), record);
}

GTEST_TEST(nbest_record, permuted_rejects_invalid_ranking) {
    const NBestRecord record = make_record();
    ASSERT_THROW((void)record.permuted({0, 1}), std::invalid_argument);
    ASSERT_THROW((void)record.permuted({0, 1, 1}), std::invalid_argument);
}
