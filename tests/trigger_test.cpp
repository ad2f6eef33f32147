#include <gtest/gtest.h>
#include <padio/trigger.hpp>

#include "io/capture_test_helpers.hpp"

using namespace padio;

namespace {

Record record_at(uint32_t number, uint64_t timestamp_ns) {
    Record r;
    r.number = number;
    r.timestamp_ns = timestamp_ns;
    return r;
}

} // namespace

TEST(FormatSecondsTest, AlwaysNineFractionalDigits) {
    EXPECT_EQ(format_seconds(0), "0.000000000");
    EXPECT_EQ(format_seconds(1), "0.000000001");
    EXPECT_EQ(format_seconds(1'500'000'000), "1.500000000");
    EXPECT_EQ(format_seconds(123'000'000'007), "123.000000007");
}

TEST(FormatSecondsTest, SplitNanoseconds) {
    auto split = split_nanoseconds(3'000'000'042);
    EXPECT_EQ(split.seconds, 3u);
    EXPECT_EQ(split.nanoseconds, 42u);
}

class TriggerCommentTest : public ::testing::Test {
protected:
    void SetUp() override {
        header_ = padio::test::sample_header(); // records 1..3, trigger 2 at 2000ns
    }

    CaptureHeader header_;
};

TEST_F(TriggerCommentTest, OnlyTriggerRecordIsAnnotated) {
    EXPECT_FALSE(trigger_comment(header_, record_at(1, 1'000)).has_value());
    EXPECT_TRUE(trigger_comment(header_, record_at(2, 2'000)).has_value());
    EXPECT_FALSE(trigger_comment(header_, record_at(3, 3'000)).has_value());
}

TEST_F(TriggerCommentTest, TriggeredOnThisRecord) {
    auto comment = trigger_comment(header_, record_at(2, 2'000));
    ASSERT_TRUE(comment.has_value());
    EXPECT_EQ(*comment, "Triggered on this record.");
}

TEST_F(TriggerCommentTest, TriggeredBeforeThisRecord) {
    auto comment = trigger_comment(header_, record_at(2, 1'000'002'000));
    ASSERT_TRUE(comment.has_value());
    EXPECT_EQ(*comment, "Triggered 1.000000000s before this record.");
}

TEST_F(TriggerCommentTest, TriggeredAfterThisRecord) {
    auto comment = trigger_comment(header_, record_at(2, 1'500));
    ASSERT_TRUE(comment.has_value());
    EXPECT_EQ(*comment, "Triggered 0.000000500s after this record.");
}

TEST_F(TriggerCommentTest, TriggerBeforeRangeGoesToFirstRecord) {
    header_.trigger_record_number = 0;
    EXPECT_TRUE(is_trigger_record(header_, record_at(1, 0)));
    EXPECT_FALSE(is_trigger_record(header_, record_at(2, 0)));
    EXPECT_FALSE(is_trigger_record(header_, record_at(3, 0)));
}

TEST_F(TriggerCommentTest, TriggerAfterRangeGoesToLastRecord) {
    header_.trigger_record_number = 99;
    EXPECT_FALSE(is_trigger_record(header_, record_at(1, 0)));
    EXPECT_TRUE(is_trigger_record(header_, record_at(3, 0)));

    auto comment = trigger_comment(header_, record_at(3, 3'000));
    ASSERT_TRUE(comment.has_value());
    EXPECT_EQ(*comment, "Triggered 0.000001000s before this record.");
}
