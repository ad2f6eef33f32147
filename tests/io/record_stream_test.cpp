#include <variant>
#include <vector>

#include <gtest/gtest.h>
#include <padio/utils/fileio/byte_source.hpp>
#include <padio/utils/fileio/record_stream.hpp>

#include "capture_test_helpers.hpp"

using namespace padio;
using namespace padio::utils;
using namespace padio::utils::fileio;
using padio::test::encode_record;

namespace {

Record numbered(uint32_t number) {
    Record r;
    r.number = number;
    r.data_len = 4;
    r.count = 1;
    r.timestamp_ns = 1000ull * number;
    return r;
}

void append(std::vector<uint8_t>& out, const Record& r) {
    auto block = encode_record(r);
    out.insert(out.end(), block.begin(), block.end());
}

void append_sentinel(std::vector<uint8_t>& out) { out.resize(out.size() + record_size, 0); }

} // namespace

TEST(RecordStreamTest, YieldsRecordsInOrderThenStopsAtLast) {
    std::vector<uint8_t> bytes;
    for (uint32_t n = 5; n <= 8; ++n) {
        append(bytes, numbered(n));
    }

    RecordStream<SpanByteSource> stream(SpanByteSource(bytes), 5, 7);
    for (uint32_t n = 5; n <= 7; ++n) {
        auto record = stream.read_next_record();
        ASSERT_TRUE(record.has_value()) << "record " << n;
        EXPECT_EQ(record->number, n);
        EXPECT_EQ(record->timestamp_ns, 1000ull * n);
    }

    // Record 8 is on disk but past last_record_number
    auto end = stream.read_next_record();
    ASSERT_FALSE(end.has_value());
    EXPECT_TRUE(is_eof(end.error()));
    EXPECT_TRUE(stream.exhausted());
    EXPECT_EQ(stream.records_read(), 3u);
}

TEST(RecordStreamTest, SentinelEndsStreamEarly) {
    std::vector<uint8_t> bytes;
    append(bytes, numbered(1));
    append_sentinel(bytes);
    append(bytes, numbered(2));

    RecordStream<SpanByteSource> stream(SpanByteSource(bytes), 1, 10);
    ASSERT_TRUE(stream.read_next_record().has_value());

    auto end = stream.read_next_record();
    ASSERT_FALSE(end.has_value());
    EXPECT_TRUE(is_eof(end.error()));
    EXPECT_TRUE(stream.exhausted());

    // Stays at end of stream without reading further
    auto again = stream.read_next_record();
    ASSERT_FALSE(again.has_value());
    EXPECT_TRUE(is_eof(again.error()));
    EXPECT_EQ(stream.records_read(), 1u);
}

TEST(RecordStreamTest, EmptyRangeReadsNothing) {
    std::vector<uint8_t> bytes;
    append(bytes, numbered(4));

    SpanByteSource source(bytes);
    RecordStream<SpanByteSource> stream(source, 4, 3);

    auto end = stream.read_next_record();
    ASSERT_FALSE(end.has_value());
    EXPECT_TRUE(is_eof(end.error()));
}

TEST(RecordStreamTest, SkippedNumberIsMismatch) {
    std::vector<uint8_t> bytes;
    append(bytes, numbered(1));
    append(bytes, numbered(3));

    RecordStream<SpanByteSource> stream(SpanByteSource(bytes), 1, 5);
    ASSERT_TRUE(stream.read_next_record().has_value());

    auto bad = stream.read_next_record();
    ASSERT_FALSE(bad.has_value());
    ASSERT_TRUE(is_parse_error(bad.error()));
    const auto& err = std::get<ParseError>(bad.error());
    EXPECT_EQ(err.code, ValidationError::record_number_mismatch);
    EXPECT_EQ(err.expected_number, 2u);
    EXPECT_EQ(err.actual_number, 3u);
    EXPECT_EQ(err.offset, record_size);
}

TEST(RecordStreamTest, MismatchIsSticky) {
    std::vector<uint8_t> bytes;
    append(bytes, numbered(2));
    append(bytes, numbered(1));
    append(bytes, numbered(2));

    RecordStream<SpanByteSource> stream(SpanByteSource(bytes), 1, 3);

    auto first = stream.read_next_record();
    ASSERT_FALSE(first.has_value());
    EXPECT_TRUE(stream.failed());

    // A correctly numbered record follows but the stream does not resynchronize
    auto second = stream.read_next_record();
    ASSERT_FALSE(second.has_value());
    ASSERT_TRUE(is_parse_error(second.error()));
    EXPECT_EQ(std::get<ParseError>(second.error()).actual_number, 2u);
    EXPECT_EQ(stream.records_read(), 0u);
}

TEST(RecordStreamTest, RepeatedNumberIsMismatch) {
    std::vector<uint8_t> bytes;
    append(bytes, numbered(1));
    append(bytes, numbered(1));

    RecordStream<SpanByteSource> stream(SpanByteSource(bytes), 1, 2);
    ASSERT_TRUE(stream.read_next_record().has_value());

    auto bad = stream.read_next_record();
    ASSERT_FALSE(bad.has_value());
    ASSERT_TRUE(is_parse_error(bad.error()));
    EXPECT_EQ(std::get<ParseError>(bad.error()).expected_number, 2u);
    EXPECT_EQ(std::get<ParseError>(bad.error()).actual_number, 1u);
}

TEST(RecordStreamTest, PartialBlockIsTruncatedRecord) {
    std::vector<uint8_t> bytes;
    append(bytes, numbered(1));
    append(bytes, numbered(2));
    bytes.resize(bytes.size() - 10);

    RecordStream<SpanByteSource> stream(SpanByteSource(bytes), 1, 2);
    ASSERT_TRUE(stream.read_next_record().has_value());

    auto bad = stream.read_next_record();
    ASSERT_FALSE(bad.has_value());
    ASSERT_TRUE(is_io_error(bad.error()));
    EXPECT_EQ(std::get<IOError>(bad.error()).kind, IOError::Kind::truncated_record);
}

TEST(RecordStreamTest, LastNumberAtMaximumDoesNotWrap) {
    std::vector<uint8_t> bytes;
    append(bytes, numbered(UINT32_MAX));
    append(bytes, numbered(0));

    RecordStream<SpanByteSource> stream(SpanByteSource(bytes), UINT32_MAX, UINT32_MAX);
    auto record = stream.read_next_record();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->number, UINT32_MAX);

    auto end = stream.read_next_record();
    ASSERT_FALSE(end.has_value());
    EXPECT_TRUE(is_eof(end.error()));
}
