#include <limits>
#include <numeric>
#include <variant>
#include <vector>

#include <gtest/gtest.h>
#include <padio/utils/fileio/byte_source.hpp>
#include <padio/utils/fileio/payload_reader.hpp>

using namespace padio;
using namespace padio::utils;
using namespace padio::utils::fileio;

namespace {

Record payload_at(uint64_t data_offset, uint32_t data_len, uint16_t metadata_offset = 0) {
    Record r;
    r.number = 1;
    r.data_len = data_len;
    r.data_offset = data_offset;
    r.metadata_offset = metadata_offset;
    return r;
}

} // namespace

class PayloadReaderTest : public ::testing::Test {
protected:
    static constexpr uint64_t region = 100;

    void SetUp() override {
        // Region starts at byte 100; byte value == offset within the region
        file_.assign(region, 0xFF);
        for (int i = 0; i < 64; ++i) {
            file_.push_back(static_cast<uint8_t>(i));
        }
    }

    PayloadReader<SpanByteSource> make_reader() {
        SpanByteSource source(file_);
        EXPECT_TRUE(source.seek(region).has_value());
        return PayloadReader<SpanByteSource>(source, region);
    }

    std::vector<uint8_t> file_;
};

TEST_F(PayloadReaderTest, ContiguousPayloadsNeedNoSeek) {
    auto reader = make_reader();

    auto a = reader.read_full_payload(payload_at(0, 4));
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(*a, (std::vector<uint8_t>{0, 1, 2, 3}));
    EXPECT_EQ(reader.cursor_offset(), region + 4);

    auto b = reader.read_full_payload(payload_at(4, 3));
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*b, (std::vector<uint8_t>{4, 5, 6}));
    EXPECT_EQ(reader.cursor_offset(), region + 7);
}

TEST_F(PayloadReaderTest, GapsAreSkipped) {
    auto reader = make_reader();

    ASSERT_TRUE(reader.read_full_payload(payload_at(0, 2)).has_value());
    auto b = reader.read_full_payload(payload_at(10, 2));
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*b, (std::vector<uint8_t>{10, 11}));
}

TEST_F(PayloadReaderTest, BackwardOffsetsAreReachable) {
    auto reader = make_reader();

    ASSERT_TRUE(reader.read_full_payload(payload_at(20, 4)).has_value());
    auto earlier = reader.read_full_payload(payload_at(2, 2));
    ASSERT_TRUE(earlier.has_value());
    EXPECT_EQ(*earlier, (std::vector<uint8_t>{2, 3}));
}

TEST_F(PayloadReaderTest, ZeroLengthPayloadIsEmpty) {
    auto reader = make_reader();

    auto empty = reader.read_full_payload(payload_at(5, 0));
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
    EXPECT_EQ(reader.cursor_offset(), region + 5);
}

TEST_F(PayloadReaderTest, ExcludeMetadataStopsAtMetadataOffset) {
    auto reader = make_reader();
    const Record r = payload_at(8, 12, 5);

    auto trimmed = reader.read_payload_without_metadata(r);
    ASSERT_TRUE(trimmed.has_value());
    EXPECT_EQ(*trimmed, (std::vector<uint8_t>{8, 9, 10, 11, 12}));

    auto full = reader.read_full_payload(r);
    ASSERT_TRUE(full.has_value());
    EXPECT_EQ(full->size(), 12u);
}

TEST_F(PayloadReaderTest, ExcludeMetadataWithoutOffsetReadsEverything) {
    auto reader = make_reader();

    auto data = reader.fetch(payload_at(0, 6), PayloadMode::exclude_trailing_metadata);
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(data->size(), 6u);
}

TEST_F(PayloadReaderTest, PayloadLength) {
    using Reader = PayloadReader<SpanByteSource>;
    EXPECT_EQ(Reader::payload_length(payload_at(0, 12, 5), PayloadMode::full), 12u);
    EXPECT_EQ(
        Reader::payload_length(payload_at(0, 12, 5), PayloadMode::exclude_trailing_metadata), 5u);
    EXPECT_EQ(
        Reader::payload_length(payload_at(0, 12, 0), PayloadMode::exclude_trailing_metadata), 12u);
}

TEST_F(PayloadReaderTest, PayloadPastEndOfFileIsTruncated) {
    auto reader = make_reader();

    auto data = reader.read_full_payload(payload_at(60, 8));
    ASSERT_FALSE(data.has_value());
    ASSERT_TRUE(is_io_error(data.error()));
    EXPECT_EQ(std::get<IOError>(data.error()).kind, IOError::Kind::truncated_payload);

    // The reader recovers for a later in-range payload
    auto ok = reader.read_full_payload(payload_at(1, 2));
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, (std::vector<uint8_t>{1, 2}));
}

TEST_F(PayloadReaderTest, UnaddressableOffsetIsOutOfRange) {
    auto reader = make_reader();

    auto data = reader.read_full_payload(payload_at(std::numeric_limits<uint64_t>::max() - 8, 4));
    ASSERT_FALSE(data.has_value());
    ASSERT_TRUE(is_parse_error(data.error()));
    EXPECT_EQ(std::get<ParseError>(data.error()).code,
              ValidationError::payload_offset_out_of_range);
    EXPECT_EQ(reader.cursor_offset(), region);
}
