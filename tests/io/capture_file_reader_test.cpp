#include <span>
#include <string>
#include <variant>
#include <vector>

#include <cerrno>
#include <gtest/gtest.h>
#include <padio/padio_io.hpp>

#include "capture_test_helpers.hpp"

using namespace padio;
using padio::test::CaptureFileBuilder;
using padio::test::TempFile;

namespace {

CaptureFileBuilder three_record_capture() {
    CaptureFileBuilder builder;
    builder.add_record({0xDE, 0xAD, 0xBE, 0xEF}, 1'000);
    builder.add_record({0x01, 0x02}, 2'000).metadata_offset = 1;
    builder.add_record({0x10, 0x20, 0x30, 0x40, 0x50, 0x60}, 3'000);
    builder.with_sentinel();
    return builder;
}

} // namespace

TEST(CaptureFileReaderTest, ReadsHeaderRecordsAndPayloads) {
    auto builder = three_record_capture();
    TempFile file(builder.build());

    auto reader = CaptureFileReader::open(file.string());
    ASSERT_TRUE(reader.has_value()) << utils::error_message(reader.error());
    EXPECT_EQ(reader->header(), builder.final_header());

    for (std::size_t i = 0; i < builder.size(); ++i) {
        auto record = reader->read_next_record();
        ASSERT_TRUE(record.has_value()) << "record " << i;
        EXPECT_EQ(*record, builder.record(i));

        auto payload = reader->read_full_payload(*record);
        ASSERT_TRUE(payload.has_value());
        EXPECT_EQ(*payload, builder.payload(i));
    }

    auto end = reader->read_next_record();
    ASSERT_FALSE(end.has_value());
    EXPECT_TRUE(utils::is_eof(end.error()));
    EXPECT_EQ(reader->records_read(), 3u);
}

TEST(CaptureFileReaderTest, HeaderPaddingAndPayloadGaps) {
    CaptureFileBuilder builder;
    builder.header_padding(13).payload_gap(7);
    builder.add_record({1, 2, 3});
    builder.add_record({4, 5});
    builder.add_record({6});
    TempFile file(builder.build());

    auto reader = CaptureFileReader::open(file.string());
    ASSERT_TRUE(reader.has_value());

    std::vector<std::vector<uint8_t>> payloads;
    auto count = reader->for_each_record([&](const Record&, std::span<const uint8_t> payload) {
        payloads.emplace_back(payload.begin(), payload.end());
        return true;
    });
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 3u);
    ASSERT_EQ(payloads.size(), 3u);
    EXPECT_EQ(payloads[1], (std::vector<uint8_t>{4, 5}));
    EXPECT_EQ(payloads[2], (std::vector<uint8_t>{6}));
}

TEST(CaptureFileReaderTest, PayloadWithoutMetadata) {
    auto builder = three_record_capture();
    TempFile file(builder.build());

    auto reader = CaptureFileReader::open(file.string());
    ASSERT_TRUE(reader.has_value());
    ASSERT_TRUE(reader->read_next_record().has_value());

    auto second = reader->read_next_record();
    ASSERT_TRUE(second.has_value());
    auto trimmed = reader->read_payload_without_metadata(*second);
    ASSERT_TRUE(trimmed.has_value());
    EXPECT_EQ(*trimmed, (std::vector<uint8_t>{0x01}));

    auto full = reader->read_payload(*second, PayloadMode::full);
    ASSERT_TRUE(full.has_value());
    EXPECT_EQ(*full, (std::vector<uint8_t>{0x01, 0x02}));
}

TEST(CaptureFileReaderTest, ForEachRecordStopsWhenCallbackDeclines) {
    auto builder = three_record_capture();
    TempFile file(builder.build());

    auto reader = CaptureFileReader::open(file.string());
    ASSERT_TRUE(reader.has_value());

    std::vector<uint32_t> seen;
    auto count = reader->for_each_record([&](const Record& r, std::span<const uint8_t>) {
        seen.push_back(r.number);
        return r.number < 2;
    });
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 2u);
    EXPECT_EQ(seen, (std::vector<uint32_t>{1, 2}));

    // Iteration resumes where it stopped
    auto next = reader->read_next_record();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->number, 3u);
}

TEST(CaptureFileReaderTest, StopsAtLastRecordWithoutSentinel) {
    CaptureFileBuilder builder;
    builder.header().last_record_number = 2;
    builder.add_record({1});
    builder.add_record({2});
    builder.add_record({3});
    TempFile file(builder.build());

    auto reader = CaptureFileReader::open(file.string());
    ASSERT_TRUE(reader.has_value());

    auto count = reader->for_each_record([](const Record&, std::span<const uint8_t>) {
        return true;
    });
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, 2u);
}

TEST(CaptureFileReaderTest, MissingFileIsOpenFailed) {
    auto reader = CaptureFileReader::open("/nonexistent/dir/capture.pad");
    ASSERT_FALSE(reader.has_value());
    ASSERT_TRUE(utils::is_io_error(reader.error()));
    const auto& err = std::get<utils::IOError>(reader.error());
    EXPECT_EQ(err.kind, utils::IOError::Kind::open_failed);
    EXPECT_EQ(err.errno_value, ENOENT);
}

TEST(CaptureFileReaderTest, RejectsUnsupportedRecordLength) {
    CaptureFileBuilder builder;
    builder.header().record_len = 64;
    builder.add_record({1});
    TempFile file(builder.build());

    auto reader = CaptureFileReader::open(file.string());
    ASSERT_FALSE(reader.has_value());
    ASSERT_TRUE(utils::is_parse_error(reader.error()));
    EXPECT_EQ(std::get<ParseError>(reader.error()).code,
              ValidationError::unsupported_record_length);
}

TEST(CaptureFileReaderTest, RejectsUnsupportedTimestampArraySize) {
    CaptureFileBuilder builder;
    builder.header().timestamp_array_size = 16;
    builder.add_record({1});
    TempFile file(builder.build());

    auto reader = CaptureFileReader::open(file.string());
    ASSERT_FALSE(reader.has_value());
    ASSERT_TRUE(utils::is_parse_error(reader.error()));
    EXPECT_EQ(std::get<ParseError>(reader.error()).code,
              ValidationError::unsupported_timestamp_array_size);
}

TEST(CaptureFileReaderTest, TruncatedHeader) {
    auto bytes = padio::test::encode_header(padio::test::sample_header());
    bytes.resize(bytes.size() / 2);
    TempFile file(bytes);

    auto reader = CaptureFileReader::open(file.string());
    ASSERT_FALSE(reader.has_value());
    ASSERT_TRUE(utils::is_io_error(reader.error()));
    EXPECT_EQ(std::get<utils::IOError>(reader.error()).kind,
              utils::IOError::Kind::truncated_header);
}

TEST(CaptureFileReaderTest, TruncatedLastPayload) {
    auto builder = three_record_capture();
    builder.truncate_by(2);
    TempFile file(builder.build());

    auto reader = CaptureFileReader::open(file.string());
    ASSERT_TRUE(reader.has_value());

    auto count = reader->for_each_record([](const Record&, std::span<const uint8_t>) {
        return true;
    });
    ASSERT_FALSE(count.has_value());
    ASSERT_TRUE(utils::is_io_error(count.error()));
    EXPECT_EQ(std::get<utils::IOError>(count.error()).kind,
              utils::IOError::Kind::truncated_payload);
    EXPECT_EQ(reader->records_read(), 3u);
}

TEST(CaptureFileReaderTest, ReaderIsMovable) {
    auto builder = three_record_capture();
    TempFile file(builder.build());

    auto opened = CaptureFileReader::open(file.string());
    ASSERT_TRUE(opened.has_value());
    ASSERT_TRUE(opened->read_next_record().has_value());

    CaptureFileReader reader = std::move(*opened);
    auto record = reader.read_next_record();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->number, 2u);
}
