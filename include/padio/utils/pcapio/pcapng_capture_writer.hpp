// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

#include "../../header.hpp"
#include "../../record.hpp"
#include "../../trigger.hpp"
#include "pcapng_common.hpp"

namespace padio::utils::pcapio {

/**
 * @brief Write decoded capture records to a pcapng file
 *
 * Produces one Section Header Block, one Interface Description Block
 * describing the capture port, and one Enhanced Packet Block per record.
 * Each packet carries the record's metadata (number, timestamp, lfsr,
 * metadata word, flags) followed by its payload; the trigger record gets an
 * opt_comment describing its distance from the trigger.
 *
 * Timestamps are written with nanosecond resolution.
 *
 * @warning This class is MOVE-ONLY due to file handle ownership.
 *
 * Example usage:
 * @code
 * auto reader = padio::utils::fileio::CaptureFileReader::open("trace.pad");
 * PcapngCaptureWriter writer("trace.pcapng", reader->header());
 *
 * reader->for_each_record([&](const padio::Record& rec, std::span<const uint8_t> payload) {
 *     return writer.write_record(reader->header(), rec, payload);
 * });
 * writer.flush();
 * @endcode
 */
class PcapngCaptureWriter {
public:
    /**
     * @brief Create a pcapng file and write its leading blocks
     *
     * If the file exists, it is truncated.
     *
     * @param filepath Path to pcapng file to create
     * @param header Capture header; port_id and module_type label the interface
     * @throws std::runtime_error if the file cannot be created or the leading
     *         blocks cannot be written
     */
    PcapngCaptureWriter(const char* filepath, const CaptureHeader& header)
        : fd_(-1),
          records_written_(0),
          bytes_written_(0),
          write_buffer_{},
          buffer_pos_(0) {
        fd_ = ::open(filepath, O_WRONLY | O_CREAT | O_TRUNC, 0644);
        if (fd_ < 0) {
            throw std::runtime_error(std::string("Failed to create pcapng file: ") + filepath);
        }

        if (!write_section_header() || !write_interface_description(header) || !flush()) {
            ::close(fd_);
            fd_ = -1;
            throw std::runtime_error(std::string("Failed to write pcapng file header: ") +
                                     filepath);
        }
    }

    PcapngCaptureWriter(const std::string& filepath, const CaptureHeader& header)
        : PcapngCaptureWriter(filepath.c_str(), header) {}

    /**
     * @brief Destructor - flushes and closes file
     */
    ~PcapngCaptureWriter() noexcept {
        if (fd_ >= 0) {
            flush();
            ::close(fd_);
        }
    }

    // Non-copyable due to file descriptor ownership
    PcapngCaptureWriter(const PcapngCaptureWriter&) = delete;
    PcapngCaptureWriter& operator=(const PcapngCaptureWriter&) = delete;

    PcapngCaptureWriter(PcapngCaptureWriter&& other) noexcept
        : fd_(other.fd_),
          records_written_(other.records_written_),
          bytes_written_(other.bytes_written_),
          write_buffer_(std::move(other.write_buffer_)),
          buffer_pos_(other.buffer_pos_) {
        other.fd_ = -1;
    }

    PcapngCaptureWriter& operator=(PcapngCaptureWriter&& other) noexcept {
        if (this != &other) {
            if (fd_ >= 0) {
                flush();
                ::close(fd_);
            }
            fd_ = other.fd_;
            records_written_ = other.records_written_;
            bytes_written_ = other.bytes_written_;
            write_buffer_ = std::move(other.write_buffer_);
            buffer_pos_ = other.buffer_pos_;
            other.fd_ = -1;
        }
        return *this;
    }

    /**
     * @brief Append one record as an Enhanced Packet Block
     *
     * @param header Capture header, used to decide whether this is the trigger record
     * @param record Decoded record
     * @param payload Record payload (copied)
     * @return true on success, false on I/O error or if the block would not
     *         fit in a 32-bit block length
     */
    bool write_record(const CaptureHeader& header, const Record& record,
                      std::span<const uint8_t> payload) {
        if (fd_ < 0) {
            return false;
        }
        const size_t packet_len = PAD_RECORD_METADATA_SIZE + payload.size();
        if (packet_len > UINT32_MAX - 64 * 1024) {
            return false;
        }

        PcapngBlockBuilder block(PCAPNG_BLOCK_ENHANCED_PACKET);
        block.put_u32(0); // interface id
        block.put_u32(padio::detail::high_word(record.timestamp_ns));
        block.put_u32(padio::detail::low_word(record.timestamp_ns));
        block.put_u32(static_cast<uint32_t>(packet_len)); // captured length
        block.put_u32(static_cast<uint32_t>(packet_len)); // original length

        block.put_u32(record.number);
        block.put_u64(record.timestamp_ns);
        block.put_u16(record.lfsr);
        block.put_u16(record.metadata_info());
        block.put_u32(record.flags);
        block.put_bytes(payload);
        block.pad_to_alignment();

        if (auto comment = trigger_comment(header, record)) {
            if (!block.put_option(PCAPNG_OPT_COMMENT, *comment)) {
                return false;
            }
            block.put_end_of_options();
        }

        auto bytes = block.finish();
        if (!write_to_buffer(bytes.data(), bytes.size())) {
            return false;
        }
        records_written_++;
        return true;
    }

    /**
     * @brief Flush internal write buffer to disk
     *
     * Called automatically by destructor.
     *
     * @return true on success, false on error
     */
    bool flush() noexcept {
        if (fd_ < 0 || buffer_pos_ == 0) {
            return true;
        }

        if (!write_all(write_buffer_.data(), buffer_pos_)) {
            return false;
        }
        buffer_pos_ = 0;
        return true;
    }

    /**
     * @brief Get number of records written so far
     */
    size_t records_written() const noexcept { return records_written_; }

    /**
     * @brief Get number of bytes written to file (excluding buffer)
     */
    size_t bytes_written() const noexcept { return bytes_written_; }

    bool is_open() const noexcept { return fd_ >= 0; }

private:
    int fd_;                                  ///< File descriptor
    size_t records_written_;                  ///< Number of Enhanced Packet Blocks written
    size_t bytes_written_;                    ///< Total bytes written (excluding buffer)
    std::array<uint8_t, 65536> write_buffer_; ///< Internal write buffer
    size_t buffer_pos_;                       ///< Current position in write buffer

    bool write_section_header() {
        PcapngBlockBuilder block(PCAPNG_BLOCK_SECTION_HEADER);
        block.put_u32(PCAPNG_BYTE_ORDER_MAGIC);
        block.put_u16(PCAPNG_VERSION_MAJOR);
        block.put_u16(PCAPNG_VERSION_MINOR);
        block.put_u64(static_cast<uint64_t>(PCAPNG_SECTION_LENGTH_UNSPECIFIED));

        auto bytes = block.finish();
        return write_to_buffer(bytes.data(), bytes.size());
    }

    bool write_interface_description(const CaptureHeader& header) {
        PcapngBlockBuilder block(PCAPNG_BLOCK_INTERFACE_DESCRIPTION);
        block.put_u16(PCAPNG_LINKTYPE_PAD_RECORD);
        block.put_u16(0); // reserved
        block.put_u32(0); // snaplen: unlimited

        const std::array<uint8_t, 1> tsresol{PCAPNG_TSRESOL_NANOSECONDS};
        if (!block.put_option(PCAPNG_OPT_IF_NAME, header.port_id) ||
            !block.put_option(PCAPNG_OPT_IF_TSRESOL, tsresol) ||
            !block.put_option(PCAPNG_OPT_IF_HARDWARE, header.module_type)) {
            return false;
        }
        block.put_end_of_options();

        auto bytes = block.finish();
        return write_to_buffer(bytes.data(), bytes.size());
    }

    /**
     * @brief Write the whole range, retrying partial writes
     */
    bool write_all(const uint8_t* data, size_t size) noexcept {
        while (size > 0) {
            ssize_t written = ::write(fd_, data, size);
            if (written <= 0) {
                return false;
            }
            data += written;
            size -= static_cast<size_t>(written);
            bytes_written_ += static_cast<size_t>(written);
        }
        return true;
    }

    /**
     * @brief Write data to internal buffer, flushing if needed
     */
    bool write_to_buffer(const uint8_t* data, size_t size) noexcept {
        // If data is larger than buffer, flush and write directly
        if (size > write_buffer_.size()) {
            return flush() && write_all(data, size);
        }

        if (buffer_pos_ + size > write_buffer_.size()) {
            if (!flush()) {
                return false;
            }
        }

        std::memcpy(write_buffer_.data() + buffer_pos_, data, size);
        buffer_pos_ += size;
        return true;
    }
};

} // namespace padio::utils::pcapio
