// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <limits>
#include <span>

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <sys/types.h>

#include "../../../expected.hpp"
#include "../../detail/reader_error.hpp"
#include "../byte_source.hpp"

namespace padio::utils::fileio::detail {

/**
 * @brief Buffered forward cursor over a file
 *
 * Owns one FILE* opened read-only. Each cursor keeps its own stdio buffer and
 * file position, so two cursors on the same path advance independently.
 *
 * Uses fseeko/ftello so offsets beyond 2 GiB work on 32-bit off_t builds
 * compiled with _FILE_OFFSET_BITS=64.
 *
 * @warning This class is MOVE-ONLY due to FILE* ownership.
 */
class FileCursor {
public:
    /**
     * @brief Open a file for reading
     *
     * @param filepath Path to the file
     * @return Cursor positioned at offset 0, or IOError{open_failed} with errno
     */
    static expected<FileCursor, IOError> open(const char* filepath) noexcept {
        FILE* file = std::fopen(filepath, "rb");
        if (!file) {
            return unexpected(IOError{IOError::Kind::open_failed, errno, 0});
        }
        return FileCursor(file);
    }

    ~FileCursor() noexcept {
        if (file_) {
            std::fclose(file_);
        }
    }

    // Non-copyable due to FILE* ownership
    FileCursor(const FileCursor&) = delete;
    FileCursor& operator=(const FileCursor&) = delete;

    FileCursor(FileCursor&& other) noexcept : file_(other.file_) { other.file_ = nullptr; }

    FileCursor& operator=(FileCursor&& other) noexcept {
        if (this != &other) {
            if (file_) {
                std::fclose(file_);
            }
            file_ = other.file_;
            other.file_ = nullptr;
        }
        return *this;
    }

    /**
     * @brief Fill the buffer from the current position
     *
     * @param out Destination; its size is the number of bytes to read
     * @param short_read Error kind reported if the file ends first
     */
    expected<void, IOError> read_exact(std::span<uint8_t> out, IOError::Kind short_read) noexcept {
        if (out.empty()) {
            return {};
        }
        const uint64_t start = tell();
        if (std::fread(out.data(), 1, out.size(), file_) != out.size()) {
            if (std::ferror(file_)) {
                int err = errno;
                std::clearerr(file_);
                return unexpected(IOError{IOError::Kind::read_error, err, start});
            }
            std::clearerr(file_);
            return unexpected(IOError{short_read, 0, start});
        }
        return {};
    }

    expected<void, IOError> seek_relative(int64_t delta) noexcept {
        if (delta == 0) {
            return {};
        }
        if (delta > std::numeric_limits<off_t>::max() ||
            delta < std::numeric_limits<off_t>::min()) {
            return unexpected(IOError{IOError::Kind::seek_error, EOVERFLOW, tell()});
        }
        const uint64_t start = tell();
        if (::fseeko(file_, static_cast<off_t>(delta), SEEK_CUR) != 0) {
            return unexpected(IOError{IOError::Kind::seek_error, errno, start});
        }
        return {};
    }

    expected<void, IOError> seek(uint64_t pos) noexcept {
        if (pos > static_cast<uint64_t>(std::numeric_limits<off_t>::max())) {
            return unexpected(IOError{IOError::Kind::seek_error, EOVERFLOW, tell()});
        }
        const uint64_t start = tell();
        if (::fseeko(file_, static_cast<off_t>(pos), SEEK_SET) != 0) {
            return unexpected(IOError{IOError::Kind::seek_error, errno, start});
        }
        return {};
    }

    [[nodiscard]] uint64_t tell() const noexcept {
        off_t pos = ::ftello(file_);
        return pos < 0 ? 0 : static_cast<uint64_t>(pos);
    }

    [[nodiscard]] bool is_open() const noexcept { return file_ != nullptr; }

private:
    explicit FileCursor(FILE* file) noexcept : file_(file) {}

    FILE* file_;
};

static_assert(ByteSource<FileCursor>);

} // namespace padio::utils::fileio::detail
