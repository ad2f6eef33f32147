#pragma once

/**
 * @file padio.hpp
 * @brief Convenience header for capture decoding
 *
 * Pulls in the buffer-level decoders, which need no file access:
 * - decode_header(): decode a CaptureHeader from the front of a buffer
 * - decode_record(): decode one 40-byte record block
 * - trigger_comment(): describe a record's distance from the trigger
 *
 * For reading capture files, include padio_io.hpp.
 */

#include "detail/parse_error.hpp"
#include "detail/parse_result.hpp"
#include "expected.hpp"
#include "header.hpp"
#include "record.hpp"
#include "trigger.hpp"
#include "types.hpp"
