#pragma once

// Result type used by every fallible padio operation.
//
// tl::expected mirrors the C++23 std::expected API while the library targets C++20.
// Decoders return expected<T, ParseError>; readers return expected<T, ReaderError>
// where end of stream is one of the error alternatives:
//
//   auto rec = stream.read_next_record();
//   if (!rec && padio::utils::is_eof(rec.error())) {
//       // no more records
//   }

#include <tl/expected.hpp>

namespace padio {

using tl::expected;
using tl::make_unexpected;
using tl::unexpected;

} // namespace padio
