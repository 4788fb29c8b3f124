#pragma once
#include "limit_reader/buffered_source.hpp"

#include <cstddef>
#include <cstdint>
#include <system_error>

namespace lr::detail {

// Appends bytes from `src` to `out` up to and including the first `delim`.
//
// Returns the number of bytes consumed from `src` in this call. The bound is
// checked only when the delimiter turns up: if the record would exceed `max`
// bytes (delimiter included) the call fails with ScanErrc::size_exceeded and
// the matching chunk is neither appended nor consumed. A stream that never
// yields the delimiter is read to its end whatever `max` says.
//
// On error returns 0 with `ec` set; bytes appended by earlier chunks stay in
// `out`. Interrupted fills are retried.
//
// Instantiated for std::vector<std::uint8_t> and std::string.
template <class Buffer>
std::size_t read_until(BufferedSource& src, std::uint8_t delim, Buffer& out,
                       std::size_t max, std::error_code& ec);

}
