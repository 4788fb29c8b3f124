#pragma once
#include <cstddef>
#include <string_view>
#include <system_error>

namespace lr {

// A byte stream with an internal buffer the scanner can look into.
//
// fill() exposes the currently buffered bytes without consuming them and
// refills only when the buffer is empty. An empty view with no error means
// the stream is exhausted. consume(n) advances the read cursor by n bytes,
// n <= size of the last view returned by fill().
//
// Report a transient interruption as std::errc::interrupted; the scanner
// retries it. Any other error is handed to the caller unchanged.
class BufferedSource {
public:
  virtual ~BufferedSource() = default;

  virtual std::string_view fill(std::error_code& ec) = 0;
  virtual void consume(std::size_t n) noexcept = 0;
};

}
