#pragma once
#include "limit_reader/errors.hpp"

#include <cstddef>
#include <string>
#include <system_error>
#include <utility>

namespace lr::detail {

// True when the bytes are well-formed UTF-8 (SIMD validator).
bool is_valid_utf8(const char* data, std::size_t len) noexcept;

// Keeps a std::string holding only validated bytes while a scan appends raw
// bytes to it. The destructor truncates the string back to the commit point,
// so anything not committed is dropped on every exit path, exceptions
// included.
class Utf8AppendGuard {
public:
  explicit Utf8AppendGuard(std::string& buf) noexcept : buf_(buf), len_(buf.size()) {}
  ~Utf8AppendGuard() { if (buf_.size() > len_) buf_.resize(len_); }

  Utf8AppendGuard(const Utf8AppendGuard&) = delete;
  Utf8AppendGuard& operator=(const Utf8AppendGuard&) = delete;

  std::string& buffer() noexcept { return buf_; }
  std::size_t commit_point() const noexcept { return len_; }

  // Validates [commit point, end) and moves the commit point to the end if
  // it is valid. Earlier bytes are not looked at again.
  bool commit() noexcept {
    if (!is_valid_utf8(buf_.data() + len_, buf_.size() - len_)) return false;
    len_ = buf_.size();
    return true;
  }

private:
  std::string& buf_;
  std::size_t len_;
};

// Runs `scan(bytes, ec)` against the backing bytes of `buf`.
//
// New bytes that validate are kept and the scan's own result is returned,
// error or not. New bytes that do not validate are rolled back; the error is
// then the scan's own if it failed, otherwise ScanErrc::invalid_data.
template <class Scan>
std::size_t append_utf8(std::string& buf, std::error_code& ec, Scan&& scan) {
  Utf8AppendGuard g(buf);
  std::size_t n = std::forward<Scan>(scan)(g.buffer(), ec);
  if (!g.commit()) {
    if (!ec) ec = make_error_code(ScanErrc::invalid_data);
    return 0;
  }
  return n;
}

}
