#include "limit_reader/limit_reader.hpp"
#include "scan/bounded_scan.hpp"
#include "scan/utf8_guard.hpp"

#include <utility>

namespace lr {

Lines::Lines(std::unique_ptr<BufferedSource> src, std::size_t max) noexcept
  : src_(std::move(src)), max_(max) {}

bool Lines::next(Line& out) {
  out.text.clear();
  out.error.clear();
  if (done_ || !src_) { done_ = true; return false; }

  std::string buf;
  std::error_code ec;
  BufferedSource& src = *src_;
  std::size_t n = detail::append_utf8(buf, ec, [&](std::string& bytes, std::error_code& scan_ec) {
    return detail::read_until(src, kLineTerminator, bytes, max_, scan_ec);
  });
  if (ec) {
    done_ = true;
    out.error = ec;
    return true;
  }
  if (n == 0) { done_ = true; return false; }

  // "\r" is only dropped as part of a "\r\n" pair
  if (!buf.empty() && buf.back() == '\n') {
    buf.pop_back();
    if (!buf.empty() && buf.back() == '\r') buf.pop_back();
  }
  out.text = std::move(buf);
  return true;
}

std::size_t Lines::for_each(const LineCallback& cb) {
  std::size_t n = 0;
  Line l;
  while (next(l)) {
    ++n;
    if (!cb(l)) break;
  }
  return n;
}

std::unique_ptr<BufferedSource> Lines::release() noexcept {
  done_ = true;
  return std::move(src_);
}

}
