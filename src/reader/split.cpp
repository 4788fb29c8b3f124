#include "limit_reader/limit_reader.hpp"
#include "scan/bounded_scan.hpp"

#include <utility>

namespace lr {

Split::Split(std::unique_ptr<BufferedSource> src, std::uint8_t delim, std::size_t max) noexcept
  : src_(std::move(src)), delim_(delim), max_(max) {}

bool Split::next(Record& out) {
  out.bytes.clear();
  out.error.clear();
  if (done_ || !src_) { done_ = true; return false; }

  std::vector<std::uint8_t> buf;
  std::error_code ec;
  std::size_t n = detail::read_until(*src_, delim_, buf, max_, ec);
  if (ec) {
    // error is terminal
    done_ = true;
    out.error = ec;
    return true;
  }
  if (n == 0) { done_ = true; return false; }

  if (buf.back() == delim_) buf.pop_back();
  out.bytes = std::move(buf);
  return true;
}

std::size_t Split::for_each(const RecordCallback& cb) {
  std::size_t n = 0;
  Record r;
  while (next(r)) {
    ++n;
    if (!cb(r)) break;
  }
  return n;
}

std::unique_ptr<BufferedSource> Split::release() noexcept {
  done_ = true;
  return std::move(src_);
}

}
