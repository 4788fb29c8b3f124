#include "limit_reader/limit_reader.hpp"
#include "scan/bounded_scan.hpp"
#include "scan/utf8_guard.hpp"

#include <utility>

namespace lr {

LimitReader::LimitReader(std::unique_ptr<BufferedSource> src) noexcept
  : src_(std::move(src)) {}

std::size_t LimitReader::read_until(std::uint8_t delim, std::vector<std::uint8_t>& out,
                                    std::size_t max, std::error_code& ec) {
  if (!src_) { ec = make_error_code(ScanErrc::no_source); return 0; }
  return detail::read_until(*src_, delim, out, max, ec);
}

std::size_t LimitReader::read_until(std::uint8_t delim, std::vector<std::uint8_t>& out,
                                    std::size_t max) {
  std::error_code ec;
  std::size_t n = read_until(delim, out, max, ec);
  if (ec) throw std::system_error(ec, "read_until");
  return n;
}

std::size_t LimitReader::read_line(std::string& out, std::size_t max, std::error_code& ec) {
  if (!src_) { ec = make_error_code(ScanErrc::no_source); return 0; }
  BufferedSource& src = *src_;
  return detail::append_utf8(out, ec, [&](std::string& bytes, std::error_code& scan_ec) {
    return detail::read_until(src, kLineTerminator, bytes, max, scan_ec);
  });
}

std::size_t LimitReader::read_line(std::string& out, std::size_t max) {
  std::error_code ec;
  std::size_t n = read_line(out, max, ec);
  if (ec) throw std::system_error(ec, "read_line");
  return n;
}

Split LimitReader::split(std::uint8_t delim, std::size_t max) && {
  return Split(std::move(src_), delim, max);
}

Lines LimitReader::lines(std::size_t max) && {
  return Lines(std::move(src_), max);
}

}
