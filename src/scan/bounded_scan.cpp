#include "scan/bounded_scan.hpp"
#include "limit_reader/errors.hpp"

#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace lr::detail {

static void append(std::vector<std::uint8_t>& out, std::string_view s) {
  const auto* p = reinterpret_cast<const std::uint8_t*>(s.data());
  out.insert(out.end(), p, p + s.size());
}

static void append(std::string& out, std::string_view s) { out.append(s); }

template <class Buffer>
std::size_t read_until(BufferedSource& src, std::uint8_t delim, Buffer& out,
                       std::size_t max, std::error_code& ec) {
  ec.clear();
  std::size_t read = 0;
  while (true) {
    std::error_code fill_ec;
    std::string_view avail = src.fill(fill_ec);
    if (fill_ec) {
      if (fill_ec == std::errc::interrupted) continue;
      ec = fill_ec;
      return 0;
    }

    const void* hit = avail.empty() ? nullptr
                                    : std::memchr(avail.data(), delim, avail.size());
    bool done = false;
    std::size_t used = 0;
    if (hit) {
      std::size_t i = static_cast<std::size_t>(static_cast<const char*>(hit) - avail.data());
      if (read + i + 1 > max) {
        ec = make_error_code(ScanErrc::size_exceeded);
        return 0;
      }
      append(out, avail.substr(0, i + 1));
      done = true;
      used = i + 1;
    } else {
      append(out, avail);
      used = avail.size();
    }

    src.consume(used);
    read += used;
    if (done || used == 0) return read;
  }
}

template std::size_t read_until<std::vector<std::uint8_t>>(
    BufferedSource&, std::uint8_t, std::vector<std::uint8_t>&, std::size_t, std::error_code&);
template std::size_t read_until<std::string>(
    BufferedSource&, std::uint8_t, std::string&, std::size_t, std::error_code&);

}
