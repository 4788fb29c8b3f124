#pragma once
#include "limit_reader/buffered_source.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace lr {

// In-memory source; each refill exposes at most chunk_bytes.
class MemorySource final : public BufferedSource {
public:
  struct Config {
    std::size_t chunk_bytes = 0; // 0 = expose all remaining bytes at once
  };

  explicit MemorySource(std::string bytes);   // uses default Config{}
  MemorySource(std::string bytes, Config cfg);

  std::string_view fill(std::error_code& ec) override;
  void consume(std::size_t n) noexcept override;

  std::size_t remaining() const noexcept { return bytes_.size() - pos_; }
  std::size_t position() const noexcept { return pos_; }

private:
  std::string bytes_;
  Config cfg_;
  std::size_t pos_{0};
  std::size_t end_{0}; // end of the currently exposed window
};

}
