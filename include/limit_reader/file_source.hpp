#pragma once
#include "limit_reader/buffered_source.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace lr {

class FileSource final : public BufferedSource {
public:
  struct Config {
    std::size_t chunk_bytes = 64 * 1024; // 64 KiB read buffer
  };

  explicit FileSource(std::string path);    // uses default Config{}
  FileSource(std::string path, Config cfg); // explicit Config
  ~FileSource() override;

  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  std::string_view fill(std::error_code& ec) override;
  void consume(std::size_t n) noexcept override;

  bool          is_open() const noexcept;
  int           last_error() const noexcept;
  std::uint64_t bytes_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
