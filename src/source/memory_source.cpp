#include "limit_reader/memory_source.hpp"

#include <algorithm>
#include <utility>

namespace lr {

MemorySource::MemorySource(std::string bytes)
  : MemorySource(std::move(bytes), Config{}) {}

MemorySource::MemorySource(std::string bytes, Config cfg)
  : bytes_(std::move(bytes)), cfg_(cfg) {}

std::string_view MemorySource::fill(std::error_code& ec) {
  ec.clear();
  if (pos_ == end_) {
    const std::size_t left = bytes_.size() - pos_;
    end_ = pos_ + (cfg_.chunk_bytes == 0 ? left : std::min(left, cfg_.chunk_bytes));
  }
  return std::string_view(bytes_.data() + pos_, end_ - pos_);
}

void MemorySource::consume(std::size_t n) noexcept {
  pos_ += std::min(n, end_ - pos_);
}

}
