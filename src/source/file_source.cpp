#include "limit_reader/file_source.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <utility>
#include <vector>

namespace lr {

struct FileSource::Impl {
  std::string path;
  Config cfg;
  std::FILE* f{nullptr};
  int last_errno{0};
  std::uint64_t bytes{0};

  std::vector<char> buf;
  std::size_t pos{0};
  std::size_t end{0};

  Impl(std::string p, Config c) : path(std::move(p)), cfg(c) {
    if (cfg.chunk_bytes == 0) cfg.chunk_bytes = 1;
    buf.resize(cfg.chunk_bytes);
    f = std::fopen(path.c_str(), "rb");
    if (!f) last_errno = errno;
  }

  ~Impl() { if (f) std::fclose(f); }

  std::string_view fill(std::error_code& ec) {
    ec.clear();
    if (!f) { ec.assign(last_errno, std::generic_category()); return {}; }
    if (pos == end) {
      pos = end = 0;
      std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
      if (n == 0 && std::ferror(f)) {
        // EINTR lands here as errc::interrupted and is retried upstream
        last_errno = errno ? errno : EIO;
        std::clearerr(f);
        ec.assign(last_errno, std::generic_category());
        return {};
      }
      end = n;
      bytes += n;
    }
    return std::string_view(buf.data() + pos, end - pos);
  }
};

FileSource::FileSource(std::string path)
  : FileSource(std::move(path), Config{}) {}

FileSource::FileSource(std::string path, Config cfg)
  : p_(new Impl(std::move(path), cfg)) {}

FileSource::~FileSource() { delete p_; }

std::string_view FileSource::fill(std::error_code& ec) { return p_->fill(ec); }

void FileSource::consume(std::size_t n) noexcept {
  p_->pos += std::min(n, p_->end - p_->pos);
}

bool          FileSource::is_open() const noexcept { return p_->f != nullptr; }
int           FileSource::last_error() const noexcept { return p_->last_errno; }
std::uint64_t FileSource::bytes_read() const noexcept { return p_->bytes; }

}
