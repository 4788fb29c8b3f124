#pragma once
#include "limit_reader/buffered_source.hpp"
#include "limit_reader/errors.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace lr {

inline constexpr std::uint8_t kLineTerminator = '\n';

// One item of a Split sequence: the record bytes without the delimiter, or
// the error that ended the sequence.
struct Record {
  std::vector<std::uint8_t> bytes;
  std::error_code error;

  bool ok() const noexcept { return !error; }
};

// One item of a Lines sequence: the line without "\n" / "\r\n", or an error.
struct Line {
  std::string text;
  std::error_code error;

  bool ok() const noexcept { return !error; }
};

// Byte records separated by a single delimiter, each bounded by max bytes
// (delimiter included). The sequence owns its source and cannot be restarted.
// An error item is always the last one.
class Split {
public:
  using RecordCallback = std::function<bool(const Record&)>;

  // Fills `out` with the next item; false once the sequence is over.
  bool next(Record& out);

  // Calls cb per item until the sequence ends or cb returns false.
  // Returns the number of items delivered.
  std::size_t for_each(const RecordCallback& cb);

  bool exhausted() const noexcept { return done_; }

  // Hands the source back at its current cursor; the sequence ends.
  std::unique_ptr<BufferedSource> release() noexcept;

private:
  friend class LimitReader;
  Split(std::unique_ptr<BufferedSource> src, std::uint8_t delim, std::size_t max) noexcept;

  std::unique_ptr<BufferedSource> src_;
  std::uint8_t delim_;
  std::size_t max_;
  bool done_{false};
};

// Text lines, validated as UTF-8, each bounded by max bytes (terminator
// included). Same ownership and termination rules as Split.
class Lines {
public:
  using LineCallback = std::function<bool(const Line&)>;

  bool next(Line& out);
  std::size_t for_each(const LineCallback& cb);

  bool exhausted() const noexcept { return done_; }
  std::unique_ptr<BufferedSource> release() noexcept;

private:
  friend class LimitReader;
  Lines(std::unique_ptr<BufferedSource> src, std::size_t max) noexcept;

  std::unique_ptr<BufferedSource> src_;
  std::size_t max_;
  bool done_{false};
};

// Bounded delimiter reads over an exclusively owned buffered source.
//
// The bound is checked when the delimiter is found: a record longer than max
// bytes (delimiter included) fails with ScanErrc::size_exceeded and the source
// is left in front of the chunk holding the delimiter. When no delimiter ever
// shows up the reader consumes the source to its end without enforcing max.
class LimitReader {
public:
  explicit LimitReader(std::unique_ptr<BufferedSource> src) noexcept;

  LimitReader(LimitReader&&) noexcept = default;
  LimitReader& operator=(LimitReader&&) noexcept = default;

  // Appends through the next `delim` to `out`. Returns bytes consumed;
  // 0 at end of input or on error. Bytes already in `out` are never touched;
  // on error the bytes appended before the failing chunk stay.
  std::size_t read_until(std::uint8_t delim, std::vector<std::uint8_t>& out,
                         std::size_t max, std::error_code& ec);
  std::size_t read_until(std::uint8_t delim, std::vector<std::uint8_t>& out,
                         std::size_t max); // throws std::system_error

  // Appends the next line (terminator included) to `out`. Only UTF-8 that
  // validated is ever left in `out`.
  std::size_t read_line(std::string& out, std::size_t max, std::error_code& ec);
  std::size_t read_line(std::string& out, std::size_t max); // throws std::system_error

  Split split(std::uint8_t delim, std::size_t max) &&;
  Lines lines(std::size_t max) &&;

  BufferedSource* source() const noexcept { return src_.get(); }
  std::unique_ptr<BufferedSource> release() noexcept { return std::move(src_); }

private:
  std::unique_ptr<BufferedSource> src_;
};

}
