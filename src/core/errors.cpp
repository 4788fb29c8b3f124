#include "limit_reader/errors.hpp"

namespace lr {

namespace {

class ScanCategory final : public std::error_category {
public:
  const char* name() const noexcept override { return "limit_reader"; }

  std::string message(int ev) const override {
    switch (static_cast<ScanErrc>(ev)) {
      case ScanErrc::not_found:    return "delimiter not found within limit";
      case ScanErrc::invalid_data: return "stream did not contain valid UTF-8";
      case ScanErrc::no_source:    return "reader has no buffered source";
    }
    return "unknown limit_reader error";
  }
};

}

const std::error_category& scan_category() noexcept {
  static const ScanCategory cat;
  return cat;
}

std::error_code make_error_code(ScanErrc e) noexcept {
  return {static_cast<int>(e), scan_category()};
}

}
