#include "scan/utf8_guard.hpp"

#include <simdjson.h>

namespace lr::detail {

bool is_valid_utf8(const char* data, std::size_t len) noexcept {
  if (len == 0) return true;
  return simdjson::validate_utf8(data, len);
}

}
