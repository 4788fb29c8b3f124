#pragma once
#include <string>
#include <system_error>

namespace lr {

// Errors raised by the scanner itself. Source failures are passed through
// with their own category.
enum class ScanErrc {
  not_found     = 1,         // delimiter located past the bound
  size_exceeded = not_found, // same signal as not_found
  invalid_data  = 2,         // text mode: appended bytes are not UTF-8
  no_source     = 3,         // reader's source was moved out or released
};

const std::error_category& scan_category() noexcept;

std::error_code make_error_code(ScanErrc e) noexcept;

}

namespace std {
template <> struct is_error_code_enum<lr::ScanErrc> : true_type {};
}
