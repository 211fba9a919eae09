#pragma once

#include "hintweight/core/error.hpp"

#include <charconv>
#include <cmath>
#include <concepts>
#include <format>
#include <string>
#include <string_view>

namespace hintweight::util {

// Safe parse integer from string_view (wrapper for from_chars)
template <std::integral T>
[[nodiscard]] inline auto parse_int(std::string_view s, int base = 10)
    -> Result<T> {
  T value{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value, base);
  if (ec == std::errc{} && ptr == s.data() + s.size()) {
    return ok(value);
  }
  return fail(Error::ParseError);
}

// Accepts "1", ".3", "+2", "1e+100", "1e-3". Rejects inf and nan.
[[nodiscard]] inline auto parse_double(std::string_view s) -> Result<double> {
  if (s.starts_with('+')) {
    s.remove_prefix(1);
    if (s.starts_with('-') || s.starts_with('+')) {
      return fail(Error::ParseError);
    }
  }
  double value{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value,
                                   std::chars_format::general);
  if (ec == std::errc{} && ptr == s.data() + s.size() && !s.empty() &&
      std::isfinite(value)) {
    return ok(value);
  }
  return fail(Error::ParseError);
}

// Shortest text that parse_double reads back to the same value.
[[nodiscard]] inline auto format_number(double value) -> std::string {
  return std::format("{}", value);
}

} // namespace hintweight::util
