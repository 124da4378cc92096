#pragma once

#include "safeid/core/error.hpp"

#include <charconv>
#include <concepts>
#include <cstdint>
#include <limits>
#include <string_view>
#include <system_error>

namespace safeid::util {

// Whole-string integer parse; trailing garbage is a ParseError, values that do
// not fit T are OutOfRange.
template <std::integral T>
[[nodiscard]] inline auto parse_int(std::string_view s, int base = 10)
    -> Result<T> {
  T value{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value, base);
  if (ec == std::errc::result_out_of_range) {
    return fail(Error::OutOfRange);
  }
  if (ec == std::errc{} && ptr == s.data() + s.size()) {
    return ok(value);
  }
  return fail(Error::ParseError);
}

// Sum and product clamped to the int64 range instead of wrapping.
[[nodiscard]] inline auto saturating_add(std::int64_t a, std::int64_t b)
    noexcept -> std::int64_t {
  std::int64_t out = 0;
  if (__builtin_add_overflow(a, b, &out)) {
    return b < 0 ? std::numeric_limits<std::int64_t>::min()
                 : std::numeric_limits<std::int64_t>::max();
  }
  return out;
}

[[nodiscard]] inline auto saturating_mul(std::int64_t a, std::int64_t b)
    noexcept -> std::int64_t {
  std::int64_t out = 0;
  if (__builtin_mul_overflow(a, b, &out)) {
    return (a < 0) != (b < 0) ? std::numeric_limits<std::int64_t>::min()
                              : std::numeric_limits<std::int64_t>::max();
  }
  return out;
}

} // namespace safeid::util
