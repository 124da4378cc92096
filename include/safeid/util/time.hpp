#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <string>

namespace safeid::util {

using Millis = std::chrono::milliseconds;
using SysMillis = std::chrono::sys_time<Millis>;
using LocalMillis = std::chrono::local_time<Millis>;

// Milliseconds from the Unix epoch to `year`-01-01T00:00:00Z in the proleptic
// Gregorian calendar. Negative for years before 1970. Computed in 64 bits
// (days_from_civil), so it is exact for any year in
// [codec::kMinEpochYear, codec::kMaxEpochYear], well beyond the range of
// std::chrono::year.
[[nodiscard]] constexpr auto epoch_millis_for_year(int year) noexcept
    -> std::int64_t {
  // January counts as month 10 of the previous March-based year.
  const std::int64_t y = std::int64_t{year} - 1;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const std::int64_t yoe = y - era * 400;
  constexpr std::int64_t kDayOfYearJan1 = 306;
  const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + kDayOfYearJan1;
  const std::int64_t days = era * 146097 + doe - 719468;
  return days * 86'400'000;
}

// Instants that std::chrono's calendar types can present, with a day of
// headroom at both ends for the local UTC offset. Decoded times are clamped
// to this range.
inline constexpr std::int64_t kMinCalendarMillis =
    std::chrono::duration_cast<Millis>(
        std::chrono::sys_days{std::chrono::year::min() / std::chrono::January /
                              2}
            .time_since_epoch())
        .count();
inline constexpr std::int64_t kMaxCalendarMillis =
    std::chrono::duration_cast<Millis>(
        std::chrono::sys_days{std::chrono::year::max() /
                              std::chrono::December / 31}
            .time_since_epoch())
        .count() -
    1;

// Converts time_point to Unix epoch milliseconds, rounding towards negative
// infinity so pre-1970 instants stay on the correct tick.
[[nodiscard]] inline auto
to_unix_millis(std::chrono::system_clock::time_point tp) -> std::int64_t {
  return std::chrono::floor<Millis>(tp).time_since_epoch().count();
}

[[nodiscard]] inline auto from_unix_millis(std::int64_t millis) -> SysMillis {
  return SysMillis{Millis{millis}};
}

// UTC offset in effect at `tp` for the process time zone (TZ / localtime).
[[nodiscard]] inline auto local_utc_offset(SysMillis tp)
    -> std::chrono::seconds {
  const auto t = static_cast<std::time_t>(
      std::chrono::floor<std::chrono::seconds>(tp).time_since_epoch().count());
  std::tm tm{};
  if (localtime_r(&t, &tm) == nullptr) {
    return std::chrono::seconds{0};
  }
  return std::chrono::seconds{tm.tm_gmtoff};
}

[[nodiscard]] inline auto to_local(SysMillis tp) -> LocalMillis {
  return LocalMillis{tp.time_since_epoch() + local_utc_offset(tp)};
}

// Formats to ISO 8601 with milliseconds (YYYY-MM-DDTHH:MM:SS.mmmZ)
[[nodiscard]] inline auto format_iso8601(SysMillis tp) -> std::string {
  return std::format("{:%Y-%m-%dT%H:%M:%S}Z", tp);
}

// Formats a wall-clock reading (YYYY-MM-DD HH:MM:SS.mmm)
[[nodiscard]] inline auto format_local_timestamp(LocalMillis tp)
    -> std::string {
  return std::format("{:%Y-%m-%d %H:%M:%S}", tp);
}

} // namespace safeid::util
