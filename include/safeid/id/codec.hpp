#pragma once

#include "safeid/core/constants.hpp"
#include "safeid/id/clock.hpp"
#include "safeid/id/random_source.hpp"
#include "safeid/util/conv.hpp"
#include "safeid/util/time.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace safeid {

struct CodecOptions {
  int epoch_year{codec::kDefaultEpochYear};
  std::int64_t disambiguation_space{codec::kDefaultDisambiguationSpace};
  RandomSourceKind random_source{RandomSourceKind::Fast};

  auto operator==(const CodecOptions &) const -> bool = default;
};

// Decoded creation time. `wall` is the reading of a clock in UTC when
// `is_utc` is set, otherwise in the process's local time zone.
struct CalendarTime {
  util::SysMillis instant;
  util::LocalMillis wall;
  bool is_utc{false};

  [[nodiscard]] auto to_string() const -> std::string;
};

// Packs a millisecond timestamp and a disambiguation value into one integer:
//
//   id = (now_millis - epoch_millis) * disambiguation_space + disambiguation
//
// The codec is immutable after construction and may be shared freely; copies
// share the clock and random source.
class IdCodec {
public:
  explicit IdCodec(CodecOptions options = {},
                   std::shared_ptr<RandomSource> random = nullptr,
                   std::shared_ptr<Clock> clock = nullptr);

  [[nodiscard]] auto epoch_year() const noexcept -> int { return epoch_year_; }
  [[nodiscard]] auto epoch_millis() const noexcept -> std::int64_t {
    return epoch_millis_;
  }
  [[nodiscard]] auto disambiguation_space() const noexcept -> std::int64_t {
    return disambiguation_space_;
  }
  [[nodiscard]] auto safe_span_years() const noexcept -> std::int64_t {
    return safe_span_years_;
  }
  [[nodiscard]] auto last_safe_year() const noexcept -> std::int64_t {
    return last_safe_year_;
  }

  // Milliseconds elapsed since the epoch according to the codec's clock.
  // Negative while the clock reads a time before epoch_year.
  [[nodiscard]] auto elapsed_millis() const -> std::int64_t;

  // tick * disambiguation_space + disambiguation, saturating at the int64
  // limits. Only reachable far outside the safe envelope.
  [[nodiscard]] auto compose(std::int64_t tick,
                             std::int64_t disambiguation) const noexcept
      -> std::int64_t {
    return util::saturating_add(
        util::saturating_mul(tick, disambiguation_space_), disambiguation);
  }

  // Floor of id / disambiguation_space; exact for ids minted before the epoch.
  [[nodiscard]] auto timestamp_of(std::int64_t id) const noexcept
      -> std::int64_t;

  // Current time plus a uniformly drawn disambiguation value. Never fails and
  // never blocks. Safe to call concurrently when the random source is.
  [[nodiscard]] auto next_random_id() const -> std::int64_t;

  // Total over all int64 values. Instants outside
  // [util::kMinCalendarMillis, util::kMaxCalendarMillis] are clamped to it.
  [[nodiscard]] auto created_at(std::int64_t id, bool utc = false) const
      -> CalendarTime;

  [[nodiscard]] auto created_at_instant(std::int64_t id) const
      -> util::SysMillis;

  [[nodiscard]] auto clock() const noexcept -> const Clock & { return *clock_; }

private:
  int epoch_year_;
  std::int64_t epoch_millis_;
  std::int64_t disambiguation_space_;
  std::int64_t safe_span_years_;
  std::int64_t last_safe_year_;
  std::shared_ptr<RandomSource> random_;
  std::shared_ptr<Clock> clock_;
};

// floor(2^53 / (disambiguation_space * mean Gregorian year in ms)), with the
// space clamped to at least 1.
[[nodiscard]] auto safe_span_years_for(std::int64_t disambiguation_space)
    -> std::int64_t;

// Shared codec with default options, built on first use.
[[nodiscard]] auto default_codec() -> const IdCodec &;

} // namespace safeid
