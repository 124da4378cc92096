#include "safeid/id/codec.hpp"

#include "safeid/util/conv.hpp"
#include "safeid/util/log.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace safeid {

auto safe_span_years_for(std::int64_t disambiguation_space) -> std::int64_t {
  const auto space = std::max<std::int64_t>(disambiguation_space, 1);
  const auto span = static_cast<double>(codec::kSafeIntegerLimit) /
                    (static_cast<double>(space) * codec::kMillisPerYear);
  return static_cast<std::int64_t>(std::floor(span));
}

IdCodec::IdCodec(CodecOptions options, std::shared_ptr<RandomSource> random,
                 std::shared_ptr<Clock> clock)
    : epoch_year_(std::clamp(options.epoch_year, codec::kMinEpochYear,
                             codec::kMaxEpochYear)),
      epoch_millis_(util::epoch_millis_for_year(epoch_year_)),
      disambiguation_space_(std::clamp<std::int64_t>(
          options.disambiguation_space, 1, codec::kSafeIntegerLimit)),
      safe_span_years_(safe_span_years_for(disambiguation_space_)),
      last_safe_year_(epoch_year_ + safe_span_years_ - 1),
      random_(random ? std::move(random)
                     : make_random_source(options.random_source)),
      clock_(clock ? std::move(clock) : system_clock()) {
  if (epoch_year_ != options.epoch_year) {
    log::warn("epoch_year {} outside [{}, {}], clamped to {}",
              options.epoch_year, codec::kMinEpochYear, codec::kMaxEpochYear,
              epoch_year_);
  }
  if (disambiguation_space_ != options.disambiguation_space) {
    log::debug("disambiguation_space {} clamped to {}",
               options.disambiguation_space, disambiguation_space_);
  }
  log::debug("id codec ready: epoch_year={} disambiguation_space={} "
             "safe_span_years={} last_safe_year={}",
             epoch_year_, disambiguation_space_, safe_span_years_,
             last_safe_year_);
}

auto IdCodec::elapsed_millis() const -> std::int64_t {
  return util::to_unix_millis(clock_->now()) - epoch_millis_;
}

auto IdCodec::timestamp_of(std::int64_t id) const noexcept -> std::int64_t {
  auto q = id / disambiguation_space_;
  if (id % disambiguation_space_ < 0) {
    --q;
  }
  return q;
}

auto IdCodec::next_random_id() const -> std::int64_t {
  const auto tick = elapsed_millis();
  return compose(tick, random_->next_below(disambiguation_space_));
}

auto IdCodec::created_at_instant(std::int64_t id) const -> util::SysMillis {
  const auto unix_millis =
      util::saturating_add(timestamp_of(id), epoch_millis_);
  return util::from_unix_millis(std::clamp(
      unix_millis, util::kMinCalendarMillis, util::kMaxCalendarMillis));
}

auto IdCodec::created_at(std::int64_t id, bool utc) const -> CalendarTime {
  const auto instant = created_at_instant(id);
  if (utc) {
    return CalendarTime{.instant = instant,
                        .wall = util::LocalMillis{instant.time_since_epoch()},
                        .is_utc = true};
  }
  return CalendarTime{
      .instant = instant, .wall = util::to_local(instant), .is_utc = false};
}

auto CalendarTime::to_string() const -> std::string {
  if (is_utc) {
    return util::format_iso8601(instant);
  }
  return util::format_local_timestamp(wall);
}

auto default_codec() -> const IdCodec & {
  static const IdCodec instance{};
  return instance;
}

} // namespace safeid
