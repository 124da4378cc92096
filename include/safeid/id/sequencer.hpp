#pragma once

#include "safeid/core/constants.hpp"
#include "safeid/core/coroutine.hpp"
#include "safeid/id/codec.hpp"
#include "safeid/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <optional>

namespace safeid {

enum class WaitStrategy : std::uint8_t { Spin, Yield, Backoff };
BOOST_DESCRIBE_ENUM(WaitStrategy, Spin, Yield, Backoff)
SAFEID_DEFINE_ENUM_SERDE(WaitStrategy, WaitStrategy::Backoff)

struct SequencerOptions {
  // How next() waits for the clock once a tick's disambiguation space is
  // used up.
  WaitStrategy wait_strategy{WaitStrategy::Backoff};
  // How long next_async() suspends between polls.
  std::chrono::microseconds suspend_interval{timing::kSuspendInterval};

  auto operator==(const SequencerOptions &) const -> bool = default;
};

// Counter-disambiguated allocation. Within one millisecond tick the
// disambiguation value counts up from zero, so ids from one instance are
// strictly increasing as long as the clock does not step backwards.
//
// Not thread-safe: use one Sequencer per thread or executor, or guard it.
// There is no cancellation; next() and next_async() return once the clock
// reaches the next tick.
class Sequencer {
public:
  explicit Sequencer(IdCodec codec, SequencerOptions options = {});

  // One allocation attempt. Empty when the current tick is exhausted.
  [[nodiscard]] auto try_next() -> std::optional<std::int64_t>;

  // Blocks the calling thread until an id is available.
  [[nodiscard]] auto next() -> std::int64_t;

  // Suspends the calling coroutine between attempts instead of blocking the
  // thread. The Sequencer must outlive the returned awaitable.
  [[nodiscard]] auto next_async() -> task<std::int64_t>;

  [[nodiscard]] auto codec() const noexcept -> const IdCodec & {
    return codec_;
  }
  [[nodiscard]] auto options() const noexcept -> const SequencerOptions & {
    return options_;
  }
  [[nodiscard]] auto current_tick() const noexcept -> std::int64_t {
    return current_tick_;
  }
  [[nodiscard]] auto counter() const noexcept -> std::int64_t {
    return counter_;
  }

private:
  IdCodec codec_;
  SequencerOptions options_;
  std::int64_t current_tick_{0};
  std::int64_t counter_{0};
};

} // namespace safeid
