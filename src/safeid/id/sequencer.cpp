#include "safeid/id/sequencer.hpp"

#include "safeid/util/backoff.hpp"
#include "safeid/util/log.hpp"

#include <boost/asio/steady_timer.hpp>

#include <thread>
#include <utility>

namespace safeid {

Sequencer::Sequencer(IdCodec codec, SequencerOptions options)
    : codec_(std::move(codec)), options_(options) {}

auto Sequencer::try_next() -> std::optional<std::int64_t> {
  const auto tick = codec_.elapsed_millis();
  if (tick != current_tick_) {
    current_tick_ = tick;
    counter_ = 0;
  }
  if (counter_ >= codec_.disambiguation_space()) {
    return std::nullopt;
  }
  return codec_.compose(tick, counter_++);
}

auto Sequencer::next() -> std::int64_t {
  if (auto id = try_next()) {
    return *id;
  }

  log::trace("disambiguation space exhausted at tick {}, waiting ({})",
             current_tick_, to_string_view(options_.wait_strategy));
  AdaptiveBackoff backoff;
  for (;;) {
    switch (options_.wait_strategy) {
    case WaitStrategy::Spin:
      cpu_relax();
      break;
    case WaitStrategy::Yield:
      std::this_thread::yield();
      break;
    case WaitStrategy::Backoff:
      backoff();
      break;
    }
    if (auto id = try_next()) {
      return *id;
    }
  }
}

auto Sequencer::next_async() -> task<std::int64_t> {
  if (auto id = try_next()) {
    co_return *id;
  }

  log::trace("disambiguation space exhausted at tick {}, suspending",
             current_tick_);
  boost::asio::steady_timer timer{co_await boost::asio::this_coro::executor};
  for (;;) {
    timer.expires_after(options_.suspend_interval);
    co_await timer.async_wait(use_awaitable);
    if (auto id = try_next()) {
      co_return *id;
    }
  }
}

} // namespace safeid
