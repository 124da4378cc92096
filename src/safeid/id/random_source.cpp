#include "safeid/id/random_source.hpp"

#include <algorithm>
#include <random>

namespace safeid {
namespace {

template <typename Engine>
[[nodiscard]] auto draw_below(Engine &engine, std::int64_t bound)
    -> std::int64_t {
  std::uniform_int_distribution<std::int64_t> dist(
      0, std::max<std::int64_t>(bound, 1) - 1);
  return dist(engine);
}

} // namespace

auto FastRandomSource::next_below(std::int64_t bound) -> std::int64_t {
  thread_local std::mt19937_64 engine(std::random_device{}());
  return draw_below(engine, bound);
}

auto SecureRandomSource::next_below(std::int64_t bound) -> std::int64_t {
  std::lock_guard lock(mutex_);
  return draw_below(device_, bound);
}

auto SeededRandomSource::next_below(std::int64_t bound) -> std::int64_t {
  return draw_below(engine_, bound);
}

auto make_random_source(RandomSourceKind kind)
    -> std::shared_ptr<RandomSource> {
  switch (kind) {
  case RandomSourceKind::Secure:
    return std::make_shared<SecureRandomSource>();
  case RandomSourceKind::Fast:
    break;
  }
  return std::make_shared<FastRandomSource>();
}

} // namespace safeid
