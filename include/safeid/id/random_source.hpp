#pragma once

#include "safeid/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>

namespace safeid {

enum class RandomSourceKind : std::uint8_t { Fast, Secure };
BOOST_DESCRIBE_ENUM(RandomSourceKind, Fast, Secure)
SAFEID_DEFINE_ENUM_SERDE(RandomSourceKind, RandomSourceKind::Fast)

// Uniform integer source over [0, bound). Callers pass bound >= 1.
class RandomSource {
public:
  virtual ~RandomSource() = default;

  [[nodiscard]] virtual auto next_below(std::int64_t bound) -> std::int64_t = 0;

protected:
  RandomSource() = default;
  RandomSource(const RandomSource &) = default;
  RandomSource &operator=(const RandomSource &) = default;
};

// Non-cryptographic. One mt19937_64 per thread, so concurrent callers never
// share engine state.
class FastRandomSource final : public RandomSource {
public:
  [[nodiscard]] auto next_below(std::int64_t bound) -> std::int64_t override;
};

// std::random_device behind a mutex; backed by the OS entropy pool on Linux.
class SecureRandomSource final : public RandomSource {
public:
  [[nodiscard]] auto next_below(std::int64_t bound) -> std::int64_t override;

private:
  std::mutex mutex_;
  std::random_device device_;
};

// Reproducible sequence for a given seed. Not thread-safe.
class SeededRandomSource final : public RandomSource {
public:
  explicit SeededRandomSource(std::uint64_t seed) : engine_(seed) {}

  [[nodiscard]] auto next_below(std::int64_t bound) -> std::int64_t override;

private:
  std::mt19937_64 engine_;
};

[[nodiscard]] auto make_random_source(RandomSourceKind kind)
    -> std::shared_ptr<RandomSource>;

} // namespace safeid
