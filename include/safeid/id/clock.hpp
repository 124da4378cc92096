#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace safeid {

// Wall-clock source consumed by the codec. Implementations must be safe to
// call from several threads at once.
class Clock {
public:
  virtual ~Clock() = default;

  [[nodiscard]] virtual auto now() const
      -> std::chrono::system_clock::time_point = 0;

protected:
  Clock() = default;
  Clock(const Clock &) = default;
  Clock &operator=(const Clock &) = default;
};

class SystemClock final : public Clock {
public:
  [[nodiscard]] auto now() const
      -> std::chrono::system_clock::time_point override {
    return std::chrono::system_clock::now();
  }
};

// Clock that only moves when told to. Millisecond resolution.
class ManualClock final : public Clock {
public:
  explicit ManualClock(std::int64_t unix_millis = 0) noexcept
      : millis_(unix_millis) {}

  explicit ManualClock(std::chrono::system_clock::time_point tp) noexcept
      : millis_(std::chrono::floor<std::chrono::milliseconds>(tp)
                    .time_since_epoch()
                    .count()) {}

  [[nodiscard]] auto now() const
      -> std::chrono::system_clock::time_point override {
    return std::chrono::system_clock::time_point{std::chrono::milliseconds{
        millis_.load(std::memory_order_acquire)}};
  }

  auto set(std::int64_t unix_millis) noexcept -> void {
    millis_.store(unix_millis, std::memory_order_release);
  }

  auto advance(std::chrono::milliseconds delta) noexcept -> void {
    millis_.fetch_add(delta.count(), std::memory_order_acq_rel);
  }

  [[nodiscard]] auto unix_millis() const noexcept -> std::int64_t {
    return millis_.load(std::memory_order_acquire);
  }

private:
  std::atomic<std::int64_t> millis_;
};

[[nodiscard]] auto system_clock() -> std::shared_ptr<Clock>;

} // namespace safeid
