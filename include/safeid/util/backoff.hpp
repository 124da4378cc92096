#pragma once

#include "safeid/core/constants.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace safeid {

inline void cpu_relax() noexcept {
#if defined(__x86_64__) || defined(__i386__)
  __builtin_ia32_pause();
#elif defined(__aarch64__)
  __asm__ volatile("yield" ::: "memory");
#endif
}

// Waits a little longer on each call: pause-spins first, then yields, then
// sleeps with doubling duration capped at max_sleep.
class AdaptiveBackoff {
public:
  struct Config {
    int spin_attempts{6};
    int yield_attempts{12};
    std::chrono::microseconds initial_sleep{2};
    std::chrono::microseconds max_sleep{timing::kMaxBackoffSleep};
  };

  AdaptiveBackoff() = default;
  explicit AdaptiveBackoff(Config cfg) : cfg_(cfg) {}

  void operator()() {
    const int n = attempts_++;
    if (n < cfg_.spin_attempts) {
      for (int i = 0, spins = 1 << std::min(n, 10); i < spins; ++i) {
        cpu_relax();
      }
      return;
    }
    if (n < cfg_.yield_attempts) {
      std::this_thread::yield();
      return;
    }
    const int doublings = std::min(n - cfg_.yield_attempts, 16);
    std::this_thread::sleep_for(
        std::min(cfg_.initial_sleep * (1 << doublings), cfg_.max_sleep));
  }

  void reset() noexcept { attempts_ = 0; }

  [[nodiscard]] auto attempts() const noexcept -> int { return attempts_; }

private:
  Config cfg_;
  int attempts_{0};
};

} // namespace safeid
