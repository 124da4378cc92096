#include "safeid/id/clock.hpp"

namespace safeid {

auto system_clock() -> std::shared_ptr<Clock> {
  static const auto instance = std::make_shared<SystemClock>();
  return instance;
}

} // namespace safeid
