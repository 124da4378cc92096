#pragma once

#include <chrono>
#include <cstdint>

namespace safeid {

namespace codec {
constexpr int kDefaultEpochYear = 2023;
constexpr std::int64_t kDefaultDisambiguationSpace = 1024;

// 2^53, the first integer a double can no longer tell from its successor.
constexpr std::int64_t kSafeIntegerLimit = std::int64_t{1} << 53;
constexpr std::int64_t kMaxSafeInteger = kSafeIntegerLimit - 1;

// Epoch years whose January 1 lies within 100,000,000 days of the Unix
// epoch (8.64e15 ms either side).
constexpr int kMinEpochYear = -271820;
constexpr int kMaxEpochYear = 275760;

// Mean Gregorian year.
constexpr double kMillisPerYear = 1000.0 * 60 * 60 * 24 * 365.2425;
} // namespace codec

namespace timing {
constexpr auto kSuspendInterval = std::chrono::microseconds(100);
constexpr auto kMaxBackoffSleep = std::chrono::microseconds(100);
} // namespace timing

} // namespace safeid
