#pragma once

#include "safeid/id/codec.hpp"
#include "safeid/id/sequencer.hpp"

#include <string>

namespace safeid {

struct LogConfig {
  std::string level{"warn"};
  std::string file;

  auto operator==(const LogConfig &) const -> bool = default;
};

struct SystemConfig {
  CodecOptions codec;
  SequencerOptions sequencer;
  LogConfig log;

  auto operator==(const SystemConfig &) const -> bool = default;
};

} // namespace safeid
