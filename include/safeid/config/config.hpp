#pragma once

#include "safeid/config/system_config.hpp"
#include "safeid/core/error.hpp"

#include <string>
#include <string_view>

namespace safeid {

// Loads SystemConfig from TOML, then applies SAFEID_* environment overrides.
class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str,
                                             std::string *diagnostic = nullptr)
      -> Result<SystemConfig>;
  // Defaults plus environment overrides, for runs without a config file.
  [[nodiscard]] static auto load_from_env() -> Result<SystemConfig>;
  // Rejects an epoch_year outside [kMinEpochYear, kMaxEpochYear]
  // (OutOfRange) and a non-positive suspend interval (ParseError).
  [[nodiscard]] static auto validate(SystemConfig cfg) -> Result<SystemConfig>;
};

} // namespace safeid
