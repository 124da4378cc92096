#pragma once

#include "safeid/config/system_config.hpp"
#include "safeid/core/error.hpp"
#include "safeid/id/codec.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace safeid::cli {

struct CommonOptions {
  std::string config_file;
  std::optional<int> epoch_year;
  std::optional<std::int64_t> disambiguation_space;
  std::optional<std::string> log_level;
};

struct GenerateOptions {
  CommonOptions common;
  std::size_t count{1};
  bool sequential{false};
  bool async{false};
  bool json{false};
};

struct DecodeOptions {
  CommonOptions common;
  std::string id;
  bool utc{false};
  bool json{false};
};

struct InfoOptions {
  CommonOptions common;
  bool json{false};
};

// Config file (or environment when none is given), then command-line
// overrides. Also applies the [log] section to the process logger.
[[nodiscard]] auto resolve_config(const CommonOptions &opts)
    -> Result<SystemConfig>;

// `async` implies sequential allocation.
[[nodiscard]] auto generate_ids(const SystemConfig &config,
                                const GenerateOptions &opts)
    -> std::vector<std::int64_t>;

[[nodiscard]] auto decode_id(const IdCodec &codec, std::string_view text,
                             bool utc) -> Result<CalendarTime>;

auto cmd_generate(const GenerateOptions &opts) -> int;
auto cmd_decode(const DecodeOptions &opts) -> int;
auto cmd_info(const InfoOptions &opts) -> int;

} // namespace safeid::cli
