#include "safeid/cli/commands.hpp"
#include "safeid/cli/formatting.hpp"
#include "safeid/util/conv.hpp"
#include "safeid/util/json.hpp"
#include "safeid/util/time.hpp"

#include <print>

namespace safeid::cli {

auto decode_id(const IdCodec &codec, std::string_view text, bool utc)
    -> Result<CalendarTime> {
  return util::parse_int<std::int64_t>(text).transform(
      [&](std::int64_t id) { return codec.created_at(id, utc); });
}

auto cmd_decode(const DecodeOptions &opts) -> int {
  auto config = resolve_config(opts.common);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 1;
  }

  IdCodec codec{config->codec};
  auto decoded = decode_id(codec, opts.id, opts.utc);
  if (!decoded) {
    std::println(stderr, "Error: '{}' is not an id: {}", opts.id,
                 decoded.error().message());
    return 1;
  }

  if (opts.json) {
    JsonValue output{
        {"id", opts.id},
        {"created_at", decoded->to_string()},
        {"unix_millis",
         static_cast<std::int64_t>(
             decoded->instant.time_since_epoch().count())},
        {"utc", decoded->is_utc},
    };
    std::println("{}", dump_json(output));
    return 0;
  }

  std::println("{}", decoded->to_string());
  if (decoded->instant.time_since_epoch().count() <
      codec.epoch_millis()) {
    std::println(stderr, "{}",
                 fmt::ansi::yellow("note: id predates the configured epoch"));
  }
  return 0;
}

} // namespace safeid::cli
