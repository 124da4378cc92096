#include "safeid/cli/commands.hpp"
#include "safeid/cli/formatting.hpp"
#include "safeid/core/constants.hpp"
#include "safeid/util/json.hpp"
#include "safeid/util/time.hpp"

#include <print>

namespace safeid::cli {

auto cmd_info(const InfoOptions &opts) -> int {
  auto config = resolve_config(opts.common);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 1;
  }

  const IdCodec codec{config->codec};

  if (opts.json) {
    JsonValue output{
        {"epoch_year", static_cast<std::int64_t>(codec.epoch_year())},
        {"epoch_millis", codec.epoch_millis()},
        {"disambiguation_space", codec.disambiguation_space()},
        {"safe_span_years", codec.safe_span_years()},
        {"last_safe_year", codec.last_safe_year()},
        {"max_safe_integer", codec::kMaxSafeInteger},
    };
    std::println("{}", dump_json(output));
    return 0;
  }

  const auto label = [](std::string_view text) {
    return fmt::ansi::bold(std::format("{:<22}", text));
  };
  std::println("{}{}", label("epoch year"), codec.epoch_year());
  const auto epoch = util::from_unix_millis(codec.epoch_millis());
  std::println("{}{} ({})", label("epoch"), codec.epoch_millis(),
               util::format_iso8601(epoch));
  std::println("{}{}", label("disambiguation space"),
               codec.disambiguation_space());
  std::println("{}{}", label("safe span (years)"), codec.safe_span_years());
  std::println("{}{}", label("last safe year"),
               fmt::ansi::cyan(std::format("{}", codec.last_safe_year())));
  return 0;
}

} // namespace safeid::cli
