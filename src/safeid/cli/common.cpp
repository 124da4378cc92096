#include "safeid/cli/commands.hpp"
#include "safeid/config/config.hpp"
#include "safeid/util/log.hpp"

namespace safeid::cli {

auto resolve_config(const CommonOptions &opts) -> Result<SystemConfig> {
  auto loaded = opts.config_file.empty()
                    ? ConfigLoader::load_from_env()
                    : ConfigLoader::load_from_file(opts.config_file);
  if (!loaded) {
    return fail(loaded.error());
  }

  auto cfg = std::move(*loaded);
  if (opts.epoch_year) {
    cfg.codec.epoch_year = *opts.epoch_year;
  }
  if (opts.disambiguation_space) {
    cfg.codec.disambiguation_space = *opts.disambiguation_space;
  }
  if (opts.log_level) {
    cfg.log.level = *opts.log_level;
  }

  auto validated = ConfigLoader::validate(std::move(cfg));
  if (!validated) {
    return fail(validated.error());
  }
  cfg = std::move(*validated);

  log::set_level(cfg.log.level);
  if (!cfg.log.file.empty() && !log::set_output_file(cfg.log.file)) {
    log::warn("cannot open log file {}, logging to stderr", cfg.log.file);
  }
  return ok(std::move(cfg));
}

} // namespace safeid::cli
