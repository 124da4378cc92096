#include "safeid/cli/commands.hpp"
#include "safeid/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("SAFEID_CONFIG"); env && *env) {
    return env;
  }
  return {};
}

auto add_common_options(CLI::App *cmd, safeid::cli::CommonOptions &opts)
    -> void {
  cmd->add_option("-c,--config", opts.config_file, "TOML config file")
      ->check(CLI::ExistingFile);
  cmd->add_option("--epoch-year", opts.epoch_year,
                  "First year ids are minted in (default: 2023)");
  cmd->add_option("--space", opts.disambiguation_space,
                  "Disambiguation values per millisecond (default: 1024)");
  cmd->add_option("--log-level", opts.log_level,
                  "Log level override: trace|debug|info|warn|error");
}

// Drains the background log writer before the process exits.
[[noreturn]] auto finish(int rc) -> void {
  safeid::log::stop();
  std::exit(rc);
}
} // namespace

int main(int argc, char *argv[]) {
  // Ids go to stdout; keep diagnostics on stderr.
  safeid::log::set_output_stderr();
  safeid::log::set_level(safeid::log::Level::Warn);
  safeid::log::start();

  CLI::App app{"Sortable 53-bit ids without coordination", "safeid"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  safeid generate -n 5\n"
             "  safeid generate -n 10000 --sequential --json\n"
             "  safeid decode 8234958123008 --utc\n"
             "  safeid info --space 2048\n"
             "\nTip: Set SAFEID_CONFIG=safeid.toml to skip -c on every "
             "command.");

  const std::string env_config = default_config();

  safeid::cli::GenerateOptions generate_opts;
  generate_opts.common.config_file = env_config;
  auto *generate = app.add_subcommand("generate", "Mint new ids");
  add_common_options(generate, generate_opts.common);
  generate->add_option("-n,--count", generate_opts.count, "Number of ids")
      ->check(CLI::PositiveNumber);
  generate->add_flag("--sequential", generate_opts.sequential,
                     "Counter disambiguation (strictly increasing)");
  generate->add_flag("--async", generate_opts.async,
                     "Counter disambiguation, suspending on an io_context");
  generate->add_flag("--json", generate_opts.json, "Output JSON");
  generate->callback([&generate_opts]() {
    finish(safeid::cli::cmd_generate(generate_opts));
  });

  safeid::cli::DecodeOptions decode_opts;
  decode_opts.common.config_file = env_config;
  auto *decode = app.add_subcommand("decode", "Show when an id was minted");
  add_common_options(decode, decode_opts.common);
  decode->add_option("id", decode_opts.id, "Id to decode")->required();
  decode->add_flag("--utc", decode_opts.utc, "Print UTC instead of local time");
  decode->add_flag("--json", decode_opts.json, "Output JSON");
  decode->callback(
      [&decode_opts]() { finish(safeid::cli::cmd_decode(decode_opts)); });

  safeid::cli::InfoOptions info_opts;
  info_opts.common.config_file = env_config;
  auto *info =
      app.add_subcommand("info", "Show the codec's derived safe range");
  add_common_options(info, info_opts.common);
  info->add_flag("--json", info_opts.json, "Output JSON");
  info->callback(
      [&info_opts]() { finish(safeid::cli::cmd_info(info_opts)); });

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    safeid::log::stop();
    return app.exit(e);
  }
  safeid::log::stop();
  return 0;
}
