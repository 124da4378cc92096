#include "safeid/cli/commands.hpp"
#include "safeid/core/coroutine.hpp"
#include "safeid/id/sequencer.hpp"
#include "safeid/util/json.hpp"
#include "safeid/util/log.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <print>
#include <utility>

namespace safeid::cli {

namespace {

[[nodiscard]] auto generate_async(Sequencer &sequencer, std::size_t count)
    -> std::vector<std::int64_t> {
  boost::asio::io_context io;
  auto fut = co_spawn(
      io,
      [&sequencer, count]() -> task<std::vector<std::int64_t>> {
        std::vector<std::int64_t> ids;
        ids.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
          ids.push_back(co_await sequencer.next_async());
        }
        co_return ids;
      },
      boost::asio::use_future);
  io.run();
  return fut.get();
}

[[nodiscard]] auto mode_name(const GenerateOptions &opts) -> std::string_view {
  if (opts.async) {
    return "async";
  }
  return opts.sequential ? "sequential" : "random";
}

} // namespace

auto generate_ids(const SystemConfig &config, const GenerateOptions &opts)
    -> std::vector<std::int64_t> {
  IdCodec codec{config.codec};
  if (opts.async) {
    Sequencer sequencer{std::move(codec), config.sequencer};
    return generate_async(sequencer, opts.count);
  }

  std::vector<std::int64_t> ids;
  ids.reserve(opts.count);
  if (opts.sequential) {
    Sequencer sequencer{std::move(codec), config.sequencer};
    for (std::size_t i = 0; i < opts.count; ++i) {
      ids.push_back(sequencer.next());
    }
    return ids;
  }

  for (std::size_t i = 0; i < opts.count; ++i) {
    ids.push_back(codec.next_random_id());
  }
  return ids;
}

auto cmd_generate(const GenerateOptions &opts) -> int {
  auto config = resolve_config(opts.common);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 1;
  }

  const auto ids = generate_ids(*config, opts);
  log::debug("generated {} {} id(s)", ids.size(), mode_name(opts));

  if (opts.json) {
    JsonValue arr = std::vector<JsonValue>{};
    for (auto id : ids) {
      arr.get_array().emplace_back(id);
    }
    JsonValue output{
        {"mode", std::string{mode_name(opts)}},
        {"ids", std::move(arr)},
    };
    std::println("{}", dump_json(output));
    return 0;
  }

  for (auto id : ids) {
    std::println("{}", id);
  }
  return 0;
}

} // namespace safeid::cli
