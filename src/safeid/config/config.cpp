#include "safeid/config/config.hpp"
#include "safeid/config/toml_util.hpp"

#include "safeid/core/error.hpp"
#include "safeid/util/enum.hpp"
#include "safeid/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <string>
#include <string_view>

namespace safeid {
namespace detail {

struct CodecToml {
  int epoch_year{codec::kDefaultEpochYear};
  std::int64_t disambiguation_space{codec::kDefaultDisambiguationSpace};
  std::string random_source{"fast"};
};

struct SequencerToml {
  std::string wait_strategy{"backoff"};
  std::int64_t suspend_interval_us{timing::kSuspendInterval.count()};
};

struct LogToml {
  std::string level{"warn"};
  std::string file;
};

struct SystemToml {
  CodecToml codec{};
  SequencerToml sequencer{};
  LogToml log{};
};

} // namespace detail
} // namespace safeid

namespace glz {
template <> struct meta<safeid::detail::CodecToml> {
  using T = safeid::detail::CodecToml;
  static constexpr auto value =
      object("epoch_year", &T::epoch_year, "disambiguation_space",
             &T::disambiguation_space, "random_source", &T::random_source);
};

template <> struct meta<safeid::detail::SequencerToml> {
  using T = safeid::detail::SequencerToml;
  static constexpr auto value =
      object("wait_strategy", &T::wait_strategy, "suspend_interval_us",
             &T::suspend_interval_us);
};

template <> struct meta<safeid::detail::LogToml> {
  using T = safeid::detail::LogToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<safeid::detail::SystemToml> {
  using T = safeid::detail::SystemToml;
  static constexpr auto value = object("codec", &T::codec, "sequencer",
                                       &T::sequencer, "log", &T::log);
};
} // namespace glz

namespace safeid {
namespace {

template <typename E>
[[nodiscard]] auto parse_enum_field(std::string_view key,
                                    std::string_view value) -> E {
  if (!util::is_enum_name<E>(value)) {
    log::warn("unknown {} '{}', using default", key, value);
  }
  return parse<E>(value);
}

auto apply_env_overrides(SystemConfig &cfg) -> void {
  if (const char *v = std::getenv("SAFEID_EPOCH_YEAR"); v != nullptr) {
    cfg.codec.epoch_year = boost::lexical_cast<int>(v);
  }
  if (const char *v = std::getenv("SAFEID_DISAMBIGUATION_SPACE");
      v != nullptr) {
    cfg.codec.disambiguation_space = boost::lexical_cast<std::int64_t>(v);
  }
  if (const char *v = std::getenv("SAFEID_RANDOM_SOURCE"); v != nullptr) {
    cfg.codec.random_source =
        parse_enum_field<RandomSourceKind>("random_source", v);
  }
  if (const char *v = std::getenv("SAFEID_WAIT_STRATEGY"); v != nullptr) {
    cfg.sequencer.wait_strategy =
        parse_enum_field<WaitStrategy>("wait_strategy", v);
  }
  if (const char *v = std::getenv("SAFEID_SUSPEND_INTERVAL_US");
      v != nullptr) {
    cfg.sequencer.suspend_interval =
        std::chrono::microseconds{boost::lexical_cast<std::int64_t>(v)};
  }
  if (const char *v = std::getenv("SAFEID_LOG_LEVEL"); v != nullptr) {
    cfg.log.level = v;
  }
  if (const char *v = std::getenv("SAFEID_LOG_FILE"); v != nullptr) {
    cfg.log.file = v;
  }
}

[[nodiscard]] auto convert_toml(std::string_view toml_text,
                                std::string *diagnostic)
    -> Result<SystemConfig> {
  // A blank document is a valid config with every key defaulted.
  const bool blank = std::ranges::all_of(toml_text, [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  });
  auto raw_result =
      blank ? Result<detail::SystemToml>{}
            : toml_util::parse_toml<detail::SystemToml>(toml_text, diagnostic);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  SystemConfig cfg{};
  cfg.codec.epoch_year = raw.codec.epoch_year;
  cfg.codec.disambiguation_space = raw.codec.disambiguation_space;
  cfg.codec.random_source = parse_enum_field<RandomSourceKind>(
      "random_source", raw.codec.random_source);

  cfg.sequencer.wait_strategy = parse_enum_field<WaitStrategy>(
      "wait_strategy", raw.sequencer.wait_strategy);
  cfg.sequencer.suspend_interval =
      std::chrono::microseconds{raw.sequencer.suspend_interval_us};

  cfg.log.level = std::move(raw.log.level);
  cfg.log.file = std::move(raw.log.file);

  apply_env_overrides(cfg);
  return ConfigLoader::validate(std::move(cfg));
}

} // namespace

auto ConfigLoader::validate(SystemConfig cfg) -> Result<SystemConfig> {
  if (cfg.codec.epoch_year < codec::kMinEpochYear ||
      cfg.codec.epoch_year > codec::kMaxEpochYear) {
    log::error("codec.epoch_year must be within [{}, {}], got {}",
               codec::kMinEpochYear, codec::kMaxEpochYear,
               cfg.codec.epoch_year);
    return fail(Error::OutOfRange);
  }
  if (cfg.sequencer.suspend_interval <= std::chrono::microseconds::zero()) {
    log::error("sequencer.suspend_interval_us must be positive, got {}",
               cfg.sequencer.suspend_interval.count());
    return fail(Error::ParseError);
  }
  return ok(std::move(cfg));
}

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    log::error("cannot read config file {}", path);
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str,
                                    std::string *diagnostic)
    -> Result<SystemConfig> {
  try {
    return convert_toml(toml_str, diagnostic);
  } catch (const std::exception &e) {
    log::error("failed to load safeid configuration: {}", e.what());
    if (diagnostic) {
      *diagnostic = e.what();
    }
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::load_from_env() -> Result<SystemConfig> {
  try {
    SystemConfig cfg{};
    apply_env_overrides(cfg);
    return ConfigLoader::validate(std::move(cfg));
  } catch (const std::exception &e) {
    log::error("invalid SAFEID_* environment override: {}", e.what());
    return fail(Error::ParseError);
  }
}

} // namespace safeid
