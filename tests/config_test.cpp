#include "safeid/config/config.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <chrono>
#include <filesystem>

using namespace safeid;

namespace {

// Config tests must not pick up overrides from the developer's shell.
class ConfigTest : public ::testing::Test {
protected:
  test::ScopedEnv epoch_{"SAFEID_EPOCH_YEAR", std::nullopt};
  test::ScopedEnv space_{"SAFEID_DISAMBIGUATION_SPACE", std::nullopt};
  test::ScopedEnv random_{"SAFEID_RANDOM_SOURCE", std::nullopt};
  test::ScopedEnv wait_{"SAFEID_WAIT_STRATEGY", std::nullopt};
  test::ScopedEnv suspend_{"SAFEID_SUSPEND_INTERVAL_US", std::nullopt};
  test::ScopedEnv level_{"SAFEID_LOG_LEVEL", std::nullopt};
  test::ScopedEnv file_{"SAFEID_LOG_FILE", std::nullopt};
};

} // namespace

TEST_F(ConfigTest, Defaults) {
  SystemConfig cfg;
  EXPECT_EQ(cfg.codec.epoch_year, 2023);
  EXPECT_EQ(cfg.codec.disambiguation_space, 1024);
  EXPECT_EQ(cfg.codec.random_source, RandomSourceKind::Fast);
  EXPECT_EQ(cfg.sequencer.wait_strategy, WaitStrategy::Backoff);
  EXPECT_EQ(cfg.sequencer.suspend_interval, std::chrono::microseconds(100));
  EXPECT_EQ(cfg.log.level, "warn");
  EXPECT_TRUE(cfg.log.file.empty());
}

TEST_F(ConfigTest, LoadFromTomlString) {
  std::string toml = R"(
[codec]
epoch_year = 2025
disambiguation_space = 2048
random_source = "secure"

[sequencer]
wait_strategy = "yield"
suspend_interval_us = 250

[log]
level = "debug"
file = "/tmp/safeid.log"
)";

  auto result = ConfigLoader::load_from_string(toml);
  ASSERT_TRUE(result.has_value()) << result.error().message();

  EXPECT_EQ(result->codec.epoch_year, 2025);
  EXPECT_EQ(result->codec.disambiguation_space, 2048);
  EXPECT_EQ(result->codec.random_source, RandomSourceKind::Secure);
  EXPECT_EQ(result->sequencer.wait_strategy, WaitStrategy::Yield);
  EXPECT_EQ(result->sequencer.suspend_interval,
            std::chrono::microseconds(250));
  EXPECT_EQ(result->log.level, "debug");
  EXPECT_EQ(result->log.file, "/tmp/safeid.log");
}

TEST_F(ConfigTest, MissingSectionsKeepDefaults) {
  auto result = ConfigLoader::load_from_string("[codec]\nepoch_year = 2030\n");
  ASSERT_TRUE(result.has_value()) << result.error().message();

  SystemConfig expected;
  expected.codec.epoch_year = 2030;
  EXPECT_EQ(*result, expected);
}

TEST_F(ConfigTest, EmptyDocumentIsDefaults) {
  auto result = ConfigLoader::load_from_string("");
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(*result, SystemConfig{});
}

TEST_F(ConfigTest, UnknownKeysAreIgnored) {
  auto result = ConfigLoader::load_from_string(R"(
[codec]
epoch_year = 2024
colour = "blue"

[extra]
answer = 42
)");
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->codec.epoch_year, 2024);
}

TEST_F(ConfigTest, UnknownEnumNamesFallBackToDefaults) {
  auto result = ConfigLoader::load_from_string(R"(
[codec]
random_source = "quantum"

[sequencer]
wait_strategy = "nap"
)");
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->codec.random_source, RandomSourceKind::Fast);
  EXPECT_EQ(result->sequencer.wait_strategy, WaitStrategy::Backoff);
}

TEST_F(ConfigTest, ZeroSpaceIsAcceptedForTheCodecToClamp) {
  auto result =
      ConfigLoader::load_from_string("[codec]\ndisambiguation_space = 0\n");
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->codec.disambiguation_space, 0);
  EXPECT_EQ(IdCodec{result->codec}.disambiguation_space(), 1);
}

TEST_F(ConfigTest, FarEpochYearWithinRangeIsAccepted) {
  auto result = ConfigLoader::load_from_string("[codec]\nepoch_year = 40000\n");
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->codec.epoch_year, 40000);
}

TEST_F(ConfigTest, EpochYearOutOfRangeIsRejected) {
  auto from_toml =
      ConfigLoader::load_from_string("[codec]\nepoch_year = 300000\n");
  ASSERT_FALSE(from_toml.has_value());
  EXPECT_EQ(from_toml.error(), make_error_code(Error::OutOfRange));

  test::ScopedEnv epoch{"SAFEID_EPOCH_YEAR", "-300000"};
  auto from_env = ConfigLoader::load_from_env();
  ASSERT_FALSE(from_env.has_value());
  EXPECT_EQ(from_env.error(), make_error_code(Error::OutOfRange));
}

TEST_F(ConfigTest, NonPositiveSuspendIntervalIsRejected) {
  auto result = ConfigLoader::load_from_string(
      "[sequencer]\nsuspend_interval_us = 0\n");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST_F(ConfigTest, MalformedTomlReportsDiagnostic) {
  std::string diagnostic;
  auto result =
      ConfigLoader::load_from_string("[codec\nepoch_year = ", &diagnostic);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
  EXPECT_FALSE(diagnostic.empty());
}

TEST_F(ConfigTest, MissingFileIsFileNotFound) {
  auto result = ConfigLoader::load_from_file("/nonexistent/safeid.toml");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::FileNotFound));
}

TEST_F(ConfigTest, LoadFromFile) {
  const auto path = test::make_temp_path("safeid_config_");
  ASSERT_FALSE(path.empty());
  test::write_text(path, "[codec]\nepoch_year = 2026\n"
                         "[log]\nlevel = \"error\"\n");

  auto result = ConfigLoader::load_from_file(path);
  std::filesystem::remove(path);
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->codec.epoch_year, 2026);
  EXPECT_EQ(result->log.level, "error");
}

TEST_F(ConfigTest, EnvironmentOverridesFileValues) {
  test::ScopedEnv epoch{"SAFEID_EPOCH_YEAR", "2031"};
  test::ScopedEnv space{"SAFEID_DISAMBIGUATION_SPACE", "512"};
  test::ScopedEnv random{"SAFEID_RANDOM_SOURCE", "secure"};
  test::ScopedEnv wait{"SAFEID_WAIT_STRATEGY", "spin"};
  test::ScopedEnv suspend{"SAFEID_SUSPEND_INTERVAL_US", "50"};
  test::ScopedEnv level{"SAFEID_LOG_LEVEL", "trace"};

  auto result = ConfigLoader::load_from_string(
      "[codec]\nepoch_year = 2025\ndisambiguation_space = 4096\n");
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->codec.epoch_year, 2031);
  EXPECT_EQ(result->codec.disambiguation_space, 512);
  EXPECT_EQ(result->codec.random_source, RandomSourceKind::Secure);
  EXPECT_EQ(result->sequencer.wait_strategy, WaitStrategy::Spin);
  EXPECT_EQ(result->sequencer.suspend_interval, std::chrono::microseconds(50));
  EXPECT_EQ(result->log.level, "trace");
}

TEST_F(ConfigTest, MalformedEnvironmentOverrideIsParseError) {
  test::ScopedEnv space{"SAFEID_DISAMBIGUATION_SPACE", "lots"};

  auto from_string = ConfigLoader::load_from_string("");
  ASSERT_FALSE(from_string.has_value());
  EXPECT_EQ(from_string.error(), make_error_code(Error::ParseError));

  auto from_env = ConfigLoader::load_from_env();
  ASSERT_FALSE(from_env.has_value());
  EXPECT_EQ(from_env.error(), make_error_code(Error::ParseError));
}

TEST_F(ConfigTest, LoadFromEnvWithoutOverridesIsDefaults) {
  auto result = ConfigLoader::load_from_env();
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(*result, SystemConfig{});
}

TEST_F(ConfigTest, LoadFromEnvAppliesOverrides) {
  test::ScopedEnv epoch{"SAFEID_EPOCH_YEAR", "2040"};
  auto result = ConfigLoader::load_from_env();
  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(result->codec.epoch_year, 2040);
}

TEST(ErrorTest, CategoryMessages) {
  EXPECT_STREQ(error_category().name(), "safeid");
  EXPECT_EQ(make_error_code(Error::FileNotFound).message(), "file not found");
  EXPECT_EQ(make_error_code(Error::OutOfRange).message(),
            "value out of range");
  std::error_code ec = Error::ParseError;
  EXPECT_EQ(ec, make_error_code(Error::ParseError));
}
