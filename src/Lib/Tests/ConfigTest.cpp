#include <cstdlib>    // setenv, unsetenv
#include <filesystem> // std::filesystem::temp_directory_path
#include <fstream>    // std::ofstream
#include <toml++/impl/parser.hpp> // toml::parse

#include <Spank++/Config/Config.hpp>
#include <Spank++/Utils/Logging.hpp>
#include <Spank++/Utils/Types.hpp>

#include "FakeHost.hpp"
#include "gtest/gtest.h"

using namespace testing;
using spankpp::config::Config;
using spankpp::config::LogTarget;
using spankpp::fake::FakeHost;
using spankpp::utils::logging::GetRuntimeLogLevel;
using spankpp::utils::logging::LogLevel;
using spankpp::utils::logging::SetLogSink;
using spankpp::utils::logging::SetRuntimeLogLevel;
using spankpp::utils::types::i32;
using spankpp::utils::types::String;
using spankpp::utils::types::StringView;
using spankpp::utils::types::Vec;

class ConfigTest : public Test {
 protected:
  void SetUp() override {
    FakeHost::instance().reset();
    unsetenv("SPANKPP_LOG_LEVEL");
  }

  void TearDown() override {
    unsetenv("SPANKPP_LOG_LEVEL");
    SetLogSink(nullptr);
    SetRuntimeLogLevel(LogLevel::Info);
  }
};

TEST_F(ConfigTest, DefaultsWithoutArguments) {
  const auto cfg = Config::load({});

  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->logging.level, LogLevel::Info);
  EXPECT_EQ(cfg->logging.target, LogTarget::Host);
}

TEST_F(ConfigTest, PluginArgumentSetsLevel) {
  const auto cfg = Config::load({ "min_prio=3", "spankpp.log_level=debug2" });

  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->logging.level, LogLevel::Debug2);
}

TEST_F(ConfigTest, UnknownPrefixedKeyIsIgnored) {
  const auto cfg = Config::load({ "spankpp.colour=blue" });

  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->logging.level, LogLevel::Info);
}

TEST_F(ConfigTest, PrefixedArgumentWithoutValueFails) {
  const auto cfg = Config::load({ "spankpp.log_level" });

  ASSERT_FALSE(cfg.has_value());
  EXPECT_NE(cfg.error().message().find("spankpp.log_level"), String::npos);
}

TEST_F(ConfigTest, UnknownLevelFails) {
  const auto cfg = Config::load({ "spankpp.log_level=loud" });

  ASSERT_FALSE(cfg.has_value());
  EXPECT_NE(cfg.error().message().find("Unknown log level 'loud'"), String::npos);
}

TEST_F(ConfigTest, EnvironmentOverridesArgument) {
  setenv("SPANKPP_LOG_LEVEL", "error", 1);

  const auto cfg = Config::load({ "spankpp.log_level=debug" });

  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->logging.level, LogLevel::Error);
}

TEST_F(ConfigTest, TomlTable) {
  const toml::table tbl = toml::parse(R"(
[logging]
level = "verbose"
target = "stderr"
)");

  const auto cfg = Config::fromToml(tbl);

  ASSERT_TRUE(cfg.has_value());
  EXPECT_EQ(cfg->logging.level, LogLevel::Verbose);
  EXPECT_EQ(cfg->logging.target, LogTarget::Stderr);
}

TEST_F(ConfigTest, TomlUnknownTargetFails) {
  const toml::table tbl = toml::parse(R"(
[logging]
target = "syslog"
)");

  const auto cfg = Config::fromToml(tbl);

  ASSERT_FALSE(cfg.has_value());
  EXPECT_NE(cfg.error().message().find("syslog"), String::npos);
}

TEST_F(ConfigTest, FileIsReadAndArgumentStillOverrides) {
  const std::filesystem::path path = std::filesystem::temp_directory_path() / "spankpp-config-test.toml";

  {
    std::ofstream out(path);
    out << "[logging]\nlevel = \"debug3\"\ntarget = \"stderr\"\n";
  }

  const String configArg = "spankpp.config=" + path.string();

  const auto fromFile = Config::load({ configArg });
  ASSERT_TRUE(fromFile.has_value());
  EXPECT_EQ(fromFile->logging.level, LogLevel::Debug3);
  EXPECT_EQ(fromFile->logging.target, LogTarget::Stderr);

  const auto overridden = Config::load({ configArg, "spankpp.log_level=info" });
  ASSERT_TRUE(overridden.has_value());
  EXPECT_EQ(overridden->logging.level, LogLevel::Info);
  EXPECT_EQ(overridden->logging.target, LogTarget::Stderr);

  std::filesystem::remove(path);
}

TEST_F(ConfigTest, MissingFileFails) {
  const auto cfg = Config::load({ "spankpp.config=/nonexistent/spankpp.toml" });

  ASSERT_FALSE(cfg.has_value());
  EXPECT_NE(cfg.error().message().find("Failed to load config from /nonexistent/spankpp.toml"), String::npos);
}

TEST_F(ConfigTest, ApplyRoutesToHost) {
  Config cfg;
  cfg.logging.level = LogLevel::Verbose;
  cfg.apply();

  EXPECT_EQ(GetRuntimeLogLevel(), LogLevel::Verbose);

  verbose_log("routed to host");
  EXPECT_EQ(FakeHost::instance().countLogs("verbose", "routed to host"), 1U);
}

fn main(i32 argc, char** argv) -> i32 {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
