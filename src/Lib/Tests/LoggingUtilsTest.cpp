#include <Spank++/Core/HostLog.hpp>
#include <Spank++/Utils/Error.hpp>
#include <Spank++/Utils/Logging.hpp>
#include <Spank++/Utils/Types.hpp>

#include "FakeHost.hpp"
#include "gtest/gtest.h"

using namespace testing;
using spankpp::core::InstallHostLogSink;
using spankpp::core::SpankLog;
using spankpp::fake::FakeHost;
using spankpp::utils::error::SpankError;
using spankpp::utils::logging::GetLevelInfo;
using spankpp::utils::logging::LogColor;
using spankpp::utils::logging::LogLevel;
using spankpp::utils::logging::LogLevelConst;
using spankpp::utils::logging::ParseLogLevel;
using spankpp::utils::logging::SetLogSink;
using spankpp::utils::logging::SetRuntimeLogLevel;
using spankpp::utils::logging::Style;
using spankpp::utils::logging::Stylize;
using spankpp::utils::types::i32;
using spankpp::utils::types::Pair;
using spankpp::utils::types::String;
using spankpp::utils::types::StringView;
using spankpp::utils::types::usize;
using spankpp::utils::types::Vec;

namespace {
  Vec<Pair<LogLevel, String>> Captured;

  fn CaptureSink(const LogLevel level, const StringView message) -> void {
    Captured.emplace_back(level, String(message));
  }
} // namespace

class LoggingUtilsTest : public Test {
 protected:
  void SetUp() override {
    FakeHost::instance().reset();
    Captured.clear();
  }

  void TearDown() override {
    SetLogSink(nullptr);
    SetRuntimeLogLevel(LogLevel::Info);
  }
};

TEST_F(LoggingUtilsTest, Stylize_RedText) {
  constexpr StringView textToColorize = "Hello, Red World!";
  constexpr LogColor   color          = LogColor::Red;
  const String         expectedPrefix = String(LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<usize>(color)));
  const String         expectedSuffix = String(LogLevelConst::RESET_CODE);

  const String colorizedText = Stylize(textToColorize, { .color = color });

  EXPECT_EQ(colorizedText, expectedPrefix + String(textToColorize) + expectedSuffix);
}

TEST_F(LoggingUtilsTest, Stylize_DefaultStyleLeavesTextAlone) {
  EXPECT_EQ(Stylize("plain", {}), "plain");
}

TEST_F(LoggingUtilsTest, Combined_BoldItalicText) {
  constexpr StringView textToStyle = "Styled Text";
  constexpr LogColor   color       = LogColor::Magenta;

  const String styledText = Stylize(textToStyle, { .color = color, .bold = true, .italic = true });

  // Bold, Italic, Color, Text, Reset
  const String expectedFinalText = String(LogLevelConst::BOLD_START) + LogLevelConst::ITALIC_START +
    String(LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<usize>(color))) + String(textToStyle) + LogLevelConst::RESET_CODE;

  EXPECT_EQ(styledText, expectedFinalText);
}

TEST_F(LoggingUtilsTest, LevelLabelsFollowSeverityOrder) {
  EXPECT_NE(GetLevelInfo().at(static_cast<usize>(LogLevel::Debug3)).find("DEBUG3"), StringView::npos);
  EXPECT_NE(GetLevelInfo().at(static_cast<usize>(LogLevel::Verbose)).find("VERB"), StringView::npos);
  EXPECT_NE(GetLevelInfo().at(static_cast<usize>(LogLevel::Error)).find("ERROR"), StringView::npos);
}

TEST_F(LoggingUtilsTest, ParseLogLevelIgnoresCase) {
  EXPECT_EQ(ParseLogLevel("debug2"), LogLevel::Debug2);
  EXPECT_EQ(ParseLogLevel("VERBOSE"), LogLevel::Verbose);
  EXPECT_EQ(ParseLogLevel("Error"), LogLevel::Error);
  EXPECT_FALSE(ParseLogLevel("loud").has_value());
  EXPECT_FALSE(ParseLogLevel("").has_value());
}

TEST_F(LoggingUtilsTest, SinkReceivesFormattedRecords) {
  SetLogSink(&CaptureSink);

  info_log("job {} has {} tasks", 17, 4);

  ASSERT_EQ(Captured.size(), 1U);
  EXPECT_EQ(Captured.front().first, LogLevel::Info);
  EXPECT_EQ(Captured.front().second, "job 17 has 4 tasks");
}

TEST_F(LoggingUtilsTest, ErrorAtSendsCauseChainToSink) {
  SetLogSink(&CaptureSink);
  SetRuntimeLogLevel(LogLevel::Error);

  error_at(SpankError("slot 7 was never handed out").wrap("Option callback"));

  ASSERT_EQ(Captured.size(), 1U);
  EXPECT_EQ(Captured.front().first, LogLevel::Error);
  EXPECT_EQ(Captured.front().second, "Option callback: slot 7 was never handed out");
}

TEST_F(LoggingUtilsTest, RecordsBelowRuntimeLevelAreDropped) {
  SetLogSink(&CaptureSink);
  SetRuntimeLogLevel(LogLevel::Verbose);

  debug3_log("dropped");
  debug_log("dropped");
  verbose_log("kept");
  error_log("kept too");

  ASSERT_EQ(Captured.size(), 2U);
  EXPECT_EQ(Captured[0].first, LogLevel::Verbose);
  EXPECT_EQ(Captured[1].first, LogLevel::Error);
}

TEST_F(LoggingUtilsTest, HostSinkMapsEachLevelToItsChannel) {
  InstallHostLogSink();
  SetRuntimeLogLevel(LogLevel::Debug3);

  debug3_log("a");
  debug2_log("b");
  debug_log("c");
  verbose_log("d");
  info_log("e");
  error_log("f");

  const FakeHost& host = FakeHost::instance();

  EXPECT_EQ(host.countLogs("debug3", "a"), 1U);
  EXPECT_EQ(host.countLogs("debug2", "b"), 1U);
  EXPECT_EQ(host.countLogs("debug", "c"), 1U);
  EXPECT_EQ(host.countLogs("verbose", "d"), 1U);
  EXPECT_EQ(host.countLogs("info", "e"), 1U);
  EXPECT_EQ(host.countLogs("error", "f"), 1U);
}

TEST_F(LoggingUtilsTest, HostLogReplacesNulBytes) {
  SpankLog(LogLevel::Info, StringView("a\0b", 3));

  ASSERT_EQ(FakeHost::instance().logs.size(), 1U);
  EXPECT_EQ(FakeHost::instance().logs.front().message, "a0b");
}

TEST_F(LoggingUtilsTest, HostLogPassesPercentSignsThrough) {
  SpankLog(LogLevel::Error, "100% %s %d");

  EXPECT_EQ(FakeHost::instance().countLogs("error", "100% %s %d"), 1U);
}

TEST_F(LoggingUtilsTest, UserLogGoesToUserChannel) {
  user_log("Hello {}!", "world");

  EXPECT_EQ(FakeHost::instance().countLogs("user", "Hello world!"), 1U);
}

fn main(i32 argc, char** argv) -> i32 {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
