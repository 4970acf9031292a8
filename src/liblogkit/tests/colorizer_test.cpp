#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <sstream>
#include <string>

#include "logkit/colorizer.hpp"

using ::testing::Return;

// Мок-класс для проверки терминала
class MockTerminalProbe : public logkit::ITerminalProbe {
 public:
  MOCK_METHOD(bool, supportsColor, (), (const, override));
};

class ColorizerTest : public ::testing::Test {
 protected:
  void SetUp() override { probe_ = std::make_shared<MockTerminalProbe>(); }

  std::shared_ptr<MockTerminalProbe> probe_;
};

// Явный forceColor не опрашивает терминал
TEST_F(ColorizerTest, ForceColorTrueSkipsDetection) {
  EXPECT_CALL(*probe_, supportsColor()).Times(0);
  logkit::Colorizer colorizer(probe_, true);
  EXPECT_TRUE(colorizer.enabled());
}

TEST_F(ColorizerTest, ForceColorFalseWinsOverTerminal) {
  EXPECT_CALL(*probe_, supportsColor()).Times(0);
  logkit::Colorizer colorizer(probe_, false);
  EXPECT_FALSE(colorizer.enabled());
  EXPECT_EQ(colorizer.colorize(logkit::LogLevel::LOG_ERROR, "line"), "line");
}

TEST_F(ColorizerTest, DetectsTerminalOnce) {
  EXPECT_CALL(*probe_, supportsColor()).Times(1).WillOnce(Return(true));
  logkit::Colorizer colorizer(probe_);
  EXPECT_TRUE(colorizer.enabled());
  colorizer.colorize(logkit::LogLevel::LOG_INFO, "a");
  colorizer.colorize(logkit::LogLevel::LOG_INFO, "b");
}

TEST_F(ColorizerTest, NonTerminalGetsPlainText) {
  EXPECT_CALL(*probe_, supportsColor()).WillOnce(Return(false));
  logkit::Colorizer colorizer(probe_);
  EXPECT_FALSE(colorizer.enabled());
  EXPECT_EQ(colorizer.colorize(logkit::LogLevel::LOG_WARNING, "warn"), "warn");
}

TEST_F(ColorizerTest, WrapsLineInLevelColor) {
  logkit::Colorizer colorizer(probe_, true);
  const std::string colored =
      colorizer.colorize(logkit::LogLevel::LOG_INFO, "hello");
  EXPECT_EQ(colored, std::string(LOGKIT_ANSI_GREEN) + "hello" + LOGKIT_ANSI_RESET);
}

TEST(ColorizerPaletteTest, EveryLevelHasDistinctColor) {
  std::set<std::string> codes = {
      logkit::Colorizer::colorCode(logkit::LogLevel::LOG_DEBUG),
      logkit::Colorizer::colorCode(logkit::LogLevel::LOG_INFO),
      logkit::Colorizer::colorCode(logkit::LogLevel::LOG_WARNING),
      logkit::Colorizer::colorCode(logkit::LogLevel::LOG_ERROR),
      logkit::Colorizer::colorCode(logkit::LogLevel::LOG_CRITICAL)};
  EXPECT_EQ(codes.size(), 5u);
  EXPECT_EQ(codes.count(logkit::Colorizer::resetCode()), 0u);
}

TEST(ColorizerPaletteTest, NullProbeMeansNoColor) {
  logkit::Colorizer colorizer(nullptr);
  EXPECT_FALSE(colorizer.enabled());
}

TEST(TerminalProbeTest, StringStreamIsNotTerminal) {
  std::ostringstream out;
  auto probe = logkit::makeTerminalProbe(out);
  ASSERT_NE(probe, nullptr);
  EXPECT_FALSE(probe->supportsColor());
}

TEST(TerminalProbeTest, StaticProbe) {
  EXPECT_TRUE(logkit::StaticTerminalProbe(true).supportsColor());
  EXPECT_FALSE(logkit::StaticTerminalProbe(false).supportsColor());
  EXPECT_FALSE(logkit::IsattyTerminalProbe(nullptr).supportsColor());
}
