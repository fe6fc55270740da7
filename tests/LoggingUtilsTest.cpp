#include "GnomeMcp/Utils/Logging.hpp"
#include "GnomeMcp/Utils/Types.hpp"

#include "gtest/gtest.h"

using gnome_mcp::utils::logging::LogLevelConst, gnome_mcp::utils::logging::Bold, gnome_mcp::utils::logging::Colorize, gnome_mcp::utils::logging::Italic;
using gnome_mcp::utils::logging::LogLevel, gnome_mcp::utils::logging::GetLevelString, gnome_mcp::utils::logging::FormatLogLine;
using gnome_mcp::utils::logging::GetRuntimeLogLevel, gnome_mcp::utils::logging::SetRuntimeLogLevel;
using gnome_mcp::utils::types::String, gnome_mcp::utils::types::StringView;

class LoggingUtilsTest : public testing::Test {};

TEST_F(LoggingUtilsTest, Colorize_RedText) {
  const StringView              textToColorize = "Hello, Red World!";
  const ftxui::Color::Palette16 color          = ftxui::Color::Palette16::Red;
  const String                  expectedPrefix = String(LogLevelConst::COLOR_CODE_LITERALS.at(color));
  const String                  expectedSuffix = String(LogLevelConst::RESET_CODE);

  String colorizedText = Colorize(textToColorize, color);

  EXPECT_TRUE(colorizedText.rfind(expectedPrefix, 0) == 0);
  EXPECT_NE(colorizedText.find(textToColorize.data(), 0, textToColorize.length()), String::npos);
  EXPECT_TRUE(colorizedText.length() >= textToColorize.length() + expectedPrefix.length() + expectedSuffix.length());
  EXPECT_EQ(colorizedText.substr(colorizedText.length() - expectedSuffix.length()), expectedSuffix);
}

TEST_F(LoggingUtilsTest, Colorize_EmptyText) {
  const StringView              textToColorize;
  const ftxui::Color::Palette16 color          = ftxui::Color::Palette16::Green;
  const String                  expectedPrefix = String(LogLevelConst::COLOR_CODE_LITERALS.at(color));
  const String                  expectedSuffix = String(LogLevelConst::RESET_CODE);

  String colorizedText = Colorize(textToColorize, color);
  String expectedText  = expectedPrefix + String(textToColorize) + expectedSuffix;
  EXPECT_EQ(colorizedText, expectedText);
}

TEST_F(LoggingUtilsTest, Bold_SimpleText) {
  const StringView textToBold     = "This is bold.";
  const String     expectedPrefix = String(LogLevelConst::BOLD_START);
  const String     expectedSuffix = String(LogLevelConst::BOLD_END);

  String boldedText   = Bold(textToBold);
  String expectedText = expectedPrefix + String(textToBold) + expectedSuffix;

  EXPECT_EQ(boldedText, expectedText);
}

TEST_F(LoggingUtilsTest, Bold_EmptyText) {
  const StringView textToBold;
  const String     expectedPrefix = String(LogLevelConst::BOLD_START);
  const String     expectedSuffix = String(LogLevelConst::BOLD_END);

  String boldedText   = Bold(textToBold);
  String expectedText = expectedPrefix + String(textToBold) + expectedSuffix;
  EXPECT_EQ(boldedText, expectedText);
}

TEST_F(LoggingUtilsTest, Italic_SimpleText) {
  const StringView textToItalicize = "This is italic.";
  const String     expectedPrefix  = String(LogLevelConst::ITALIC_START);
  const String     expectedSuffix  = String(LogLevelConst::ITALIC_END);

  String italicizedText = Italic(textToItalicize);
  String expectedText   = expectedPrefix + String(textToItalicize) + expectedSuffix;

  EXPECT_EQ(italicizedText, expectedText);
}

TEST_F(LoggingUtilsTest, Italic_EmptyText) {
  const StringView textToItalicize;
  const String     expectedPrefix = String(LogLevelConst::ITALIC_START);
  const String     expectedSuffix = String(LogLevelConst::ITALIC_END);

  String italicizedText = Italic(textToItalicize);
  String expectedText   = expectedPrefix + String(textToItalicize) + expectedSuffix;
  EXPECT_EQ(italicizedText, expectedText);
}

TEST_F(LoggingUtilsTest, Combined_BoldItalicRedText) {
  const StringView              textToStyle = "Styled Text";
  const ftxui::Color::Palette16 color       = ftxui::Color::Palette16::Magenta;

  const String colorPrefix  = String(LogLevelConst::COLOR_CODE_LITERALS.at(color));
  const String colorSuffix  = String(LogLevelConst::RESET_CODE);
  const String boldPrefix   = String(LogLevelConst::BOLD_START);
  const String boldSuffix   = String(LogLevelConst::BOLD_END);
  const String italicPrefix = String(LogLevelConst::ITALIC_START);
  const String italicSuffix = String(LogLevelConst::ITALIC_END);

  String styledText = Colorize(Bold(Italic(textToStyle)), color);

  String expectedInnerText = italicPrefix + String(textToStyle) + italicSuffix;
  expectedInnerText        = boldPrefix + expectedInnerText + boldSuffix;
  String expectedFinalText = colorPrefix + expectedInnerText + colorSuffix;

  EXPECT_EQ(styledText, expectedFinalText);
}

TEST_F(LoggingUtilsTest, LevelStrings) {
  EXPECT_EQ(GetLevelString(LogLevel::Debug), LogLevelConst::DEBUG_STR);
  EXPECT_EQ(GetLevelString(LogLevel::Info), LogLevelConst::INFO_STR);
  EXPECT_EQ(GetLevelString(LogLevel::Warn), LogLevelConst::WARN_STR);
  EXPECT_EQ(GetLevelString(LogLevel::Error), LogLevelConst::ERROR_STR);
}

TEST_F(LoggingUtilsTest, RuntimeLevelCanBeRaised) {
  const LogLevel previous = GetRuntimeLogLevel();

  SetRuntimeLogLevel(LogLevel::Error);
  EXPECT_EQ(GetRuntimeLogLevel(), LogLevel::Error);

  SetRuntimeLogLevel(previous);
}

TEST_F(LoggingUtilsTest, PlainLineHasNoEscapes) {
  const String line = FormatLogLine(LogLevel::Warn, "12:00:00", "Provider for calendar timed out", false);

  EXPECT_EQ(line, "[12:00:00] WARN  Provider for calendar timed out");
  EXPECT_EQ(line.find('\033'), String::npos);
}

TEST_F(LoggingUtilsTest, StyledLineColorsLevel) {
  const String line = FormatLogLine(LogLevel::Error, "12:00:00", "boom", true);

  EXPECT_NE(line.find(Colorize(LogLevelConst::ERROR_STR, LogLevelConst::ERROR_COLOR)), String::npos);
  EXPECT_TRUE(line.ends_with(" boom"));
}
