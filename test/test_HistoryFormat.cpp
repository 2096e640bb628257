#include "histop/HistoryFormat.hpp"

#include <fmt/format.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace histop;

namespace {

Result<HistoryFormat> detect(std::vector<std::string> const& sample, DetectOptions const& options = {}) {
  return detectFormat(sample, options);
}

struct DetectCase {
  std::vector<std::string> sample_;
  HistoryFormat            expected_;
};

class Detect : public ::testing::TestWithParam<DetectCase> {};

TEST_P(Detect, Test) {
  auto const& [sample, expected] = GetParam();
  auto format                    = detect(sample);
  ASSERT_TRUE(format.has_value()) << format.error().message();
  EXPECT_EQ(*format, expected);
}

INSTANTIATE_TEST_SUITE_P(
    HistoryFormat,
    Detect,
    ::testing::Values(
        // clang-format off
        DetectCase{{": 1680820391:0;ls -la", "cd /tmp"}, HistoryFormat::ZshExtended},
        DetectCase{{"ls", ": 1680820391:12;git status"}, HistoryFormat::ZshExtended},
        DetectCase{{"- cmd: ls", "  when: 1680820391"}, HistoryFormat::FishRecord},
        DetectCase{{"", "-", "  cmd: ls"}, HistoryFormat::FishRecord},
        DetectCase{{"#+1680820391", "ls"}, HistoryFormat::TcshPlain},
        DetectCase{{"#1680820391", "ls"}, HistoryFormat::PlainLines},
        DetectCase{{"ls -la", "git status"}, HistoryFormat::PlainLines},
        DetectCase{{}, HistoryFormat::PlainLines},
        DetectCase{{"- not fish", "ls"}, HistoryFormat::PlainLines} // clang-format on
    )
);

} // namespace

TEST(HistoryFormat, OverrideWins) {
  DetectOptions options;
  options.override_ = HistoryFormat::PlainLines;
  auto format       = detect({": 1680820391:0;ls -la"}, options);
  ASSERT_TRUE(format.has_value());
  EXPECT_EQ(*format, HistoryFormat::PlainLines);
}

TEST(HistoryFormat, PowerShellPathHint) {
  DetectOptions options;
  options.path_hint_ = "/home/u/.local/share/powershell/PSReadLine/ConsoleHost_history.txt";
  auto format        = detect({"Get-ChildItem", "cd .."}, options);
  ASSERT_TRUE(format.has_value());
  EXPECT_EQ(*format, HistoryFormat::PowerShellPlain);
}

TEST(HistoryFormat, BinaryIsUnknown) {
  auto format = detect({std::string{"ls\0\x01", 4}});
  ASSERT_FALSE(format.has_value());
  EXPECT_EQ(format.error().kind(), ErrorKind::UnknownFormat);
}

TEST(HistoryFormat, ParseFormatName) {
  EXPECT_EQ(parseFormatName("zsh"), HistoryFormat::ZshExtended);
  EXPECT_EQ(parseFormatName("bash"), HistoryFormat::PlainLines);
  EXPECT_EQ(parseFormatName("ash"), HistoryFormat::PlainLines);
  EXPECT_EQ(parseFormatName("pwsh"), HistoryFormat::PowerShellPlain);
  EXPECT_EQ(parseFormatName("fish"), HistoryFormat::FishRecord);

  auto bad = parseFormatName("nushell");
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error().kind(), ErrorKind::UnknownFormat);
}

TEST(HistoryFormat, NameRoundTrip) {
  for (auto format : {HistoryFormat::PlainLines,
                      HistoryFormat::ZshExtended,
                      HistoryFormat::FishRecord,
                      HistoryFormat::TcshPlain,
                      HistoryFormat::PowerShellPlain}) {
    EXPECT_EQ(parseFormatName(formatName(format)), format);
  }
  EXPECT_EQ(fmt::format("{}", HistoryFormat::ZshExtended), "zsh");
}

TEST(HistoryFormat, ZshMetadata) {
  auto meta = parseZshMetadata(": 1680820391:7;git commit -m 'a;b'");
  ASSERT_TRUE(meta.has_value());
  EXPECT_EQ(meta->timestamp_, 1680820391);
  EXPECT_EQ(meta->duration_, 7);
  EXPECT_EQ(meta->command_, "git commit -m 'a;b'");

  EXPECT_FALSE(parseZshMetadata("ls").has_value());
  EXPECT_FALSE(parseZshMetadata(": abc:0;ls").has_value());
  EXPECT_FALSE(parseZshMetadata(": 123;ls").has_value());
}

TEST(HistoryFormat, TimestampComment) {
  EXPECT_EQ(parseTimestampComment("#1680820391", HistoryFormat::PlainLines), 1680820391);
  EXPECT_EQ(parseTimestampComment("#+1680820391", HistoryFormat::TcshPlain), 1680820391);
  EXPECT_FALSE(parseTimestampComment("#1680820391", HistoryFormat::TcshPlain).has_value());
  EXPECT_FALSE(parseTimestampComment("# a comment", HistoryFormat::PlainLines).has_value());
  EXPECT_FALSE(parseTimestampComment("#123", HistoryFormat::ZshExtended).has_value());
}
