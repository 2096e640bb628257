#include "histop/Analyzer.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace histop;

namespace {

Result<Report> analyzeText(std::string const& text, AnalyzeOptions const& options = {}) {
  std::istringstream in{text};
  return analyze(in, options);
}

std::vector<std::pair<std::string, size_t>> countsOf(Report const& report) {
  std::vector<std::pair<std::string, size_t>> out;
  for (auto const& entry : report.entries_) {
    out.emplace_back(entry.command_, entry.count_);
  }
  return out;
}

using Counts = std::vector<std::pair<std::string, size_t>>;

class TempHistory : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() /
           ("histop_analyzer_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  std::string write(std::string const& name, std::string const& content) {
    auto          path = dir_ / name;
    std::ofstream out{path, std::ios::binary};
    out << content;
    return path.string();
  }

  std::filesystem::path dir_;
};

} // namespace

TEST(Analyzer, PipelineScenario) {
  AnalyzeOptions options;
  options.rank_.limit_ = 10;

  auto report = analyzeText("ls -la\na | grep bar\nsudo ls\n", options);
  ASSERT_TRUE(report.has_value()) << report.error().message();
  EXPECT_EQ(countsOf(*report), (Counts{{"ls", 2}, {"a", 1}, {"grep", 1}}));
  EXPECT_NEAR(report->entries_[0].percentage_, 66.6667, 1e-3);
  EXPECT_EQ(report->total_, 4);
  EXPECT_EQ(report->format_, HistoryFormat::PlainLines);
}

TEST(Analyzer, MoreThanThreshold) {
  AnalyzeOptions options;
  options.rank_.limit_ = 10;
  options.more_than_   = 1;

  auto report = analyzeText("ls -la\na | grep bar\nsudo ls\n", options);
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(countsOf(*report), (Counts{{"ls", 2}}));
  EXPECT_NEAR(report->entries_[0].percentage_, 100.0, 1e-9);
}

TEST(Analyzer, SumOfCountsEqualsNormalizedSegments) {
  auto report = analyzeText("FOO=bar\nls | wc -l\necho \"a | b\"\n|\nsudo\ngit status | less\n");
  ASSERT_TRUE(report.has_value());

  size_t sum = 0;
  for (auto const& entry : report->entries_) {
    sum += entry.count_;
  }
  EXPECT_EQ(sum, report->segments_);
  EXPECT_EQ(sum, 5);
  EXPECT_EQ(report->empty_segments_, 2);
}

TEST(Analyzer, IgnoreList) {
  AnalyzeOptions options;
  options.ignore_ = {"ls", "cd"};

  auto report = analyzeText("ls\ncd\nls\ngit\n", options);
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(countsOf(*report), (Counts{{"git", 1}}));
  EXPECT_EQ(report->total_, 1);
}

TEST(Analyzer, DetectsZsh) {
  auto report = analyzeText(": 1680820391:0;git status\n: 1680820392:0;sudo git push\n: 1680820393:0;ls\n");
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->format_, HistoryFormat::ZshExtended);
  EXPECT_EQ(countsOf(*report), (Counts{{"git", 2}, {"ls", 1}}));
}

TEST(Analyzer, OverrideWins) {
  AnalyzeOptions options;
  options.detect_.override_ = HistoryFormat::PlainLines;

  auto report = analyzeText(": 1680820391:0;git status\n", options);
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->format_, HistoryFormat::PlainLines);
  // the metadata prefix is just text now
  EXPECT_EQ(countsOf(*report), (Counts{{":", 1}}));
}

TEST(Analyzer, FishHistory) {
  auto report = analyzeText(
      "- cmd: git status\n"
      "  when: 1680820391\n"
      "- cmd: sudo systemctl restart nginx\n"
      "  when: 1680820392\n"
      "- cmd: git log | head\n"
      "  when: 1680820393\n"
  );
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->format_, HistoryFormat::FishRecord);
  EXPECT_EQ(countsOf(*report), (Counts{{"git", 2}, {"head", 1}, {"systemctl", 1}}));
}

TEST(Analyzer, FishEscapedLineContinuation) {
  auto report = analyzeText(
      "- cmd: sudo \\\\\\nsystemctl restart sshd\n"
      "  when: 1680820391\n"
      "- cmd: ls\n"
      "  when: 1680820392\n"
  );
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->format_, HistoryFormat::FishRecord);
  EXPECT_EQ(countsOf(*report), (Counts{{"ls", 1}, {"systemctl", 1}}));
}

TEST(Analyzer, UndecodableLineIsSkipped) {
  auto report = analyzeText("ls\ngit status\necho caf\xe9\nls\n");
  ASSERT_TRUE(report.has_value()) << report.error().message();
  EXPECT_EQ(countsOf(*report), (Counts{{"ls", 2}, {"git", 1}}));
  EXPECT_EQ(report->stats_.undecodable_lines_, 1);
}

TEST(Analyzer, SubcommandsAndRawMode) {
  AnalyzeOptions options;
  options.normalize_.track_subcommands_ = true;

  auto report = analyzeText("git status\ngit push\ngit status\nsudo ls | wc\n", options);
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(countsOf(*report), (Counts{{"git status", 2}, {"git push", 1}, {"ls", 1}, {"wc", 1}}));

  AnalyzeOptions raw;
  raw.tokenize_.split_pipes_     = false;
  raw.normalize_.strip_wrappers_ = false;
  report                         = analyzeText("sudo ls | wc\nls\n", raw);
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(countsOf(*report), (Counts{{"ls", 1}, {"sudo", 1}}));
}

TEST(Analyzer, EmptyInputGivesEmptyReport) {
  auto report = analyzeText("");
  ASSERT_TRUE(report.has_value());
  EXPECT_TRUE(report->entries_.empty());
  EXPECT_EQ(report->total_, 0);
}

TEST(Analyzer, ErrorsPropagate) {
  auto binary = analyzeText(std::string{"ls\0rm\n", 6});
  ASSERT_FALSE(binary.has_value());
  EXPECT_EQ(binary.error().kind(), ErrorKind::UnknownFormat);

  auto text = analyzeText("\xfe\xff\n\xe9t\xe9\n");
  ASSERT_FALSE(text.has_value());
  EXPECT_EQ(text.error().kind(), ErrorKind::UnreadableInput);
}

TEST(Analyzer, Deterministic) {
  std::string history = "b\na\nc\nb\na\n";
  auto        first   = analyzeText(history);
  auto        second  = analyzeText(history);
  ASSERT_TRUE(first.has_value() && second.has_value());
  EXPECT_EQ(first->entries_, second->entries_);
  EXPECT_EQ(countsOf(*first), (Counts{{"a", 2}, {"b", 2}, {"c", 1}}));
}

TEST_F(TempHistory, AnalyzeFile) {
  auto path   = write("bash_history", "ls\nls\ncd\n");
  auto report = analyzeFile(path, {});
  ASSERT_TRUE(report.has_value()) << report.error().message();
  EXPECT_EQ(countsOf(*report), (Counts{{"ls", 2}, {"cd", 1}}));
}

TEST_F(TempHistory, PathHintSelectsPowerShell) {
  std::filesystem::create_directories(dir_ / "PSReadLine");
  auto path   = write("PSReadLine/ConsoleHost_history.txt", "Get-ChildItem\ncd ..\n");
  auto report = analyzeFile(path, {});
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->format_, HistoryFormat::PowerShellPlain);
}

TEST_F(TempHistory, MissingFileIsIoError) {
  auto report = analyzeFile((dir_ / "nope").string(), {});
  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error().kind(), ErrorKind::Io);
}
