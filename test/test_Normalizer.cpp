#include "histop/Normalizer.hpp"
#include "histop/Tokenizer.hpp"

#include <gtest/gtest.h>

using namespace histop;

namespace {

std::optional<std::string> normalizeEntry(std::string_view entry, NormalizeOptions const& options = {}) {
  auto segments = tokenize(entry);
  if (segments.empty()) {
    return std::nullopt;
  }
  return normalize(segments.front(), options);
}

using NormalizeCase = std::pair<std::string, std::optional<std::string>>;
class Normalize : public ::testing::TestWithParam<NormalizeCase> {};

TEST_P(Normalize, Test) {
  auto const& [input, expected] = GetParam();
  EXPECT_EQ(normalizeEntry(input), expected) << input;
}

INSTANTIATE_TEST_SUITE_P(
    Normalizer,
    Normalize,
    ::testing::Values(
        // clang-format off
        NormalizeCase{"ls -la", "ls"},
        NormalizeCase{"sudo doas EXTRA=1 ls -la", "ls"},
        NormalizeCase{"FOO=1 sudo BAR=2 doas vim /etc/hosts", "vim"},
        NormalizeCase{"sudo -- rm -rf build", "rm"},
        NormalizeCase{"FOO=bar", std::nullopt},
        NormalizeCase{"A=1 B=2", std::nullopt},
        NormalizeCase{"sudo", std::nullopt},
        NormalizeCase{"'' ls", std::nullopt},
        NormalizeCase{"\"FOO=bar\" ls", "FOO=bar"},
        NormalizeCase{"1X=2 ls", "1X=2"},
        NormalizeCase{"=x ls", "=x"},
        NormalizeCase{", foo", ","},
        NormalizeCase{"./configure --prefix=/usr", "./configure"},
        NormalizeCase{"'my tool' arg", "my tool"} // clang-format on
    )
);

} // namespace

TEST(Normalizer, IsAssignment) {
  EXPECT_TRUE(isAssignment(Token{"FOO=bar", false, false}));
  EXPECT_TRUE(isAssignment(Token{"FOO=", false, false}));
  EXPECT_TRUE(isAssignment(Token{"X=a b", true, false}));
  EXPECT_FALSE(isAssignment(Token{"FOO=bar", true, true}));
  EXPECT_FALSE(isAssignment(Token{"--opt=1", false, false}));
  EXPECT_FALSE(isAssignment(Token{"ls", false, false}));
}

TEST(Normalizer, FixedPoint) {
  for (std::string entry : {"sudo doas EXTRA=1 ls -la", "FOO=1 git status", "make"}) {
    auto once = normalizeEntry(entry);
    ASSERT_TRUE(once.has_value());
    EXPECT_EQ(normalizeEntry(*once), once);
  }
}

TEST(Normalizer, RawModeKeepsWrappers) {
  NormalizeOptions options;
  options.strip_wrappers_ = false;
  EXPECT_EQ(normalizeEntry("sudo ls", options), "sudo");
  EXPECT_EQ(normalizeEntry("FOO=1 sudo ls", options), "sudo");
}

TEST(Normalizer, CustomWrappers) {
  NormalizeOptions options;
  options.wrappers_ = {"nice", "time"};
  EXPECT_EQ(normalizeEntry("time nice make -j8", options), "make");
  EXPECT_EQ(normalizeEntry("sudo make", options), "sudo");
}

TEST(Normalizer, Subcommands) {
  NormalizeOptions options;
  options.track_subcommands_ = true;
  EXPECT_EQ(normalizeEntry("git status", options), "git status");
  EXPECT_EQ(normalizeEntry("sudo docker compose up", options), "docker compose");
  EXPECT_EQ(normalizeEntry("git --version", options), "git");
  EXPECT_EQ(normalizeEntry("git", options), "git");
  EXPECT_EQ(normalizeEntry("ls -la", options), "ls");

  // off by default
  EXPECT_EQ(normalizeEntry("git status"), "git");
}

TEST(Normalizer, SubcommandsAreAFixedPoint) {
  NormalizeOptions options;
  options.track_subcommands_ = true;
  auto once                  = normalizeEntry("git status -s", options);
  ASSERT_TRUE(once.has_value());
  EXPECT_EQ(normalizeEntry(*once, options), once);
}
