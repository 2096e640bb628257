#include "histop/Util.hpp"

#include <gtest/gtest.h>

namespace {

using TrimCase = std::pair<std::string, std::string>;
class Trim : public ::testing::TestWithParam<TrimCase> {};

TEST_P(Trim, Test) {
  auto const& [input, expected] = GetParam();
  EXPECT_EQ(histop::trim(input), expected);
}

INSTANTIATE_TEST_SUITE_P(
    Util,
    Trim,
    ::testing::Values(
        // clang-format off
        TrimCase{"  hello  ", "hello"},
        TrimCase{"hello\t\r", "hello"},
        TrimCase{"  hello", "hello"},
        TrimCase{"hello", "hello"},
        TrimCase{"", ""},
        TrimCase{"   ", ""} // clang-format on
    )
);

using IdentifierCase = std::pair<std::string, bool>;
class Identifier : public ::testing::TestWithParam<IdentifierCase> {};

TEST_P(Identifier, Test) {
  auto const& [input, expected] = GetParam();
  EXPECT_EQ(histop::isValidIdentifier(input), expected) << input;
}

INSTANTIATE_TEST_SUITE_P(
    Util,
    Identifier,
    ::testing::Values(
        // clang-format off
        IdentifierCase{"FOO", true},
        IdentifierCase{"_x1", true},
        IdentifierCase{"lower_case", true},
        IdentifierCase{"1ABC", false},
        IdentifierCase{"A-B", false},
        IdentifierCase{"", false},
        IdentifierCase{"A.B", false} // clang-format on
    )
);

using Utf8Case = std::pair<std::string, bool>;
class Utf8 : public ::testing::TestWithParam<Utf8Case> {};

TEST_P(Utf8, Test) {
  auto const& [input, expected] = GetParam();
  EXPECT_EQ(histop::isValidUtf8(input), expected);
}

INSTANTIATE_TEST_SUITE_P(
    Util,
    Utf8,
    ::testing::Values(
        // clang-format off
        Utf8Case{"plain ascii", true},
        Utf8Case{"caf\xc3\xa9", true},
        Utf8Case{"\xe2\x82\xac", true},
        Utf8Case{"\xf0\x9f\x98\x80", true},
        Utf8Case{"\xc3", false},         // truncated
        Utf8Case{"\xc0\xaf", false},     // overlong
        Utf8Case{"\xed\xa0\x80", false}, // surrogate
        Utf8Case{"\xf4\x90\x80\x80", false},
        Utf8Case{"\xff", false} // clang-format on
    )
);

} // namespace

TEST(Util, Unmetafy) {
  // Meta (0x83) then the byte xor 0x20
  EXPECT_EQ(histop::unmetafy("echo \xc4\x83\xa3"), "echo \xc4\x83");
  EXPECT_EQ(histop::unmetafy("no meta"), "no meta");
  // dangling Meta stays
  EXPECT_EQ(histop::unmetafy("x\x83"), "x\x83");
}

TEST(Util, SplitList) {
  EXPECT_EQ(histop::splitList("ls | cd|  git ", '|'), (std::vector<std::string>{"ls", "cd", "git"}));
  EXPECT_EQ(histop::splitList("||", '|'), std::vector<std::string>{});
  EXPECT_EQ(histop::splitList("", '|'), std::vector<std::string>{});
}

TEST(Util, ParseInteger) {
  EXPECT_EQ(histop::parseInteger("42"), 42);
  EXPECT_EQ(histop::parseInteger("-7"), -7);
  EXPECT_FALSE(histop::parseInteger("42x").has_value());
  EXPECT_FALSE(histop::parseInteger("").has_value());
  EXPECT_FALSE(histop::parseInteger(" 1").has_value());
}

TEST(Util, IsBlank) {
  EXPECT_TRUE(histop::isBlank(""));
  EXPECT_TRUE(histop::isBlank(" \t "));
  EXPECT_FALSE(histop::isBlank(" x "));
  EXPECT_TRUE(histop::isAllDigits("0123"));
  EXPECT_FALSE(histop::isAllDigits(""));
  EXPECT_FALSE(histop::isAllDigits("12a"));
}
