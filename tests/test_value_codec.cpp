#include <gtest/gtest.h>

#include "hud/value_codec.hpp"
#include "mo_types.hpp"

using namespace mo;

TEST(ValueCodec, SplitListTrimsAndDropsEmpty) {
  EXPECT_EQ(split_list(" a, b+c ,,"), (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(split_list("a+b,c", ","), (std::vector<std::string>{"a+b", "c"}));
  EXPECT_TRUE(split_list("").empty());
  EXPECT_EQ(join_list({"60", "144"}, '+'), "60+144");
}

TEST(ValueCodec, Booleans) {
  EXPECT_TRUE(parse_bool("1"));
  EXPECT_TRUE(parse_bool(" True "));
  EXPECT_TRUE(parse_bool("on"));
  EXPECT_FALSE(parse_bool("0"));
  EXPECT_FALSE(parse_bool("no"));
  EXPECT_THROW(parse_bool("2"), ConfigError);
}

TEST(ValueCodec, IntegersAreWholeStringAndRanged) {
  EXPECT_EQ(parse_int("42", 0, 100), 42);
  EXPECT_EQ(parse_int(" -7 ", -16, 16), -7);
  EXPECT_THROW(parse_int("12abc", 0, 100), ConfigError);
  EXPECT_THROW(parse_int("101", 0, 100), ConfigError);
  EXPECT_THROW(parse_int("", 0, 100), ConfigError);
}

TEST(ValueCodec, FloatsRejectNonFinite) {
  EXPECT_DOUBLE_EQ(parse_float("1.5"), 1.5);
  EXPECT_THROW(parse_float("nan"), ConfigError);
  EXPECT_THROW(parse_float("inf"), ConfigError);
  EXPECT_THROW(parse_float("1.5x"), ConfigError);
}

TEST(ValueCodec, FloatFormattingIsShortest) {
  EXPECT_EQ(format_float(24.0), "24");
  EXPECT_EQ(format_float(140.0), "140");
  EXPECT_EQ(format_float(0.55), "0.55");
  EXPECT_EQ(format_float(-0.085), "-0.085");
  EXPECT_EQ(format_float(-0.0), "0");
}
