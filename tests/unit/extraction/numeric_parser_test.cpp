#include <epsbar/extraction/numeric_parser.hpp>
#include <gtest/gtest.h>

namespace ne = epsbar::extraction;

TEST(NumericParser, PlainDecimal) {
  auto v = ne::parse_numeric("27.85");
  ASSERT_TRUE(v.has_value());
  EXPECT_DOUBLE_EQ(*v, 27.85);
}

TEST(NumericParser, DollarSignWhitespaceAndSeparators) {
  EXPECT_DOUBLE_EQ(ne::parse_numeric(" $1.05 ").value(), 1.05);
  EXPECT_DOUBLE_EQ(ne::parse_numeric("1,234.5").value(), 1234.5);
  EXPECT_DOUBLE_EQ(ne::parse_numeric("-0.40").value(), -0.40);
  EXPECT_DOUBLE_EQ(ne::parse_numeric("2014").value(), 2014.0);
}

TEST(NumericParser, RejectsText) {
  EXPECT_FALSE(ne::parse_numeric("").has_value());
  EXPECT_FALSE(ne::parse_numeric("EPS").has_value());
  EXPECT_FALSE(ne::parse_numeric("Q1'14").has_value());
  EXPECT_FALSE(ne::parse_numeric("27.85x").has_value());
  EXPECT_FALSE(ne::parse_numeric("$").has_value());
  EXPECT_FALSE(ne::parse_numeric(",5").has_value());
}
