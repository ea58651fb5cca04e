#include <epsbar/core/quarter.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

namespace nc = epsbar::core;

TEST(QuarterId, KeyUsesTwoDigitYear) {
  EXPECT_EQ((nc::QuarterId{1, 2014}.to_key()), "Q1'14");
  EXPECT_EQ((nc::QuarterId{4, 2005}.to_key()), "Q4'05");
}

TEST(QuarterId, ParseKey) {
  auto id = nc::parse_quarter_key("Q3'17");
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(id->quarter, 3);
  EXPECT_EQ(id->year, 2017);

  auto bare = nc::parse_quarter_key("Q214");
  ASSERT_TRUE(bare.has_value());
  EXPECT_EQ(*bare, (nc::QuarterId{2, 2014}));
}

TEST(QuarterId, ParseKeyRejectsMalformed) {
  EXPECT_FALSE(nc::parse_quarter_key("").has_value());
  EXPECT_FALSE(nc::parse_quarter_key("Q5'14").has_value());
  EXPECT_FALSE(nc::parse_quarter_key("Q1'1").has_value());
  EXPECT_FALSE(nc::parse_quarter_key("Report_Date").has_value());
  EXPECT_FALSE(nc::parse_quarter_key("Q1'145").has_value());
}

TEST(QuarterId, OrdersByYearThenQuarter) {
  std::vector<nc::QuarterId> ids = {{2, 2017}, {1, 2014}, {4, 2014}, {1, 2017}};
  std::sort(ids.begin(), ids.end());
  EXPECT_EQ(ids[0], (nc::QuarterId{1, 2014}));
  EXPECT_EQ(ids[1], (nc::QuarterId{4, 2014}));
  EXPECT_EQ(ids[2], (nc::QuarterId{1, 2017}));
  EXPECT_EQ(ids[3], (nc::QuarterId{2, 2017}));
}
