#include <epsbar/app/config.hpp>
#include <support/chart_jobs.hpp>
#include <gtest/gtest.h>
#include <fstream>

namespace na = epsbar::app;
namespace nc = epsbar::core;

TEST(ConfigTest, DefaultsAreValid) {
  const auto c = na::default_config();
  EXPECT_FLOAT_EQ(c.matcher.bottom_fraction, 0.3f);
  EXPECT_FLOAT_EQ(c.matcher.x_tolerance, 10.f);
  EXPECT_EQ(c.classifier.adaptive_block_size, 11);
  EXPECT_DOUBLE_EQ(c.scorer.relative_tolerance, 0.2);
  EXPECT_EQ(c.estimate_marker, "*");
  EXPECT_EQ(c.num_workers, 0u);
  EXPECT_TRUE(na::validate_config(c).has_value());
}

TEST(ConfigTest, MissingFileGivesDefaults) {
  const auto c = na::load_config("/nonexistent/epsbar.conf");
  EXPECT_FLOAT_EQ(c.matcher.y_tolerance, 1000.f);
  EXPECT_EQ(c.log_level, "info");
}

TEST(ConfigTest, LoadsKeyValueFile) {
  epsbar::test::TempDir dir("config");
  const auto path = dir.path() / "epsbar.conf";
  {
    std::ofstream f(path);
    f << "# extraction settings\n"
      << "bottom_fraction = 0.25\n"
      << "x_tolerance=14\n"
      << "\n"
      << "adaptive_block_size = 15\n"
      << "closing_kernel_size = 3\n"
      << "relative_tolerance = 0.1\n"
      << "bar_weight = 0.7\n"
      << "estimate_marker = E\n"
      << "num_workers = 4\n"
      << "log_level = debug\n"
      << "colour = blue\n";
  }
  const auto c = na::load_config(path.string());
  EXPECT_FLOAT_EQ(c.matcher.bottom_fraction, 0.25f);
  EXPECT_FLOAT_EQ(c.matcher.x_tolerance, 14.f);
  EXPECT_EQ(c.classifier.adaptive_block_size, 15);
  EXPECT_EQ(c.classifier.closing_kernel_size, 3);
  EXPECT_DOUBLE_EQ(c.scorer.relative_tolerance, 0.1);
  EXPECT_DOUBLE_EQ(c.scorer.bar_weight, 0.7);
  EXPECT_EQ(c.estimate_marker, "E");
  EXPECT_EQ(c.num_workers, 4u);
  EXPECT_EQ(c.log_level, "debug");
  EXPECT_FLOAT_EQ(c.matcher.y_tolerance, 1000.f);
  EXPECT_TRUE(na::validate_config(c).has_value());
}

TEST(ConfigTest, MalformedValuesKeepDefaults) {
  epsbar::test::TempDir dir("config_malformed");
  const auto path = dir.path() / "epsbar.conf";
  {
    std::ofstream f(path);
    f << "x_tolerance = wide\n"
      << "adaptive_block_size = 11px\n"
      << "bar_weight = 1e999\n"
      << "num_workers = -2\n"
      << "no equals sign here\n";
  }
  const auto c = na::load_config(path.string());
  EXPECT_FLOAT_EQ(c.matcher.x_tolerance, 10.f);
  EXPECT_EQ(c.classifier.adaptive_block_size, 11);
  EXPECT_DOUBLE_EQ(c.scorer.bar_weight, 0.5);
  EXPECT_EQ(c.num_workers, 0u);
}

TEST(ConfigTest, ValidateRejectsUnusableValues) {
  const auto rejected = [](auto mutate) {
    auto c = na::default_config();
    mutate(c);
    const auto r = na::validate_config(c);
    return !r.has_value() && r.error() == nc::ExtractError::InvalidConfig;
  };
  EXPECT_TRUE(rejected([](na::ExtractionConfig& c) { c.matcher.bottom_fraction = 0.f; }));
  EXPECT_TRUE(rejected([](na::ExtractionConfig& c) { c.matcher.bottom_fraction = 1.5f; }));
  EXPECT_TRUE(rejected([](na::ExtractionConfig& c) { c.matcher.x_tolerance = -1.f; }));
  EXPECT_TRUE(rejected([](na::ExtractionConfig& c) { c.classifier.adaptive_block_size = 10; }));
  EXPECT_TRUE(rejected([](na::ExtractionConfig& c) { c.classifier.adaptive_block_size = 1; }));
  EXPECT_TRUE(rejected([](na::ExtractionConfig& c) { c.classifier.closing_kernel_size = 0; }));
  EXPECT_TRUE(rejected([](na::ExtractionConfig& c) { c.scorer.relative_tolerance = -0.1; }));
  EXPECT_TRUE(rejected([](na::ExtractionConfig& c) { c.scorer.bar_weight = 1.2; }));
  EXPECT_FALSE(rejected([](na::ExtractionConfig& c) { c.matcher.bottom_fraction = 1.f; }));
}
