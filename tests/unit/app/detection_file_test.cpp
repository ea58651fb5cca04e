#include <epsbar/app/detection_file.hpp>
#include <support/chart_jobs.hpp>
#include <gtest/gtest.h>
#include <fstream>

namespace na = epsbar::app;
namespace nc = epsbar::core;

TEST(DetectionFileTest, ParsesLineWithConfidence) {
  const auto d = na::parse_detection_line("Q1'14\t35\t260.5\t65\t275\t0.87");
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(d->text, "Q1'14");
  EXPECT_FLOAT_EQ(d->box.x0, 35.f);
  EXPECT_FLOAT_EQ(d->box.y0, 260.5f);
  EXPECT_FLOAT_EQ(d->box.x1, 65.f);
  EXPECT_FLOAT_EQ(d->box.y1, 275.f);
  EXPECT_FLOAT_EQ(d->ocr_confidence, 0.87f);
}

TEST(DetectionFileTest, ConfidenceDefaultsToOne) {
  const auto d = na::parse_detection_line("Quarterly EPS\t120\t5\t280\t20\r");
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(d->text, "Quarterly EPS");
  EXPECT_FLOAT_EQ(d->ocr_confidence, 1.f);
}

TEST(DetectionFileTest, RejectsMalformedLines) {
  EXPECT_FALSE(na::parse_detection_line("").has_value());
  EXPECT_FALSE(na::parse_detection_line("27.85\t1\t2\t3").has_value());
  EXPECT_FALSE(na::parse_detection_line("27.85\t1\t2\t3\t4\t0.5\textra").has_value());
  EXPECT_FALSE(na::parse_detection_line("\t1\t2\t3\t4").has_value());
  EXPECT_FALSE(na::parse_detection_line("27.85\tx\t2\t3\t4").has_value());
  EXPECT_FALSE(na::parse_detection_line("27.85\t10\t2\t5\t4").has_value());  // x1 < x0
  EXPECT_FALSE(na::parse_detection_line("27.85\t1\t2\t3\t4\t1.5").has_value());
}

TEST(DetectionFileTest, RejectsNonFiniteNumbers) {
  EXPECT_FALSE(na::parse_detection_line("Q1'14\tnan\tnan\tnan\tnan").has_value());
  EXPECT_FALSE(na::parse_detection_line("Q1'14\t35\t260\tinf\t275").has_value());
  EXPECT_FALSE(na::parse_detection_line("Q1'14\t-inf\t260\t65\t275").has_value());
  EXPECT_FALSE(na::parse_detection_line("Q1'14\t35\t260\t65\t275\tnan").has_value());
  EXPECT_FALSE(na::parse_detection_line("Q1'14\t35\t260\t1e39\t275").has_value());
  EXPECT_TRUE(na::parse_detection_line("Q1'14\t35\t260\t1e10\t275").has_value());
}

TEST(DetectionFileTest, LoadSkipsCommentsAndBadLines) {
  epsbar::test::TempDir dir("detections");
  const auto path = dir.path() / "20140501.tsv";
  {
    std::ofstream f(path);
    f << "# text\tx0\ty0\tx1\ty1\tconfidence\n"
      << "Q1'14\t35\t260\t65\t275\t0.98\n"
      << "\n"
      << "garbage line\n"
      << "27.85\t35\t85\t65\t100\n";
  }
  const auto dets = na::load_detections(path.string());
  ASSERT_TRUE(dets.has_value());
  ASSERT_EQ(dets->size(), 2u);
  EXPECT_EQ((*dets)[0].text, "Q1'14");
  EXPECT_EQ((*dets)[1].text, "27.85");
}

TEST(DetectionFileTest, MissingFileFails) {
  const auto dets = na::load_detections("/nonexistent/20140501.tsv");
  ASSERT_FALSE(dets.has_value());
  EXPECT_EQ(dets.error(), nc::ExtractError::LoadFailed);
}
