#include <epsbar/app/batch_runner.hpp>
#include <epsbar/app/chart_extractor.hpp>
#include <epsbar/app/config.hpp>
#include <epsbar/app/table_csv.hpp>
#include <epsbar/vision/load_image.hpp>
#include <support/chart_jobs.hpp>
#include <gtest/gtest.h>
#include <sstream>
#include <vector>

namespace na = epsbar::app;
namespace nc = epsbar::core;
namespace nr = epsbar::report;
namespace nt = epsbar::test;
using nt::ymd;

TEST(FullExtraction, SingleChartEndToEnd) {
  const auto job = nt::chart_job(ymd(2014, 5, 1),
                                 nt::fiscal_2014_bars("27.85", "28.10", "29.00", "30.50"),
                                 "20140501.png");
  na::ChartExtractor extractor(na::default_config());

  const auto analysis = extractor.analyze(job);
  ASSERT_TRUE(analysis.has_value());
  ASSERT_EQ(analysis->pairs.size(), 4u);
  ASSERT_EQ(analysis->classifications.size(), 4u);
  for (const auto& c : analysis->classifications) {
    EXPECT_EQ(c.agreement_count, 3);
  }

  nr::ReportTable table;
  const auto report = extractor.finalize(*analysis, table);
  const auto& q = report.record.quarters;
  ASSERT_EQ(q.size(), 4u);
  EXPECT_EQ(q.at({1, 2014}), (nc::QuarterEntry{27.85, false}));
  EXPECT_EQ(q.at({2, 2014}), (nc::QuarterEntry{28.10, false}));
  EXPECT_EQ(q.at({3, 2014}), (nc::QuarterEntry{29.00, true}));
  EXPECT_EQ(q.at({4, 2014}), (nc::QuarterEntry{30.50, true}));
  EXPECT_DOUBLE_EQ(report.breakdown.bar_score, 100.0);
  EXPECT_DOUBLE_EQ(report.record.confidence, 100.0);
}

TEST(FullExtraction, RevisedActualLowersConfidence) {
  std::vector<na::ImageJob> jobs;
  jobs.push_back(nt::chart_job(ymd(2014, 8, 1),
                               nt::fiscal_2014_bars("27.80", "35.00", "29.10", "30.40"),
                               "20140801.png"));
  jobs.push_back(nt::chart_job(ymd(2014, 5, 1),
                               nt::fiscal_2014_bars("27.85", "28.10", "29.00", "30.50"),
                               "20140501.png"));

  na::ChartExtractor extractor;
  nr::ReportTable table;
  ASSERT_EQ(na::run_batch(extractor, jobs, table), 2u);
  EXPECT_DOUBLE_EQ(table.find(ymd(2014, 5, 1))->confidence, 100.0);
  EXPECT_DOUBLE_EQ(table.find(ymd(2014, 8, 1))->confidence, 75.0);

  std::ostringstream estimates;
  na::write_estimates_csv(table, estimates);
  EXPECT_EQ(estimates.str(),
            "Report_Date,Q1'14,Q2'14,Q3'14,Q4'14\n"
            "2014-05-01,27.85,28.1,29.0*,30.5*\n"
            "2014-08-01,27.8,35.0,29.1*,30.4*\n");

  std::ostringstream confidence;
  na::write_confidence_csv(table, confidence);
  EXPECT_EQ(confidence.str(), "Report_Date,Confidence\n2014-05-01,100.0\n2014-08-01,75.0\n");
}

TEST(FullExtraction, ChartWithoutLabelsYieldsEmptyRecord) {
  auto job = nt::chart_job(ymd(2015, 2, 1), {}, "20150201.png");
  job.detections.push_back(nt::detection("1.25", 100, 100, 130, 115));

  na::ChartExtractor extractor;
  nr::ReportTable table;
  const auto report = extractor.process(job, table);
  ASSERT_TRUE(report.has_value());
  EXPECT_TRUE(report->record.quarters.empty());
  EXPECT_DOUBLE_EQ(report->record.confidence, 0.0);
  EXPECT_EQ(table.size(), 1u);
}

TEST(FullExtraction, UnreadableImageIsHardFailure) {
  na::ImageJob job;
  job.report_date = ymd(2014, 5, 1);
  job.detections.push_back(nt::detection("Q1'14", 35, 260, 65, 275));

  na::ChartExtractor extractor;
  nr::ReportTable table;
  const auto report = extractor.process(job, table);
  ASSERT_FALSE(report.has_value());
  EXPECT_EQ(report.error(), nc::ExtractError::InvalidImage);
  EXPECT_TRUE(table.empty());

  const auto frame = epsbar::vision::load_frame_from_image("/nonexistent/20140501.png");
  ASSERT_FALSE(frame.has_value());
  EXPECT_EQ(frame.error(), nc::ExtractError::LoadFailed);
}
