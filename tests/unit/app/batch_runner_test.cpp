#include <epsbar/app/batch_runner.hpp>
#include <support/chart_jobs.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <cstddef>
#include <vector>

namespace na = epsbar::app;
namespace nr = epsbar::report;
namespace nt = epsbar::test;
using nt::ymd;

namespace {

// Out-of-order dates: the runner must score them oldest first.
std::vector<na::ImageJob> three_reports() {
  std::vector<na::ImageJob> jobs;
  jobs.push_back(nt::chart_job(ymd(2014, 11, 3),
                               nt::fiscal_2014_bars("27.90", "27.00", "29.20", "30.60"),
                               "20141103.png"));
  jobs.push_back(nt::chart_job(ymd(2014, 5, 1),
                               nt::fiscal_2014_bars("27.85", "28.10", "29.00", "30.50"),
                               "20140501.png"));
  jobs.push_back(nt::chart_job(ymd(2014, 8, 1),
                               nt::fiscal_2014_bars("27.80", "35.00", "29.10", "30.40"),
                               "20140801.png"));
  return jobs;
}

}  // namespace

TEST(BatchRunnerTest, DateOrderIsStable) {
  std::vector<na::ImageJob> jobs(4);
  jobs[0].report_date = ymd(2015, 1, 1);
  jobs[1].report_date = ymd(2014, 1, 1);
  jobs[2].report_date = ymd(2015, 1, 1);
  jobs[3].report_date = ymd(2013, 6, 1);
  EXPECT_EQ(na::detail::date_order(jobs), (std::vector<std::size_t>{3, 1, 0, 2}));
}

TEST(BatchRunnerTest, SequentialScoresInDateOrder) {
  const auto jobs = three_reports();
  na::ChartExtractor extractor;
  nr::ReportTable table;
  std::vector<std::chrono::year_month_day> seen;
  std::vector<double> confidences;

  const auto merged = na::run_batch(extractor, jobs, table,
                                    [&](const nr::AssembledReport& r) {
                                      seen.push_back(r.record.report_date);
                                      confidences.push_back(r.record.confidence);
                                    });
  EXPECT_EQ(merged, 3u);
  EXPECT_EQ(seen, (std::vector<std::chrono::year_month_day>{ymd(2014, 5, 1), ymd(2014, 8, 1),
                                                           ymd(2014, 11, 3)}));
  ASSERT_EQ(confidences.size(), 3u);
  EXPECT_DOUBLE_EQ(confidences[0], 100.0);
  EXPECT_DOUBLE_EQ(confidences[1], 75.0);  // Q2'14 moved from 28.10 to 35.00
  EXPECT_DOUBLE_EQ(confidences[2], 75.0);  // and down to 27.00
  EXPECT_EQ(table.size(), 3u);
}

TEST(BatchRunnerTest, InvalidImageIsSkipped) {
  auto jobs = three_reports();
  na::ImageJob broken;
  broken.report_date = ymd(2014, 6, 1);
  broken.source = "20140601.png";
  jobs.push_back(std::move(broken));

  na::ChartExtractor extractor;
  nr::ReportTable table;
  std::size_t calls = 0;
  const auto merged =
      na::run_batch(extractor, jobs, table, [&calls](const nr::AssembledReport&) { ++calls; });
  EXPECT_EQ(merged, 3u);
  EXPECT_EQ(calls, 3u);
  EXPECT_FALSE(table.find(ymd(2014, 6, 1)).has_value());
}

TEST(BatchRunnerTest, ParallelMatchesSequential) {
  const auto jobs = three_reports();
  na::ChartExtractor extractor;

  nr::ReportTable sequential;
  na::run_batch(extractor, jobs, sequential);

  nr::ReportTable parallel;
  std::vector<std::chrono::year_month_day> seen;
  const auto merged = na::run_batch_parallel(
      extractor, jobs, parallel,
      [&seen](const nr::AssembledReport& r) { seen.push_back(r.record.report_date); }, 3);
  EXPECT_EQ(merged, 3u);
  EXPECT_TRUE(std::is_sorted(seen.begin(), seen.end()));

  const auto a = sequential.records();
  const auto b = parallel.records();
  ASSERT_EQ(a.size(), b.size());
  for (std::size_t i = 0; i < a.size(); ++i) {
    EXPECT_TRUE(nt::same_record(a[i], b[i])) << i;
  }
  EXPECT_EQ(sequential.quarter_columns(), parallel.quarter_columns());
}

TEST(BatchRunnerTest, ParallelSkipsInvalidImage) {
  auto jobs = three_reports();
  jobs.emplace_back();
  jobs.back().report_date = ymd(2014, 1, 1);

  na::ChartExtractor extractor;
  nr::ReportTable table;
  EXPECT_EQ(na::run_batch_parallel(extractor, jobs, table, nullptr, 2), 3u);
  EXPECT_EQ(table.size(), 3u);
}

TEST(BatchRunnerTest, EmptyBatch) {
  na::ChartExtractor extractor;
  nr::ReportTable table;
  std::size_t calls = 0;
  const std::vector<na::ImageJob> none;
  EXPECT_EQ(na::run_batch(extractor, none, table, [&calls](const nr::AssembledReport&) { ++calls; }), 0u);
  EXPECT_EQ(na::run_batch_parallel(extractor, none, table, nullptr, 4), 0u);
  EXPECT_EQ(calls, 0u);
  EXPECT_TRUE(table.empty());
}
