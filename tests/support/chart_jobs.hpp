#pragma once

#include <epsbar/app/chart_extractor.hpp>
#include <epsbar/core/report_record.hpp>
#include <support/synthetic_chart.hpp>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace epsbar::test {

/// Job for a synthetic 400x300 chart holding \p bars.
inline app::ImageJob chart_job(std::chrono::year_month_day date,
                               const std::vector<SyntheticBar>& bars,
                               std::string source) {
  app::ImageJob job;
  job.report_date = date;
  job.frame = white_frame(kChartWidth, kChartHeight);
  job.detections = draw_chart(job.frame, bars);
  job.source = std::move(source);
  return job;
}

/// Four quarters of 2014: Q1 and Q2 reported, Q3 and Q4 estimated.
inline std::vector<SyntheticBar> fiscal_2014_bars(const char* q1, const char* q2,
                                                  const char* q3, const char* q4) {
  return {
      {"Q1'14", q1, 50, 100, true},
      {"Q2'I4", q2, 130, 90, true},
      {"O3'14", q3, 210, 80, false},
      {"Q4'14", q4, 290, 70, false},
  };
}

inline bool same_record(const core::ReportRecord& a, const core::ReportRecord& b) {
  return a.report_date == b.report_date && a.quarters == b.quarters &&
         a.confidence == b.confidence;
}

/// Fresh directory under the system temp dir, removed by the destructor.
class TempDir {
 public:
  explicit TempDir(const std::string& name)
      : path_(std::filesystem::temp_directory_path() / ("epsbar_test_" + name)) {
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

 private:
  std::filesystem::path path_;
};

}  // namespace epsbar::test
