#pragma once

#include <epsbar/app/config.hpp>
#include <epsbar/core/error.hpp>
#include <epsbar/core/frame.hpp>
#include <epsbar/core/text_detection.hpp>
#include <epsbar/extraction/spatial_matcher.hpp>
#include <epsbar/report/report_assembler.hpp>
#include <epsbar/report/report_table.hpp>
#include <epsbar/vision/bar_classifier.hpp>
#include <chrono>
#include <expected>
#include <string>
#include <vector>

namespace epsbar::app {

/// Everything the core needs for one chart image.
struct ImageJob {
  std::chrono::year_month_day report_date{};
  core::Frame frame;
  std::vector<core::TextDetection> detections;
  std::string source;  // file name or other tag, for logs only
};

/// Matcher, classifier and report builder configured from one ExtractionConfig.
///
/// analyze() touches no shared state and may run concurrently for different
/// images. finalize() reads and updates the table and must be called in
/// report date order.
class ChartExtractor {
 public:
  ChartExtractor() = default;
  explicit ChartExtractor(const ExtractionConfig& config);

  /// Match labels to figures and classify every matched bar.
  /// Fails with ExtractError::InvalidImage when the frame cannot be read.
  [[nodiscard]] std::expected<report::ImageAnalysis, core::ExtractError> analyze(
      const ImageJob& job) const;

  /// Score against \p table, assemble the record and merge it.
  report::AssembledReport finalize(const report::ImageAnalysis& analysis,
                                   report::ReportTable& table) const;

  /// analyze() followed by finalize().
  [[nodiscard]] std::expected<report::AssembledReport, core::ExtractError> process(
      const ImageJob& job,
      report::ReportTable& table) const;

 private:
  extraction::SpatialMatcher matcher_{};
  vision::BarClassifier classifier_{};
  report::ReportBuilder builder_{};
};

}  // namespace epsbar::app
