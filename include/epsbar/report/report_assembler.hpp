#pragma once

#include <epsbar/core/bar_classification.hpp>
#include <epsbar/core/quarter_value_pair.hpp>
#include <epsbar/core/report_record.hpp>
#include <epsbar/report/confidence_scorer.hpp>
#include <epsbar/report/report_table.hpp>
#include <chrono>
#include <span>
#include <vector>

namespace epsbar::report {

/// Matching and classification output for one image; classifications[i]
/// belongs to pairs[i]. Produced independently per image.
struct ImageAnalysis {
  std::chrono::year_month_day report_date{};
  std::vector<core::QuarterValuePair> pairs;
  std::vector<core::ClassificationResult> classifications;
};

/// Fold pairs and their classifications into one record. Light bars become
/// estimates; when a quarter appears twice the leftmost pair is kept.
[[nodiscard]] core::ReportRecord assemble_record(
    std::chrono::year_month_day report_date,
    std::span<const core::QuarterValuePair> pairs,
    std::span<const core::ClassificationResult> classifications,
    double confidence);

struct AssembledReport {
  core::ReportRecord record;
  ConfidenceBreakdown breakdown;
};

/// Scores an analyzed image against the table and merges the resulting record.
/// Calls must be made in non-decreasing report date order for the
/// consistency score to see every earlier report.
class ReportBuilder {
 public:
  ReportBuilder() = default;
  explicit ReportBuilder(ScorerConfig config);

  AssembledReport finalize(const ImageAnalysis& analysis, ReportTable& table) const;

 private:
  ConfidenceScorer scorer_{};
};

}  // namespace epsbar::report
