#pragma once

#include <epsbar/core/bar_classification.hpp>
#include <epsbar/core/quarter.hpp>
#include <epsbar/core/report_record.hpp>
#include <epsbar/report/report_table.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <span>

namespace epsbar::report {

struct ScorerConfig {
  double relative_tolerance{0.2};  // max |cur - prior| / |prior| for a matching actual
  double bar_weight{0.5};          // share of bar_score; consistency gets the rest
  double min_denominator{0.01};    // floor for |prior| in the relative difference
};

/// Components of a report's confidence, all in [0, 100].
struct ConfidenceBreakdown {
  double bar_score{0.0};
  double consistency_score{100.0};
  double confidence{0.0};
  std::optional<std::chrono::year_month_day> prior_date;
};

/// Scores one report by ensemble agreement and by stability of its actual
/// figures against the closest earlier report in the supplied history.
class ConfidenceScorer {
 public:
  ConfidenceScorer() = default;
  explicit ConfidenceScorer(ScorerConfig config);

  /// Mean tier confidence of the bars; 0 when there are none.
  [[nodiscard]] double bar_score(std::span<const core::ClassificationResult> results) const;

  /// Percentage of quarters that are actual in both reports and agree within
  /// the tolerance. 100 when there is no prior report or nothing to compare.
  [[nodiscard]] double consistency_score(
      const std::map<core::QuarterId, core::QuarterEntry>& current,
      const core::ReportRecord* prior) const;

  /// Weighted combination rounded to one decimal. A report without any
  /// classified bar scores 0.
  [[nodiscard]] ConfidenceBreakdown score(
      std::chrono::year_month_day report_date,
      const std::map<core::QuarterId, core::QuarterEntry>& quarters,
      std::span<const core::ClassificationResult> results,
      const ReportTable& history) const;

  [[nodiscard]] const ScorerConfig& config() const noexcept { return config_; }

 private:
  ScorerConfig config_{};
};

}  // namespace epsbar::report
