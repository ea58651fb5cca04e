#include <epsbar/report/confidence_scorer.hpp>
#include <algorithm>
#include <cmath>

namespace epsbar::report {

ConfidenceScorer::ConfidenceScorer(ScorerConfig config) : config_(config) {}

double ConfidenceScorer::bar_score(
    std::span<const core::ClassificationResult> results) const {
  if (results.empty()) return 0.0;
  double sum = 0.0;
  for (const auto& r : results) {
    sum += r.tier_confidence;
  }
  return sum / static_cast<double>(results.size());
}

double ConfidenceScorer::consistency_score(
    const std::map<core::QuarterId, core::QuarterEntry>& current,
    const core::ReportRecord* prior) const {
  if (!prior) return 100.0;

  int comparable = 0;
  int matches = 0;
  for (const auto& [id, entry] : current) {
    if (entry.is_estimate) continue;
    auto it = prior->quarters.find(id);
    if (it == prior->quarters.end() || it->second.is_estimate) continue;

    ++comparable;
    const double previous = it->second.value;
    const double denom = std::max(std::abs(previous), config_.min_denominator);
    if (std::abs(entry.value - previous) / denom <= config_.relative_tolerance) {
      ++matches;
    }
  }
  if (comparable == 0) return 100.0;
  return 100.0 * matches / comparable;
}

ConfidenceBreakdown ConfidenceScorer::score(
    std::chrono::year_month_day report_date,
    const std::map<core::QuarterId, core::QuarterEntry>& quarters,
    std::span<const core::ClassificationResult> results,
    const ReportTable& history) const {
  ConfidenceBreakdown out;
  const auto prior = history.closest_before(report_date);
  if (prior) out.prior_date = prior->report_date;

  out.bar_score = bar_score(results);
  out.consistency_score = consistency_score(quarters, prior ? &*prior : nullptr);
  if (results.empty()) {
    out.confidence = 0.0;
    return out;
  }

  const double combined = config_.bar_weight * out.bar_score +
                          (1.0 - config_.bar_weight) * out.consistency_score;
  out.confidence = std::round(combined * 10.0) / 10.0;
  return out;
}

}  // namespace epsbar::report
