#include <epsbar/report/report_assembler.hpp>
#include <algorithm>
#include <cstddef>

namespace epsbar::report {

core::ReportRecord assemble_record(
    std::chrono::year_month_day report_date,
    std::span<const core::QuarterValuePair> pairs,
    std::span<const core::ClassificationResult> classifications,
    double confidence) {
  core::ReportRecord record;
  record.report_date = report_date;
  record.confidence = confidence;

  const std::size_t n = std::min(pairs.size(), classifications.size());
  for (std::size_t i = 0; i < n; ++i) {
    record.quarters.try_emplace(
        pairs[i].id, core::QuarterEntry{pairs[i].value, classifications[i].is_estimate()});
  }
  return record;
}

ReportBuilder::ReportBuilder(ScorerConfig config) : scorer_(config) {}

AssembledReport ReportBuilder::finalize(const ImageAnalysis& analysis,
                                        ReportTable& table) const {
  AssembledReport out;
  out.record = assemble_record(analysis.report_date, analysis.pairs,
                               analysis.classifications, 0.0);
  out.breakdown = scorer_.score(analysis.report_date, out.record.quarters,
                                analysis.classifications, table);
  out.record.confidence = out.breakdown.confidence;
  table.merge(out.record);
  return out;
}

}  // namespace epsbar::report
