#include <epsbar/app/chart_extractor.hpp>
#include <spdlog/spdlog.h>

namespace epsbar::app {

ChartExtractor::ChartExtractor(const ExtractionConfig& config)
    : matcher_(config.matcher),
      classifier_(config.classifier),
      builder_(config.scorer) {}

std::expected<report::ImageAnalysis, core::ExtractError> ChartExtractor::analyze(
    const ImageJob& job) const {
  if (!job.frame.is_valid()) {
    return std::unexpected(core::ExtractError::InvalidImage);
  }

  report::ImageAnalysis analysis;
  analysis.report_date = job.report_date;
  analysis.pairs = matcher_.match(job.detections, static_cast<float>(job.frame.height()));

  auto classified = classifier_.classify_all(job.frame, analysis.pairs);
  if (!classified) {
    return std::unexpected(classified.error());
  }
  analysis.classifications = std::move(*classified);

  spdlog::debug("{}: {} detections, {} matched bars", job.source,
                job.detections.size(), analysis.pairs.size());
  return analysis;
}

report::AssembledReport ChartExtractor::finalize(const report::ImageAnalysis& analysis,
                                                 report::ReportTable& table) const {
  return builder_.finalize(analysis, table);
}

std::expected<report::AssembledReport, core::ExtractError> ChartExtractor::process(
    const ImageJob& job,
    report::ReportTable& table) const {
  auto analysis = analyze(job);
  if (!analysis) {
    return std::unexpected(analysis.error());
  }
  return finalize(*analysis, table);
}

}  // namespace epsbar::app
