#include <epsbar/app/batch_runner_tbb.hpp>

#ifdef EPSBAR_HAS_TBB

#include <epsbar/app/report_date.hpp>
#include <spdlog/spdlog.h>
#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>
#include <expected>
#include <optional>

namespace epsbar::app {

std::size_t run_batch_tbb(const ChartExtractor& extractor,
                          const std::vector<ImageJob>& jobs,
                          report::ReportTable& table,
                          ReportCallback callback,
                          std::size_t num_workers) {
  using AnalysisResult = std::expected<report::ImageAnalysis, core::ExtractError>;

  const std::size_t n = jobs.size();
  if (n == 0) return 0;

  std::optional<tbb::global_control> limit;
  if (num_workers > 0) {
    limit.emplace(tbb::global_control::max_allowed_parallelism, num_workers);
    spdlog::info("Analyzing {} images on at most {} TBB workers", n, num_workers);
  }

  std::vector<std::optional<AnalysisResult>> analyses(n);
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&extractor, &jobs, &analyses](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          analyses[i] = extractor.analyze(jobs[i]);
        }
      });

  std::size_t merged = 0;
  for (const std::size_t idx : detail::date_order(jobs)) {
    const auto& analysis = *analyses[idx];
    if (!analysis) {
      spdlog::error("{}: skipped ({})", jobs[idx].source, core::to_string(analysis.error()));
      continue;
    }
    auto assembled = extractor.finalize(*analysis, table);
    spdlog::info("{}: report {} with {} quarters, confidence {:.1f}", jobs[idx].source,
                 format_date(assembled.record.report_date),
                 assembled.record.quarters.size(), assembled.record.confidence);
    if (callback) callback(assembled);
    ++merged;
  }
  return merged;
}

}  // namespace epsbar::app

#endif  // EPSBAR_HAS_TBB
