#pragma once

#include <epsbar/app/batch_runner.hpp>
#include <epsbar/app/chart_extractor.hpp>
#include <epsbar/report/report_table.hpp>
#include <cstddef>
#include <vector>

#ifdef EPSBAR_HAS_TBB

namespace epsbar::app {

/// Runs the per-image analysis of \p jobs with tbb::parallel_for, then scores
/// and merges the reports sequentially in report date order.
///
/// ChartExtractor::analyze() is const and shares no state between images, so a
/// single extractor serves all TBB tasks. \p callback runs on the calling
/// thread. num_workers > 0 caps TBB parallelism for the call through
/// tbb::global_control; 0 leaves the TBB default. Returns the number of
/// reports merged into \p table.
std::size_t run_batch_tbb(const ChartExtractor& extractor,
                          const std::vector<ImageJob>& jobs,
                          report::ReportTable& table,
                          ReportCallback callback = nullptr,
                          std::size_t num_workers = 0);

}  // namespace epsbar::app

#endif  // EPSBAR_HAS_TBB
