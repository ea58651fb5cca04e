#pragma once

#include <epsbar/app/chart_extractor.hpp>
#include <epsbar/report/report_assembler.hpp>
#include <epsbar/report/report_table.hpp>
#include <cstddef>
#include <functional>
#include <vector>

namespace epsbar::app {

/// Callback for each finalized report. Always invoked from the calling thread,
/// in report date order.
using ReportCallback = std::function<void(const report::AssembledReport&)>;

/// Processes jobs one by one in report date order (stable for equal dates).
/// Jobs whose image is invalid are logged and skipped. Returns the number of
/// reports merged into \p table.
std::size_t run_batch(const ChartExtractor& extractor,
                      const std::vector<ImageJob>& jobs,
                      report::ReportTable& table,
                      ReportCallback callback = nullptr);

/// Analyzes jobs in parallel on a thread pool, then scores and merges them
/// sequentially in report date order. num_workers 0 = use hardware concurrency.
std::size_t run_batch_parallel(const ChartExtractor& extractor,
                               const std::vector<ImageJob>& jobs,
                               report::ReportTable& table,
                               ReportCallback callback = nullptr,
                               std::size_t num_workers = 0);

namespace detail {

/// Job indices sorted by report date, stable for equal dates.
std::vector<std::size_t> date_order(const std::vector<ImageJob>& jobs);

}  // namespace detail

}  // namespace epsbar::app
