#pragma once

#include <epsbar/core/quarter.hpp>
#include <chrono>
#include <map>

namespace epsbar::core {

/// One quarter's figure in a report.
struct QuarterEntry {
  double value{0.0};
  bool is_estimate{false};

  friend bool operator==(const QuarterEntry&, const QuarterEntry&) = default;
};

/// Extraction result for one chart image (one report date).
/// quarters is ordered chronologically by QuarterId regardless of detection order.
struct ReportRecord {
  std::chrono::year_month_day report_date{};
  std::map<QuarterId, QuarterEntry> quarters;
  double confidence{0.0};  // 0 to 100
};

}  // namespace epsbar::core
