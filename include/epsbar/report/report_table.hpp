#pragma once

#include <epsbar/core/quarter.hpp>
#include <epsbar/core/report_record.hpp>
#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace epsbar::report {

/// Cumulative output table: one ReportRecord per report date.
///
/// The quarter-column set only grows and stays chronologically sorted.
/// Thread-safety: every member locks an internal mutex, so merge() is an
/// atomic read-modify-write per date and readers get consistent copies.
class ReportTable {
 public:
  ReportTable() = default;
  ReportTable(const ReportTable&) = delete;
  ReportTable& operator=(const ReportTable&) = delete;

  /// Insert the record, or replace the one already stored for its date.
  void merge(core::ReportRecord record);

  [[nodiscard]] std::optional<core::ReportRecord> find(
      std::chrono::year_month_day date) const;

  /// Record with the latest date strictly before \p date.
  [[nodiscard]] std::optional<core::ReportRecord> closest_before(
      std::chrono::year_month_day date) const;

  /// All records, oldest first.
  [[nodiscard]] std::vector<core::ReportRecord> records() const;

  /// Every quarter seen so far, oldest first.
  [[nodiscard]] std::vector<core::QuarterId> quarter_columns() const;

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] bool empty() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::chrono::year_month_day, core::ReportRecord> records_;
  std::set<core::QuarterId> columns_;
};

}  // namespace epsbar::report
