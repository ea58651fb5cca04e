#include <epsbar/report/report_table.hpp>
#include <iterator>

namespace epsbar::report {

void ReportTable::merge(core::ReportRecord record) {
  std::lock_guard lock(mutex_);
  for (const auto& [id, entry] : record.quarters) {
    columns_.insert(id);
  }
  const auto date = record.report_date;
  records_.insert_or_assign(date, std::move(record));
}

std::optional<core::ReportRecord> ReportTable::find(
    std::chrono::year_month_day date) const {
  std::lock_guard lock(mutex_);
  auto it = records_.find(date);
  if (it == records_.end()) return std::nullopt;
  return it->second;
}

std::optional<core::ReportRecord> ReportTable::closest_before(
    std::chrono::year_month_day date) const {
  std::lock_guard lock(mutex_);
  auto it = records_.lower_bound(date);
  if (it == records_.begin()) return std::nullopt;
  return std::prev(it)->second;
}

std::vector<core::ReportRecord> ReportTable::records() const {
  std::lock_guard lock(mutex_);
  std::vector<core::ReportRecord> out;
  out.reserve(records_.size());
  for (const auto& [date, record] : records_) {
    out.push_back(record);
  }
  return out;
}

std::vector<core::QuarterId> ReportTable::quarter_columns() const {
  std::lock_guard lock(mutex_);
  return {columns_.begin(), columns_.end()};
}

std::size_t ReportTable::size() const {
  std::lock_guard lock(mutex_);
  return records_.size();
}

bool ReportTable::empty() const {
  std::lock_guard lock(mutex_);
  return records_.empty();
}

}  // namespace epsbar::report
