#include <epsbar/app/batch_runner.hpp>
#include <epsbar/app/report_date.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <expected>
#include <mutex>
#include <numeric>
#include <optional>
#include <queue>
#include <thread>

namespace epsbar::app {

namespace detail {

std::vector<std::size_t> date_order(const std::vector<ImageJob>& jobs) {
  std::vector<std::size_t> order(jobs.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(), [&jobs](std::size_t a, std::size_t b) {
    return jobs[a].report_date < jobs[b].report_date;
  });
  return order;
}

}  // namespace detail

namespace {

using AnalysisResult = std::expected<report::ImageAnalysis, core::ExtractError>;

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

bool finalize_one(const ChartExtractor& extractor,
                  const ImageJob& job,
                  const AnalysisResult& analysis,
                  report::ReportTable& table,
                  const ReportCallback& callback) {
  if (!analysis) {
    spdlog::error("{}: skipped ({})", job.source, core::to_string(analysis.error()));
    return false;
  }
  auto assembled = extractor.finalize(*analysis, table);
  spdlog::info("{}: report {} with {} quarters, confidence {:.1f}", job.source,
               format_date(assembled.record.report_date),
               assembled.record.quarters.size(), assembled.record.confidence);
  if (callback) callback(assembled);
  return true;
}

}  // namespace

std::size_t run_batch(const ChartExtractor& extractor,
                      const std::vector<ImageJob>& jobs,
                      report::ReportTable& table,
                      ReportCallback callback) {
  std::size_t merged = 0;
  const auto order = detail::date_order(jobs);
  for (std::size_t n = 0; n < order.size(); ++n) {
    const ImageJob& job = jobs[order[n]];
    spdlog::info("Processing ({}/{}): {}", n + 1, order.size(), job.source);
    if (finalize_one(extractor, job, extractor.analyze(job), table, callback)) {
      ++merged;
    }
  }
  return merged;
}

std::size_t run_batch_parallel(const ChartExtractor& extractor,
                               const std::vector<ImageJob>& jobs,
                               report::ReportTable& table,
                               ReportCallback callback,
                               std::size_t num_workers) {
  const std::size_t n = jobs.size();
  if (n == 0) return 0;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    return run_batch(extractor, jobs, table, std::move(callback));
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::vector<std::optional<AnalysisResult>> analyses(n);
  std::mutex queue_mutex;

  // Each slot of analyses is written by exactly one worker.
  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }
      analyses[idx] = extractor.analyze(jobs[idx]);
    }
  };

  spdlog::info("Analyzing {} images on {} workers", n, workers);
  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }

  std::size_t merged = 0;
  for (const std::size_t idx : detail::date_order(jobs)) {
    if (finalize_one(extractor, jobs[idx], *analyses[idx], table, callback)) {
      ++merged;
    }
  }
  return merged;
}

}  // namespace epsbar::app
