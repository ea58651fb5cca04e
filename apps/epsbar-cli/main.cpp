/**
 * epsbar-cli: Extract quarterly EPS tables from bar-chart images and their OCR output.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/apps/epsbar-cli/epsbar_cli [--config path] [--input-dir dir] [--output csv]
 * Each <name>.png in the input directory needs a <name>.tsv detection file beside it;
 * the report date is taken from the leading YYYYMMDD of the file name.
 */

#include <epsbar/app/batch_runner.hpp>
#include <epsbar/app/chart_extractor.hpp>
#include <epsbar/app/config.hpp>
#include <epsbar/app/detection_file.hpp>
#include <epsbar/app/logging.hpp>
#include <epsbar/app/report_date.hpp>
#include <epsbar/app/table_csv.hpp>
#include <epsbar/report/report_table.hpp>
#include <epsbar/vision/load_image.hpp>
#ifdef EPSBAR_HAS_TBB
#include <epsbar/app/batch_runner_tbb.hpp>
#endif
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;

std::vector<fs::path> list_images(const fs::path& dir) {
  std::vector<fs::path> images;
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (entry.is_regular_file() && entry.path().extension() == ".png") {
      images.push_back(entry.path());
    }
  }
  std::sort(images.begin(), images.end());
  return images;
}

std::vector<epsbar::app::ImageJob> load_jobs(const std::vector<fs::path>& images) {
  std::vector<epsbar::app::ImageJob> jobs;
  jobs.reserve(images.size());
  for (const auto& image : images) {
    const std::string name = image.filename().string();
    const auto date = epsbar::app::report_date_from_filename(name);
    if (!date) {
      spdlog::warn("{}: no YYYYMMDD report date in file name, skipping", name);
      continue;
    }

    auto detections_path = image;
    detections_path.replace_extension(".tsv");
    auto detections = epsbar::app::load_detections(detections_path.string());
    if (!detections) {
      spdlog::warn("{}: cannot read {}, skipping", name, detections_path.string());
      continue;
    }

    auto frame = epsbar::vision::load_frame_from_image(image.string());
    if (!frame) {
      spdlog::error("Cannot read image: {}", image.string());
      continue;
    }

    epsbar::app::ImageJob job;
    job.report_date = *date;
    job.frame = std::move(*frame);
    job.detections = std::move(*detections);
    job.source = name;
    jobs.push_back(std::move(job));
  }
  return jobs;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string input_dir = "output/estimates";
  std::string output_path = "output/extracted_estimates.csv";
  std::string log_level_override;
  std::size_t limit = 0;
  long workers_override = -1;
  bool append = false;

  try {
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--config" && i + 1 < argc) {
        config_path = argv[++i];
      } else if (arg == "--input-dir" && i + 1 < argc) {
        input_dir = argv[++i];
      } else if (arg == "--output" && i + 1 < argc) {
        output_path = argv[++i];
      } else if (arg == "--limit" && i + 1 < argc) {
        limit = static_cast<std::size_t>(std::stoul(argv[++i]));
      } else if (arg == "--workers" && i + 1 < argc) {
        workers_override = std::stol(argv[++i]);
      } else if (arg == "--log-level" && i + 1 < argc) {
        log_level_override = argv[++i];
      } else if (arg == "--append") {
        append = true;
      } else if (arg == "--help" || arg == "-h") {
        std::cout << "Usage: epsbar_cli [options]\n"
                  << "  --config <path>     Extraction config (key=value file); default: built-in\n"
                  << "  --input-dir <dir>   Chart images (*.png) with *.tsv detections (default: output/estimates)\n"
                  << "  --output <path>     Estimates CSV (default: output/extracted_estimates.csv);\n"
                  << "                      confidences go to <stem>_confidence.csv beside it\n"
                  << "  --limit <n>         Process at most n images\n"
                  << "  --workers <n>       Analysis threads (0 = hardware concurrency)\n"
                  << "  --log-level <lvl>   trace | debug | info | warn | error | off\n"
                  << "  --append            Extend the existing output tables instead of replacing them\n";
        return 0;
      } else {
        std::cerr << "Unknown argument: " << arg << " (see --help)\n";
        return 1;
      }
    }
  } catch (const std::logic_error& e) {
    std::cerr << "Invalid numeric argument: " << e.what() << "\n";
    return 1;
  }

  epsbar::app::ExtractionConfig cfg = config_path.empty()
                                          ? epsbar::app::default_config()
                                          : epsbar::app::load_config(config_path);
  if (!log_level_override.empty()) cfg.log_level = log_level_override;
  if (workers_override >= 0) cfg.num_workers = static_cast<std::size_t>(workers_override);
  epsbar::app::setup_logging(cfg.log_level);

  if (!epsbar::app::validate_config(cfg)) {
    std::cerr << "Invalid configuration\n";
    return 1;
  }

  const fs::path input(input_dir);
  if (!fs::is_directory(input)) {
    std::cerr << "Error: Input directory does not exist: " << input_dir << "\n";
    return 1;
  }

  auto images = list_images(input);
  if (limit > 0 && images.size() > limit) images.resize(limit);
  spdlog::info("Processing {} image files.", images.size());

  const auto jobs = load_jobs(images);

  epsbar::report::ReportTable table;
  const fs::path output(output_path);
  if (append && fs::exists(output)) {
    auto existing = epsbar::app::read_table_csv(output, cfg.estimate_marker);
    if (!existing) {
      std::cerr << "Cannot extend " << output_path << ": "
                << epsbar::core::to_string(existing.error()) << "\n";
      return 1;
    }
    for (auto& record : *existing) {
      table.merge(std::move(record));
    }
    spdlog::info("Loaded {} existing reports from {}", table.size(), output_path);
  }

  const epsbar::app::ChartExtractor extractor(cfg);
#ifdef EPSBAR_HAS_TBB
  const std::size_t merged = cfg.num_workers == 1
      ? epsbar::app::run_batch(extractor, jobs, table)
      : epsbar::app::run_batch_tbb(extractor, jobs, table, nullptr, cfg.num_workers);
#else
  const std::size_t merged =
      epsbar::app::run_batch_parallel(extractor, jobs, table, nullptr, cfg.num_workers);
#endif

  if (table.empty()) {
    spdlog::warn("No data extracted.");
    return 0;
  }

  if (output.has_parent_path()) {
    fs::create_directories(output.parent_path());
  }
  if (auto written = epsbar::app::write_table_csv(table, output, cfg.estimate_marker); !written) {
    std::cerr << "Failed to write results: " << epsbar::core::to_string(written.error()) << "\n";
    return 1;
  }

  std::cout << "Processing complete: extracted " << merged << " reports ("
            << table.size() << " in table, " << table.quarter_columns().size()
            << " quarters).\n"
            << "Result file: " << output_path << "\n";
  return 0;
}
