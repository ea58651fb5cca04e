#pragma once

#include <epsbar/core/error.hpp>
#include <epsbar/extraction/spatial_matcher.hpp>
#include <epsbar/report/confidence_scorer.hpp>
#include <epsbar/vision/bar_classifier.hpp>
#include <cstddef>
#include <expected>
#include <string>

namespace epsbar::app {

/// Extraction configuration: matching geometry, ensemble parameters, scoring, output.
struct ExtractionConfig {
  extraction::MatcherConfig matcher;
  vision::ClassifierConfig classifier;
  report::ScorerConfig scorer;
  std::string estimate_marker{"*"};  // suffix of estimate values in the CSV table
  std::size_t num_workers{0};        // 0 = hardware concurrency
  std::string log_level{"info"};
};

/// Load config from a simple key=value file (one per line) or use defaults.
/// Unknown keys are ignored; malformed values are logged and keep their default.
ExtractionConfig load_config(const std::string& path);

/// Default config when no file is provided.
ExtractionConfig default_config();

/// Rejects values the pipeline cannot run with (e.g. an even adaptive block size).
[[nodiscard]] std::expected<void, core::ExtractError> validate_config(
    const ExtractionConfig& config);

}  // namespace epsbar::app
