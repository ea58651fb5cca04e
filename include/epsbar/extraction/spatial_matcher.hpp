#pragma once

#include <epsbar/core/quarter.hpp>
#include <epsbar/core/quarter_value_pair.hpp>
#include <epsbar/core/text_detection.hpp>
#include <span>
#include <vector>

namespace epsbar::extraction {

/// Geometry of the "labels in the bottom band, figures above the bars" layout.
struct MatcherConfig {
  float bottom_fraction{0.3f};  // share of image height holding quarter labels
  float x_tolerance{10.f};      // max |dx| between label and figure centers
  float y_tolerance{1000.f};    // max dy between label and figure centers
  float x_weight{10.f};
  float y_weight{0.1f};
  double year_cutoff{2000.0};   // figures at or above this are years, not EPS
};

/// Pairs each quarter label with the figure printed above its bar.
///
/// Column alignment is the matching signal: the distance weighs horizontal
/// offset 10x and vertical offset 0.1x by default. Labels are visited left to
/// right and each claims its nearest unclaimed figure, so a figure is used at
/// most once. Labels without a figure in range are dropped.
class SpatialMatcher {
 public:
  SpatialMatcher() = default;
  explicit SpatialMatcher(MatcherConfig config);

  /// Detections in the bottom band that read as quarter labels.
  [[nodiscard]] std::vector<core::QuarterLabel> find_quarter_labels(
      std::span<const core::TextDetection> detections,
      float image_height) const;

  /// Detections that parse as figures below the year cutoff, excluding those
  /// that became quarter labels.
  [[nodiscard]] std::vector<core::NumericCandidate> find_numeric_candidates(
      std::span<const core::TextDetection> detections,
      float image_height) const;

  /// Pairs ordered left to right by label position.
  [[nodiscard]] std::vector<core::QuarterValuePair> match(
      std::vector<core::QuarterLabel> labels,
      std::span<const core::NumericCandidate> candidates) const;

  /// find_quarter_labels + find_numeric_candidates + match.
  [[nodiscard]] std::vector<core::QuarterValuePair> match(
      std::span<const core::TextDetection> detections,
      float image_height) const;

  [[nodiscard]] const MatcherConfig& config() const noexcept { return config_; }

 private:
  MatcherConfig config_{};
};

}  // namespace epsbar::extraction
