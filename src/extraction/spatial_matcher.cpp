#include <epsbar/extraction/spatial_matcher.hpp>
#include <epsbar/extraction/numeric_parser.hpp>
#include <epsbar/extraction/quarter_normalizer.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>

namespace epsbar::extraction {

namespace nc = epsbar::core;

SpatialMatcher::SpatialMatcher(MatcherConfig config) : config_(config) {}

std::vector<nc::QuarterLabel> SpatialMatcher::find_quarter_labels(
    std::span<const nc::TextDetection> detections,
    float image_height) const {
  std::vector<nc::QuarterLabel> labels;
  for (const auto& d : detections) {
    if (auto label = to_quarter_label(d, image_height, config_.bottom_fraction)) {
      labels.push_back(std::move(*label));
    }
  }
  return labels;
}

std::vector<nc::NumericCandidate> SpatialMatcher::find_numeric_candidates(
    std::span<const nc::TextDetection> detections,
    float image_height) const {
  std::vector<nc::NumericCandidate> out;
  for (const auto& d : detections) {
    if (to_quarter_label(d, image_height, config_.bottom_fraction)) continue;
    const auto value = parse_numeric(d.text);
    if (!value || *value >= config_.year_cutoff) continue;
    out.push_back({*value, d.box, d.text});
  }
  return out;
}

std::vector<nc::QuarterValuePair> SpatialMatcher::match(
    std::vector<nc::QuarterLabel> labels,
    std::span<const nc::NumericCandidate> candidates) const {
  std::stable_sort(labels.begin(), labels.end(),
                   [](const nc::QuarterLabel& a, const nc::QuarterLabel& b) {
                     return a.box.x0 < b.box.x0;
                   });

  std::vector<bool> claimed(candidates.size(), false);
  std::vector<nc::QuarterValuePair> pairs;
  pairs.reserve(labels.size());

  for (const auto& label : labels) {
    const float lx = label.box.center_x();
    const float ly = label.box.center_y();

    std::optional<std::size_t> best;
    float best_distance = 0.f;
    float best_dx = 0.f;
    float best_dy = 0.f;

    for (std::size_t i = 0; i < candidates.size(); ++i) {
      if (claimed[i]) continue;
      const auto& c = candidates[i];
      if (!(c.box.center_y() < ly)) continue;  // figure must sit above the label

      const float dx = std::abs(c.box.center_x() - lx);
      const float dy = ly - c.box.center_y();
      // Also false for NaN offsets.
      if (!(dx <= config_.x_tolerance && dy <= config_.y_tolerance)) continue;

      const float distance = std::hypot(config_.x_weight * dx, config_.y_weight * dy);
      bool better = !best.has_value() || distance < best_distance;
      if (best && distance == best_distance) {
        if (dx != best_dx) {
          better = dx < best_dx;
        } else {
          better = c.box.x0 < candidates[*best].box.x0;
        }
      }
      if (better) {
        best = i;
        best_distance = distance;
        best_dx = dx;
        best_dy = dy;
      }
    }

    if (!best) continue;
    claimed[*best] = true;
    const auto& c = candidates[*best];
    pairs.push_back({label.id, c.value, label.box, c.box, best_dx, best_dy, best_distance});
  }
  return pairs;
}

std::vector<nc::QuarterValuePair> SpatialMatcher::match(
    std::span<const nc::TextDetection> detections,
    float image_height) const {
  return match(find_quarter_labels(detections, image_height),
               find_numeric_candidates(detections, image_height));
}

}  // namespace epsbar::extraction
