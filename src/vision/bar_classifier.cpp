#include <epsbar/vision/bar_classifier.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace epsbar::vision {

namespace nc = epsbar::core;

namespace {

double white_ratio(const cv::Mat& binary) {
  if (binary.empty()) return 0.0;
  return static_cast<double>(cv::countNonZero(binary)) /
         static_cast<double>(binary.total());
}

double method_white_ratio(nc::BarMethod method,
                          const cv::Mat& crop,
                          const ClassifierConfig& cfg) {
  if (crop.empty()) return 0.0;

  cv::Mat binary;
  switch (method) {
    case nc::BarMethod::AdaptiveThreshold:
      cv::adaptiveThreshold(crop, binary, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C,
                            cv::THRESH_BINARY, cfg.adaptive_block_size, cfg.adaptive_c);
      break;
    case nc::BarMethod::MorphologicalClosing: {
      cv::Mat global;
      cv::threshold(crop, global, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
      const cv::Mat kernel = cv::getStructuringElement(
          cv::MORPH_RECT, cv::Size(cfg.closing_kernel_size, cfg.closing_kernel_size));
      cv::morphologyEx(global, binary, cv::MORPH_CLOSE, kernel);
      break;
    }
    case nc::BarMethod::InvertedOtsu:
      cv::threshold(crop, binary, 0, 255, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);
      break;
  }
  return white_ratio(binary);
}

// Clamp in float space so the int conversion is always in range; NaN maps to 0.
int clamp_to_pixel(float v, std::uint32_t limit) {
  if (!(v > 0.f)) return 0;
  const auto upper = static_cast<float>(limit);
  return v >= upper ? static_cast<int>(limit) : static_cast<int>(v);
}

nc::ClassificationResult classify_gray(const cv::Mat& gray,
                                       const nc::QuarterValuePair& pair,
                                       const ClassifierConfig& cfg) {
  const BarRegion region = bar_region(pair, static_cast<std::uint32_t>(gray.cols),
                                      static_cast<std::uint32_t>(gray.rows));
  cv::Mat crop;
  if (!region.empty()) {
    crop = gray(cv::Rect(region.x, region.y, region.width, region.height)).clone();
  }

  std::vector<nc::BarVote> votes;
  votes.reserve(kBarMethodRules.size());
  for (const auto& rule : kBarMethodRules) {
    const double ratio = method_white_ratio(rule.method, crop, cfg);
    votes.push_back({rule.method, ratio, vote_for(rule.method, ratio)});
  }
  return tally(votes);
}

}  // namespace

nc::ClassificationResult tally(std::span<const nc::BarVote> votes) {
  const auto dark = static_cast<int>(std::count_if(
      votes.begin(), votes.end(),
      [](const nc::BarVote& v) { return v.vote == nc::BarShade::Dark; }));
  const int light = static_cast<int>(votes.size()) - dark;

  nc::ClassificationResult out;
  out.votes.assign(votes.begin(), votes.end());
  out.final_shade = dark > light ? nc::BarShade::Dark : nc::BarShade::Light;
  out.agreement_count = std::max(dark, light);
  out.tier_confidence = tier_confidence(out.agreement_count);
  return out;
}

BarRegion bar_region(const nc::QuarterValuePair& pair,
                     std::uint32_t image_width,
                     std::uint32_t image_height) {
  const float left = std::min(pair.label_box.x0, pair.value_box.x0);
  const float right = std::max(pair.label_box.x1, pair.value_box.x1);
  const int x0 = clamp_to_pixel(std::floor(left), image_width);
  const int x1 = clamp_to_pixel(std::ceil(right), image_width);
  const int y0 = clamp_to_pixel(std::floor(pair.value_box.y1), image_height);
  const int y1 = clamp_to_pixel(std::ceil(pair.label_box.y0), image_height);

  BarRegion region;
  region.x = x0;
  region.y = y0;
  region.width = std::max(0, x1 - x0);
  region.height = std::max(0, y1 - y0);
  return region;
}

BarClassifier::BarClassifier(ClassifierConfig config) : config_(config) {}

std::expected<nc::ClassificationResult, nc::ExtractError> BarClassifier::classify(
    const nc::Frame& frame,
    const nc::QuarterValuePair& pair) const {
  auto gray = detail::frame_to_gray(frame);
  if (!gray) {
    return std::unexpected(nc::ExtractError::InvalidImage);
  }
  return classify_gray(*gray, pair, config_);
}

std::expected<std::vector<nc::ClassificationResult>, nc::ExtractError>
BarClassifier::classify_all(const nc::Frame& frame,
                            std::span<const nc::QuarterValuePair> pairs) const {
  auto gray = detail::frame_to_gray(frame);
  if (!gray) {
    return std::unexpected(nc::ExtractError::InvalidImage);
  }

  std::vector<nc::ClassificationResult> out;
  out.reserve(pairs.size());
  for (const auto& pair : pairs) {
    out.push_back(classify_gray(*gray, pair, config_));
  }
  return out;
}

}  // namespace epsbar::vision
