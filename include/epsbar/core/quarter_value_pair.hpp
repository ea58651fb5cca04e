#pragma once

#include <epsbar/core/box.hpp>
#include <epsbar/core/quarter.hpp>
#include <string>

namespace epsbar::core {

/// A detection that parses as a decimal figure and may label a bar.
struct NumericCandidate {
  double value{0.0};
  Box box{};
  std::string source_text;
};

/// A quarter label matched with the figure printed above its bar.
/// value_box lies above label_box; x_diff and y_diff are center offsets.
struct QuarterValuePair {
  QuarterId id{};
  double value{0.0};
  Box label_box{};
  Box value_box{};
  float x_diff{0.f};
  float y_diff{0.f};
  float distance{0.f};  // weighted matching distance
};

}  // namespace epsbar::core
