#include <epsbar/core/bar_classification.hpp>

namespace epsbar::core {

std::string_view to_string(BarMethod m) noexcept {
  switch (m) {
    case BarMethod::AdaptiveThreshold:
      return "adaptive";
    case BarMethod::MorphologicalClosing:
      return "closing";
    case BarMethod::InvertedOtsu:
      return "otsu_inv";
  }
  return "unknown";
}

std::string_view to_string(BarShade s) noexcept {
  return s == BarShade::Dark ? "dark" : "light";
}

}  // namespace epsbar::core
