#pragma once

#include <epsbar/core/box.hpp>
#include <string>

namespace epsbar::core {

/// One OCR detection: recognized text, its box, and the recognizer's confidence (0-1).
struct TextDetection {
  std::string text;
  Box box{};
  float ocr_confidence{0.f};
};

}  // namespace epsbar::core
