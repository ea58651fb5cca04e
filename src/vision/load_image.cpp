#include <epsbar/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <epsbar/core/frame.hpp>
#include <opencv2/imgcodecs.hpp>

namespace epsbar::vision {

std::expected<epsbar::core::Frame, epsbar::core::ExtractError>
load_frame_from_image(const std::string& path) {
  cv::Mat mat = cv::imread(path, cv::IMREAD_UNCHANGED);
  if (mat.empty() || mat.depth() != CV_8U) {
    return std::unexpected(epsbar::core::ExtractError::LoadFailed);
  }

  epsbar::core::PixelFormat format = epsbar::core::PixelFormat::Unknown;
  switch (mat.channels()) {
    case 1:
      format = epsbar::core::PixelFormat::Grayscale8;
      break;
    case 3:
      format = epsbar::core::PixelFormat::BGR8;
      break;
    case 4:
      format = epsbar::core::PixelFormat::BGRA8;
      break;
    default:
      return std::unexpected(epsbar::core::ExtractError::LoadFailed);
  }

  return detail::mat_to_frame(mat, format);
}

}  // namespace epsbar::vision
