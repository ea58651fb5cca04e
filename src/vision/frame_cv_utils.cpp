#include "frame_cv_utils.hpp"
#include <epsbar/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace epsbar::vision::detail {

namespace nc = epsbar::core;

std::optional<cv::Mat> frame_to_mat(const nc::Frame& frame) {
  if (!frame.is_valid()) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  const int type = CV_8UC(static_cast<int>(nc::Frame::channels(frame.format())));
  return cv::Mat(h, w, type, const_cast<std::byte*>(frame.data().data()), frame.row_bytes());
}

std::optional<cv::Mat> frame_to_gray(const nc::Frame& frame) {
  auto mat = frame_to_mat(frame);
  if (!mat) return std::nullopt;

  cv::Mat gray;
  switch (frame.format()) {
    case nc::PixelFormat::Grayscale8:
      gray = mat->clone();
      break;
    case nc::PixelFormat::RGB8:
      cv::cvtColor(*mat, gray, cv::COLOR_RGB2GRAY);
      break;
    case nc::PixelFormat::BGR8:
      cv::cvtColor(*mat, gray, cv::COLOR_BGR2GRAY);
      break;
    case nc::PixelFormat::RGBA8:
      cv::cvtColor(*mat, gray, cv::COLOR_RGBA2GRAY);
      break;
    case nc::PixelFormat::BGRA8:
      cv::cvtColor(*mat, gray, cv::COLOR_BGRA2GRAY);
      break;
    case nc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
  return gray;
}

nc::Frame mat_to_frame(const cv::Mat& mat, nc::PixelFormat format) {
  if (mat.empty()) return nc::Frame();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(packed.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(packed.rows);
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return nc::Frame(w, h, format, std::move(buffer));
}

}  // namespace epsbar::vision::detail
