#pragma once

#include <epsbar/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace epsbar::vision::detail {

/// Non-owning cv::Mat view of the frame's buffer. Returns nullopt if the frame is not valid.
std::optional<cv::Mat> frame_to_mat(const epsbar::core::Frame& frame);

/// Single-channel 8-bit copy of the frame. Returns nullopt if the frame is not valid.
std::optional<cv::Mat> frame_to_gray(const epsbar::core::Frame& frame);

/// Convert cv::Mat to Frame (copy).
epsbar::core::Frame mat_to_frame(const cv::Mat& mat, epsbar::core::PixelFormat format);

}  // namespace epsbar::vision::detail
