#include "video_timeline/image_processing.hpp"
#include "base64.h"
#include "video_timeline/errors.hpp"
#include <algorithm>
#include <iostream>

namespace video_timeline {

std::string ImageProcessing::encodeFrame(const cv::Mat &frame, int max_size) {
  if (frame.empty()) {
    throw FrameEncodeError("Cannot encode an empty frame");
  }

  std::vector<unsigned char> jpg_data;
  try {
    if (max_size > 0 && std::max(frame.cols, frame.rows) > max_size) {
      jpg_data = encodeToJpg(resizeImage(frame, max_size));
    } else {
      jpg_data = encodeToJpg(frame);
    }
  } catch (const cv::Exception &e) {
    throw FrameEncodeError(std::string("Failed to encode frame: ") + e.what());
  }
  return encodeToBase64(jpg_data);
}

cv::Mat ImageProcessing::resizeImage(const cv::Mat &image, int max_size) {
  cv::Size new_size = calculateNewSize(image, max_size);
  cv::Mat resized_image;
  cv::resize(image, resized_image, new_size, 0, 0, cv::INTER_AREA);
  return resized_image;
}

std::vector<unsigned char> ImageProcessing::encodeToJpg(const cv::Mat &image) {
  std::vector<unsigned char> buf;
  if (!cv::imencode(".jpg", image, buf) || buf.empty()) {
    std::cerr << "Error: Failed to encode frame to JPEG" << std::endl;
    throw FrameEncodeError("Failed to encode frame");
  }
  return buf;
}

std::string
ImageProcessing::encodeToBase64(const std::vector<unsigned char> &data) {
  return base64_encode(data.data(), data.size());
}

std::vector<unsigned char>
ImageProcessing::decodeBase64(const std::string &encoded_string) {
  std::string decoded = base64_decode(encoded_string);
  return std::vector<unsigned char>(decoded.begin(), decoded.end());
}

cv::Size ImageProcessing::calculateNewSize(const cv::Mat &image,
                                           int max_size) {
  float aspect_ratio = (float)image.cols / (float)image.rows;
  int new_width, new_height;

  if (aspect_ratio >= 1.0f) {
    new_width = max_size;
    new_height = std::max(static_cast<int>(max_size / aspect_ratio), 1);
  } else {
    new_height = max_size;
    new_width = std::max(static_cast<int>(max_size * aspect_ratio), 1);
  }

  return cv::Size(new_width, new_height);
}

} // namespace video_timeline
