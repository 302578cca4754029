#pragma once
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

namespace video_timeline {

class ImageProcessing {
public:
  ImageProcessing() = default;
  ~ImageProcessing() = default;

  // Base64 JPEG. max_size bounds the longest side, 0 keeps the frame size.
  static std::string encodeFrame(const cv::Mat &frame, int max_size = 0);

  // Public methods for testing
  static cv::Mat resizeImage(const cv::Mat &image, int max_size);
  static std::vector<unsigned char> encodeToJpg(const cv::Mat &image);
  static std::string encodeToBase64(const std::vector<unsigned char> &data);
  static std::vector<unsigned char>
  decodeBase64(const std::string &encoded_string);

private:
  static cv::Size calculateNewSize(const cv::Mat &image, int max_size);
};

} // namespace video_timeline
