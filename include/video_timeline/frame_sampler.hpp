#pragma once

#include "video_source_interface.hpp"
#include <atomic>
#include <functional>
#include <opencv2/core.hpp>

namespace video_timeline {

struct SampledFrame {
  int index;
  double timestamp; // index / fps
  cv::Mat image;
};

// Hands every frame with index % stride == 0 to the consumer. A failed read
// is end of stream. A frame count <= 0 means unknown, read until the end.
class FrameSampler {
public:
  using Consumer = std::function<void(const SampledFrame &)>;

  explicit FrameSampler(int stride);

  // Returns the number of frames sampled.
  int run(ScopedVideoSource &video, const Consumer &consumer,
          const std::atomic<bool> *cancelFlag = nullptr) const;

private:
  int stride_;
};

} // namespace video_timeline
