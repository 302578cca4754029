#include "video_timeline/frame_sampler.hpp"
#include "video_timeline/errors.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace video_timeline {

FrameSampler::FrameSampler(int stride) : stride_(stride) {
  if (stride_ < 1) {
    throw std::invalid_argument("Frame sampling stride must be >= 1, got " +
                                std::to_string(stride_));
  }
}

int FrameSampler::run(ScopedVideoSource &video, const Consumer &consumer,
                      const std::atomic<bool> *cancelFlag) const {
  const auto &info = video.info();
  const bool boundedByCount = info.totalFrames > 0;
  int sampled = 0;

  cv::Mat frame;
  for (int frameIndex = 0; !boundedByCount || frameIndex < info.totalFrames;
       ++frameIndex) {
    if (cancelFlag && cancelFlag->load()) {
      throw ProcessingCancelled("Frame sampling cancelled at frame " +
                                std::to_string(frameIndex));
    }
    if (!video.read(frame)) {
      std::cout << "Reached end of video at frame " << frameIndex << std::endl;
      break;
    }
    if (frameIndex % stride_ != 0) {
      continue;
    }

    SampledFrame sample{frameIndex, frameIndex / info.fps, frame};
    consumer(sample);
    ++sampled;
  }
  return sampled;
}

} // namespace video_timeline
