#include "video_timeline/errors.hpp"
#include "video_timeline/video_source_interface.hpp"

#include <iostream>

namespace video_timeline {

bool OpenCvVideoSource::open(const std::string &path) {
  return cap.open(path);
}

bool OpenCvVideoSource::isOpened() const { return cap.isOpened(); }

void OpenCvVideoSource::release() { cap.release(); }

bool OpenCvVideoSource::read(cv::OutputArray image) { return cap.read(image); }

double OpenCvVideoSource::get(int propId) const { return cap.get(propId); }

ScopedVideoSource::ScopedVideoSource(std::unique_ptr<IVideoSource> source,
                                     const std::string &videoPath)
    : source_(std::move(source)) {
  if (!source_ || !source_->open(videoPath) || !source_->isOpened()) {
    std::cerr << "Error: Failed to open video file: " << videoPath
              << std::endl;
    throw VideoOpenError("Could not open video file: " + videoPath);
  }

  info_.fps = source_->get(cv::CAP_PROP_FPS);
  info_.totalFrames = static_cast<int>(source_->get(cv::CAP_PROP_FRAME_COUNT));
  if (!(info_.fps > 0)) {
    release();
    throw VideoOpenError("Invalid FPS for video: " + videoPath);
  }
  info_.duration = info_.totalFrames / info_.fps;
}

ScopedVideoSource::~ScopedVideoSource() { release(); }

bool ScopedVideoSource::read(cv::Mat &frame) {
  if (released_) {
    return false;
  }
  return source_->read(frame);
}

void ScopedVideoSource::release() {
  if (released_) {
    return;
  }
  released_ = true;
  source_->release();
}

} // namespace video_timeline
