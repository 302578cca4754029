#pragma once
#include <functional>
#include <memory>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <string>

namespace video_timeline {

class IVideoSource {
public:
  virtual ~IVideoSource() = default;

  virtual bool open(const std::string &path) = 0;
  virtual bool isOpened() const = 0;
  virtual void release() = 0;
  virtual bool read(cv::OutputArray image) = 0;
  virtual double get(int propId) const = 0;
};

using VideoSourceFactory = std::function<std::unique_ptr<IVideoSource>()>;

class OpenCvVideoSource : public IVideoSource {
public:
  bool open(const std::string &path) override;
  bool isOpened() const override;
  void release() override;
  bool read(cv::OutputArray image) override;
  double get(int propId) const override;

private:
  cv::VideoCapture cap;
};

// Owns an opened video for one processing run. The source is released
// exactly once, by release() or by the destructor.
class ScopedVideoSource {
public:
  struct VideoInfo {
    int totalFrames;
    double fps;
    double duration;
  };

  // Throws VideoOpenError if the video cannot be opened or has no usable fps.
  ScopedVideoSource(std::unique_ptr<IVideoSource> source,
                    const std::string &videoPath);
  ~ScopedVideoSource();

  ScopedVideoSource(const ScopedVideoSource &) = delete;
  ScopedVideoSource &operator=(const ScopedVideoSource &) = delete;

  const VideoInfo &info() const { return info_; }

  // false at end of stream or after release()
  bool read(cv::Mat &frame);
  void release();

private:
  std::unique_ptr<IVideoSource> source_;
  VideoInfo info_{};
  bool released_ = false;
};

} // namespace video_timeline
