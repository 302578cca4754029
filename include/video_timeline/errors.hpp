#pragma once

#include <stdexcept>
#include <string>

namespace video_timeline {

// Every fatal failure of a video run derives from this type. stage() names
// the pipeline stage that failed so callers can report it.
class VideoTimelineError : public std::runtime_error {
public:
  VideoTimelineError(const std::string &stage, const std::string &message)
      : std::runtime_error(message), stage_(stage) {}

  const std::string &stage() const { return stage_; }

private:
  std::string stage_;
};

class ConfigError : public VideoTimelineError {
public:
  explicit ConfigError(const std::string &message)
      : VideoTimelineError("config", message) {}
};

class VideoOpenError : public VideoTimelineError {
public:
  explicit VideoOpenError(const std::string &message)
      : VideoTimelineError("open", message) {}
};

class TranscriptionError : public VideoTimelineError {
public:
  explicit TranscriptionError(const std::string &message)
      : VideoTimelineError("transcription", message) {}
};

class FrameEncodeError : public VideoTimelineError {
public:
  explicit FrameEncodeError(const std::string &message)
      : VideoTimelineError("frame_encode", message) {}
};

class VisionServiceError : public VideoTimelineError {
public:
  explicit VisionServiceError(const std::string &message)
      : VideoTimelineError("vision", message) {}
};

class ProcessingCancelled : public VideoTimelineError {
public:
  explicit ProcessingCancelled(const std::string &message)
      : VideoTimelineError("cancelled", message) {}
};

} // namespace video_timeline
