#pragma once

#include "config.hpp"
#include "time_series_index.hpp"
#include "transcription.hpp"
#include "video_source_interface.hpp"
#include "vision_client.hpp"
#include <atomic>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace video_timeline {

struct VideoMetadata {
  double duration = 0.0;
  double fps = 0.0;
  int totalFrames = 0;
  int frameSampleRate = 0; // effective stride, -1 when captioning is off
};

struct ParseVideoResult {
  VideoMetadata metadata;
  TimeSeriesIndex transcript;
  TimeSeriesIndex frameDescriptions;

  nlohmann::json toJson() const;
};

// Open, transcribe, then caption against the finished transcript. Any
// failure aborts the video with a staged VideoTimelineError.
class VideoProcessor {
public:
  VideoProcessor(Config config, TranscriptionService &transcriber,
                 VisionClient &vision, VideoSourceFactory sourceFactory = {},
                 const std::atomic<bool> *cancelFlag = nullptr);

  ParseVideoResult process(const std::string &videoPath,
                           std::optional<int> frameSampleRate = std::nullopt);

private:
  Config config;
  TranscriptionService &transcriber;
  VisionClient &vision;
  VideoSourceFactory sourceFactory;
  const std::atomic<bool> *cancelFlag;
};

} // namespace video_timeline
