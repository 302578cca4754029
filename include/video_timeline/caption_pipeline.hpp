#pragma once

#include "frame_sampler.hpp"
#include "time_series_index.hpp"
#include "vision_client.hpp"
#include <atomic>
#include <optional>
#include <string>

namespace video_timeline {

struct CaptionState {
  std::optional<std::string> previousDescription;
};

struct CaptionStep {
  std::string description;
  CaptionState next;
};

struct CaptionOptions {
  double transcriptPadding = 10.0;
  int maxImageSize = 0;
  const std::atomic<bool> *cancelFlag = nullptr;
};

// Each prompt quotes the previous frame's description, so frames are
// described strictly in order.
class CaptionPipeline {
public:
  static constexpr const char *kNoPreviousDescription =
      "No previous frame description available, this is the first frame";

  CaptionPipeline(VisionClient &client, const TimeSeriesIndex &transcript,
                  CaptionOptions options = {});

  std::string buildPrompt(double timestamp, const CaptionState &state) const;

  CaptionStep describe(const SampledFrame &frame, const CaptionState &acc);

  TimeSeriesIndex run(ScopedVideoSource &video, int stride);

private:
  VisionClient &client_;
  const TimeSeriesIndex &transcript_;
  CaptionOptions options_;
};

} // namespace video_timeline
