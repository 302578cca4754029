#include "video_timeline/caption_pipeline.hpp"
#include "video_timeline/errors.hpp"
#include "video_timeline/image_processing.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace video_timeline {

CaptionPipeline::CaptionPipeline(VisionClient &client,
                                 const TimeSeriesIndex &transcript,
                                 CaptionOptions options)
    : client_(client), transcript_(transcript), options_(options) {}

std::string CaptionPipeline::buildPrompt(double timestamp,
                                         const CaptionState &state) const {
  std::ostringstream prompt;
  prompt << "Describe this frame from a video. Focus on the main elements, "
            "actions, and any notable details. Here is the transcript around "
            "the time of the frame:\n"
         << "---\n"
         << transcript_.at(timestamp, options_.transcriptPadding) << "\n"
         << "---\n\n"
         << "Here is a description of the previous frame:\n"
         << "---\n"
         << state.previousDescription.value_or(kNoPreviousDescription) << "\n"
         << "---\n\n"
         << "In your response, only provide the description of the current "
            "frame, using the above information as context.\n";
  return prompt.str();
}

CaptionStep CaptionPipeline::describe(const SampledFrame &frame,
                                      const CaptionState &acc) {
  std::ostringstream at;
  at << std::fixed << std::setprecision(2) << frame.timestamp;
  std::cout << "Processing frame " << frame.index << " at " << at.str() << "s"
            << std::endl;

  std::string image = ImageProcessing::encodeFrame(frame.image,
                                                   options_.maxImageSize);
  std::string description =
      client_.describeFrame(image, buildPrompt(frame.timestamp, acc));

  CaptionStep step;
  step.description = description;
  step.next.previousDescription = std::move(description);
  return step;
}

TimeSeriesIndex CaptionPipeline::run(ScopedVideoSource &video, int stride) {
  std::cout << "Starting frame description generation" << std::endl;

  TimeSeriesIndex descriptions;
  CaptionState state;
  FrameSampler sampler(stride);
  sampler.run(
      video,
      [&](const SampledFrame &frame) {
        if (options_.cancelFlag && options_.cancelFlag->load()) {
          throw ProcessingCancelled("Captioning cancelled");
        }
        CaptionStep step = describe(frame, state);
        descriptions.insert(frame.timestamp, step.description);
        state = std::move(step.next);
      },
      options_.cancelFlag);

  std::cout << "Generated descriptions for " << descriptions.size()
            << " frames" << std::endl;
  return descriptions;
}

} // namespace video_timeline
