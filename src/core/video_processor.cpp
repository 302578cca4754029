#include "video_timeline/video_processor.hpp"
#include "video_timeline/caption_pipeline.hpp"
#include "video_timeline/errors.hpp"

#include <iostream>
#include <stdexcept>

namespace video_timeline {

nlohmann::json ParseVideoResult::toJson() const {
  return nlohmann::json{
      {"metadata",
       {{"duration", metadata.duration},
        {"fps", metadata.fps},
        {"total_frames", metadata.totalFrames},
        {"frame_sample_rate", metadata.frameSampleRate}}},
      {"transcript", transcript.toJson()},
      {"frame_description", frameDescriptions.toJson()}};
}

VideoProcessor::VideoProcessor(Config config, TranscriptionService &transcriber,
                               VisionClient &vision,
                               VideoSourceFactory sourceFactory,
                               const std::atomic<bool> *cancelFlag)
    : config(std::move(config)), transcriber(transcriber), vision(vision),
      sourceFactory(std::move(sourceFactory)), cancelFlag(cancelFlag) {
  if (!this->sourceFactory) {
    this->sourceFactory = [] { return std::make_unique<OpenCvVideoSource>(); };
  }
}

ParseVideoResult VideoProcessor::process(const std::string &videoPath,
                                         std::optional<int> frameSampleRate) {
  std::cout << "Starting full video processing for " << videoPath
            << std::endl;
  int stride = 0;
  try {
    stride = config.resolveFrameSampleRate(videoPath, frameSampleRate);
  } catch (const std::invalid_argument &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    throw ConfigError(e.what());
  }

  try {
    ScopedVideoSource video(sourceFactory(), videoPath);
    const auto &info = video.info();
    std::cout << "Video loaded: " << info.duration << "s duration, "
              << info.fps << " FPS, " << info.totalFrames << " frames"
              << std::endl;

    ParseVideoResult result;
    result.metadata.duration = info.duration;
    result.metadata.fps = info.fps;
    result.metadata.totalFrames = info.totalFrames;
    result.metadata.frameSampleRate = stride;

    result.transcript = buildTranscript(transcriber, videoPath);

    if (stride == kCaptioningDisabled) {
      std::cout << "Frame captioning is disabled (frame_sample_rate = -1)"
                << std::endl;
    } else {
      CaptionOptions options;
      options.transcriptPadding = config.vision.transcriptPadding;
      options.maxImageSize = config.vision.maxImageSize;
      options.cancelFlag = cancelFlag;
      CaptionPipeline captions(vision, result.transcript, options);
      result.frameDescriptions = captions.run(video, stride);
    }

    video.release();
    std::cout << "Video processing completed successfully" << std::endl;
    return result;
  } catch (const VideoTimelineError &e) {
    std::cerr << "Error: Video processing failed at stage '" << e.stage()
              << "': " << e.what() << std::endl;
    throw;
  }
}

} // namespace video_timeline
