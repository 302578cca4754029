#pragma once

#include <gmock/gmock.h>

#include <memory>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "video_timeline/errors.hpp"
#include "video_timeline/transcription.hpp"
#include "video_timeline/video_source_interface.hpp"
#include "video_timeline/vision_client.hpp"

namespace video_timeline::test {

// Nothing listens on the discard port, so connections are refused at once.
constexpr const char *kRefusedUrl = "http://127.0.0.1:9";

// Counters outlive the source so tests can inspect them after the
// processor has destroyed it.
struct SourceStats {
  int opens = 0;
  int releases = 0;
  int reads = 0;
};

class FakeVideoSource : public IVideoSource {
public:
  FakeVideoSource(std::shared_ptr<SourceStats> stats, int readableFrames,
                  double fps, int reportedFrames, bool openSucceeds = true)
      : stats_(std::move(stats)), readable_(readableFrames), fps_(fps),
        reported_(reportedFrames), openSucceeds_(openSucceeds) {}

  bool open(const std::string &) override {
    ++stats_->opens;
    opened_ = openSucceeds_;
    return opened_;
  }
  bool isOpened() const override { return opened_; }
  void release() override {
    ++stats_->releases;
    opened_ = false;
  }
  bool read(cv::OutputArray image) override {
    if (!opened_ || next_ >= readable_) {
      return false;
    }
    ++stats_->reads;
    cv::Mat frame(16, 16, CV_8UC3, cv::Scalar(next_ % 256, 64, 128));
    frame.copyTo(image);
    ++next_;
    return true;
  }
  double get(int propId) const override {
    if (propId == cv::CAP_PROP_FPS) {
      return fps_;
    }
    if (propId == cv::CAP_PROP_FRAME_COUNT) {
      return reported_;
    }
    return 0.0;
  }

private:
  std::shared_ptr<SourceStats> stats_;
  int readable_;
  double fps_;
  int reported_;
  bool openSucceeds_;
  bool opened_ = false;
  int next_ = 0;
};

inline VideoSourceFactory fakeFactory(std::shared_ptr<SourceStats> stats,
                                      int readableFrames, double fps,
                                      int reportedFrames,
                                      bool openSucceeds = true) {
  return [=] {
    return std::make_unique<FakeVideoSource>(stats, readableFrames, fps,
                                             reportedFrames, openSucceeds);
  };
}

// Answers "frame-1", "frame-2", ... and keeps every prompt it was sent.
class RecordingVisionClient : public VisionClient {
public:
  std::string describeFrame(const std::string &imageBase64,
                            const std::string &prompt) override {
    if (failOnCall > 0 && static_cast<int>(prompts.size()) + 1 == failOnCall) {
      throw VisionServiceError("vision backend unavailable");
    }
    images.push_back(imageBase64);
    prompts.push_back(prompt);
    return "frame-" + std::to_string(prompts.size());
  }

  std::vector<std::string> prompts;
  std::vector<std::string> images;
  int failOnCall = 0;
};

class MockTranscriptionService : public TranscriptionService {
public:
  MOCK_METHOD(TranscriptResult, transcribe, (const std::string &mediaPath),
              (override));
};

inline TranscriptResult completedTranscript(std::vector<Utterance> utterances) {
  TranscriptResult result;
  result.status = TranscriptResult::Status::Completed;
  result.utterances = std::move(utterances);
  return result;
}

} // namespace video_timeline::test
