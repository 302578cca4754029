#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <vector>

#include "test_doubles.hpp"
#include "video_timeline/caption_pipeline.hpp"
#include "video_timeline/errors.hpp"
#include "video_timeline/frame_sampler.hpp"
#include "video_timeline/image_processing.hpp"

namespace video_timeline {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Not;
using test::FakeVideoSource;
using test::RecordingVisionClient;
using test::SourceStats;

std::unique_ptr<ScopedVideoSource> openFake(std::shared_ptr<SourceStats> stats,
                                            int readable, double fps,
                                            int reported) {
  return std::make_unique<ScopedVideoSource>(
      std::make_unique<FakeVideoSource>(stats, readable, fps, reported),
      "fake.mp4");
}

TEST(FrameSamplerTest, SamplesEveryStrideFrame) {
  auto stats = std::make_shared<SourceStats>();
  auto video = openFake(stats, 10, 2.0, 10);

  std::vector<int> indices;
  std::vector<double> timestamps;
  FrameSampler sampler(4);
  int sampled = sampler.run(*video, [&](const SampledFrame &frame) {
    indices.push_back(frame.index);
    timestamps.push_back(frame.timestamp);
  });

  EXPECT_EQ(sampled, 3);
  EXPECT_THAT(indices, ElementsAre(0, 4, 8));
  EXPECT_THAT(timestamps, ElementsAre(0.0, 2.0, 4.0));
  EXPECT_EQ(stats->reads, 10);
}

TEST(FrameSamplerTest, ShortReadEndsStreamQuietly) {
  auto stats = std::make_shared<SourceStats>();
  // Container claims 100 frames but only 5 decode.
  auto video = openFake(stats, 5, 25.0, 100);

  std::vector<int> indices;
  FrameSampler sampler(2);
  EXPECT_NO_THROW(sampler.run(*video, [&](const SampledFrame &frame) {
    indices.push_back(frame.index);
  }));
  EXPECT_THAT(indices, ElementsAre(0, 2, 4));
}

TEST(FrameSamplerTest, StopsAtReportedFrameCount) {
  auto stats = std::make_shared<SourceStats>();
  auto video = openFake(stats, 50, 10.0, 6);

  int sampled = FrameSampler(1).run(*video, [](const SampledFrame &) {});
  EXPECT_EQ(sampled, 6);
}

TEST(FrameSamplerTest, RejectsNonPositiveStride) {
  EXPECT_THROW(FrameSampler(0), std::invalid_argument);
  EXPECT_THROW(FrameSampler(-1), std::invalid_argument);
}

TEST(FrameSamplerTest, CancelFlagStopsBetweenFrames) {
  auto stats = std::make_shared<SourceStats>();
  auto video = openFake(stats, 10, 1.0, 10);
  std::atomic<bool> cancel{false};

  int seen = 0;
  EXPECT_THROW(FrameSampler(1).run(
                   *video,
                   [&](const SampledFrame &) {
                     if (++seen == 3) {
                       cancel = true;
                     }
                   },
                   &cancel),
               ProcessingCancelled);
  EXPECT_EQ(seen, 3);
}

TEST(CaptionPipelineTest, EachPromptCarriesPreviousDescription) {
  auto stats = std::make_shared<SourceStats>();
  auto video = openFake(stats, 12, 1.0, 12);
  TimeSeriesIndex transcript;
  RecordingVisionClient vision;

  CaptionPipeline pipeline(vision, transcript);
  TimeSeriesIndex descriptions = pipeline.run(*video, 3);

  ASSERT_EQ(vision.prompts.size(), 4u);
  EXPECT_THAT(vision.prompts[0],
              HasSubstr(CaptionPipeline::kNoPreviousDescription));
  for (size_t i = 1; i < vision.prompts.size(); ++i) {
    const std::string previous = "frame-" + std::to_string(i);
    EXPECT_THAT(vision.prompts[i], HasSubstr("---\n" + previous + "\n---"));
    EXPECT_THAT(vision.prompts[i],
                Not(HasSubstr(CaptionPipeline::kNoPreviousDescription)));
  }

  EXPECT_EQ(descriptions.size(), 4u);
  EXPECT_EQ(descriptions.at(0.0), "frame-1");
  EXPECT_EQ(descriptions.at(9.0), "frame-4");
}

TEST(CaptionPipelineTest, PromptQuotesTranscriptWindow) {
  TimeSeriesIndex transcript;
  transcript.insert(1.0, "far before");
  transcript.insert(25.0, "near the frame");
  transcript.insert(38.0, "far after");
  RecordingVisionClient vision;

  CaptionPipeline pipeline(vision, transcript);
  std::string prompt = pipeline.buildPrompt(30.0, CaptionState{});

  EXPECT_THAT(prompt, HasSubstr("near the frame"));
  EXPECT_THAT(prompt, HasSubstr("far after"));
  EXPECT_THAT(prompt, Not(HasSubstr("far before")));
}

TEST(CaptionPipelineTest, DescribeIsAFoldStep) {
  TimeSeriesIndex transcript;
  RecordingVisionClient vision;
  CaptionPipeline pipeline(vision, transcript);

  SampledFrame frame{0, 0.0, cv::Mat(8, 8, CV_8UC3, cv::Scalar(1, 2, 3))};
  CaptionState start;
  CaptionStep first = pipeline.describe(frame, start);
  CaptionStep second = pipeline.describe(frame, first.next);

  EXPECT_EQ(first.description, "frame-1");
  EXPECT_EQ(first.next.previousDescription.value_or(""), "frame-1");
  EXPECT_THAT(vision.prompts[1], HasSubstr("frame-1"));
  EXPECT_EQ(second.next.previousDescription.value_or(""), "frame-2");
}

TEST(CaptionPipelineTest, SendsJpegFrames) {
  TimeSeriesIndex transcript;
  RecordingVisionClient vision;
  CaptionPipeline pipeline(vision, transcript);

  SampledFrame frame{0, 0.0, cv::Mat(8, 8, CV_8UC3, cv::Scalar(9, 9, 9))};
  pipeline.describe(frame, CaptionState{});

  ASSERT_EQ(vision.images.size(), 1u);
  std::vector<unsigned char> jpg =
      ImageProcessing::decodeBase64(vision.images[0]);
  ASSERT_GE(jpg.size(), 2u);
  EXPECT_EQ(jpg[0], 0xFF);
  EXPECT_EQ(jpg[1], 0xD8);
}

TEST(CaptionPipelineTest, EmptyFrameIsEncodeError) {
  TimeSeriesIndex transcript;
  RecordingVisionClient vision;
  CaptionPipeline pipeline(vision, transcript);

  SampledFrame frame{0, 0.0, cv::Mat()};
  EXPECT_THROW(pipeline.describe(frame, CaptionState{}), FrameEncodeError);
  EXPECT_TRUE(vision.prompts.empty());
}

TEST(ImageProcessingTest, DownscalesToLongestSide) {
  cv::Mat wide(100, 400, CV_8UC3, cv::Scalar(0, 0, 0));
  cv::Mat resized = ImageProcessing::resizeImage(wide, 200);
  EXPECT_EQ(resized.cols, 200);
  EXPECT_EQ(resized.rows, 50);
}

} // namespace
} // namespace video_timeline
