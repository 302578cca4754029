#include <gtest/gtest.h>

#include "video_timeline/chunk_augmentor.hpp"

namespace video_timeline {
namespace {

nlohmann::json documentMetadata() {
  return {{"metadata", {{"fps", 30.0}}},
          {"frame_description", {{"2", "a red car"}, {"6", "an empty road"}}},
          {"transcript", {{"1", "hello"}, {"3", "world"}, {"6", "goodbye"}}}};
}

Chunk videoChunk(const std::string &content) {
  return Chunk::fromMetadata(content, {{"timestamp", 2.0}});
}

TEST(ChunkAugmentorTest, RebuildsFrameAndTranscriptContext) {
  AugmentationConfig config;
  config.transcriptPadding = 1.0;
  ChunkAugmentor augmentor(config);

  EXPECT_EQ(augmentor.augment(videoChunk("a red car"), documentMetadata()),
            "Frame description: a red car\n\nTranscript: hello\n\nworld");
}

TEST(ChunkAugmentorTest, ZeroPaddingUsesExactInstant) {
  ChunkAugmentor augmentor;
  EXPECT_EQ(augmentor.augment(videoChunk("a red car"), documentMetadata()),
            "Frame description: a red car\n\nTranscript: ");
}

TEST(ChunkAugmentorTest, TranscriptChunkIsAugmentedToo) {
  ChunkAugmentor augmentor;
  EXPECT_EQ(augmentor.augment(videoChunk("goodbye"), documentMetadata()),
            "Frame description: an empty road\n\nTranscript: goodbye");
}

TEST(ChunkAugmentorTest, RepeatedContentRendersOneBlockPerTime) {
  nlohmann::json metadata = {
      {"frame_description", {{"1", "a slide"}, {"4", "a slide"}}},
      {"transcript", {{"4", "next topic"}}}};
  ChunkAugmentor augmentor;

  EXPECT_EQ(augmentor.augment(videoChunk("a slide"), metadata),
            "Frame description: a slide\n\nTranscript: \n\n"
            "Frame description: a slide\n\nTranscript: next topic");
}

TEST(ChunkAugmentorTest, NonVideoChunkIsUnchanged) {
  Chunk chunk = Chunk::fromMetadata("a red car", {{"page", 3}});
  EXPECT_FALSE(chunk.videoOrigin.has_value());

  ChunkAugmentor augmentor;
  EXPECT_EQ(augmentor.augment(chunk, documentMetadata()), "a red car");
}

TEST(ChunkAugmentorTest, MissingOrMalformedMetadataFallsBack) {
  ChunkAugmentor augmentor;
  const Chunk chunk = videoChunk("a red car");

  EXPECT_EQ(augmentor.augment(chunk, nlohmann::json::object()), "a red car");
  EXPECT_EQ(augmentor.augment(chunk, {{"frame_description", "oops"},
                                      {"transcript", {{"1", "hello"}}}}),
            "a red car");
  EXPECT_EQ(augmentor.augment(chunk, {{"frame_description", {{"abc", "x"}}},
                                      {"transcript", {{"1", "hello"}}}}),
            "a red car");
  EXPECT_EQ(augmentor.augment(chunk, nlohmann::json::array()), "a red car");
}

TEST(ChunkAugmentorTest, UnknownTextFallsBack) {
  ChunkAugmentor augmentor;
  EXPECT_EQ(augmentor.augment(videoChunk("a blue bus"), documentMetadata()),
            "a blue bus");
}

TEST(ChunkTest, TimestampKeyMarksVideoOrigin) {
  Chunk chunk = Chunk::fromMetadata("x", {{"timestamp", 12.5}});
  ASSERT_TRUE(chunk.videoOrigin.has_value());
  EXPECT_DOUBLE_EQ(chunk.videoOrigin->timestampHint.value_or(-1), 12.5);

  Chunk untimed = Chunk::fromMetadata("x", {{"timestamp", nullptr}});
  ASSERT_TRUE(untimed.videoOrigin.has_value());
  EXPECT_FALSE(untimed.videoOrigin->timestampHint.has_value());
}

} // namespace
} // namespace video_timeline
