#pragma once

#include "config.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace video_timeline {

struct VideoOrigin {
  std::optional<double> timestampHint;
};

struct Chunk {
  std::string content;
  nlohmann::json metadata = nlohmann::json::object();
  std::optional<VideoOrigin> videoOrigin;

  // A "timestamp" metadata key marks a video chunk.
  static Chunk fromMetadata(std::string content, nlohmann::json metadata);
};

/**
 * Rebuilds a video chunk's context from the parent document's
 * "frame_description" and "transcript" metadata, one block per time the
 * chunk's text was stored at:
 *
 *   Frame description: <frames around t>
 *
 *   Transcript: <transcript around t>
 *
 * Falls back to the raw content when there is nothing to rebuild. Only
 * allocation failure escapes, and noexcept turns it into std::terminate.
 */
class ChunkAugmentor {
public:
  explicit ChunkAugmentor(AugmentationConfig config = {});

  std::string augment(const Chunk &chunk,
                      const nlohmann::json &documentMetadata) const noexcept;

private:
  AugmentationConfig config;
};

} // namespace video_timeline
