#include "video_timeline/chunk_augmentor.hpp"
#include "video_timeline/time_series_index.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace video_timeline {

Chunk Chunk::fromMetadata(std::string content, nlohmann::json metadata) {
  Chunk chunk;
  chunk.content = std::move(content);
  if (metadata.is_object()) {
    auto it = metadata.find("timestamp");
    if (it != metadata.end()) {
      VideoOrigin origin;
      if (it->is_number()) {
        origin.timestampHint = it->get<double>();
      }
      chunk.videoOrigin = origin;
    }
  }
  chunk.metadata = std::move(metadata);
  return chunk;
}

ChunkAugmentor::ChunkAugmentor(AugmentationConfig config) : config(config) {}

std::string ChunkAugmentor::augment(
    const Chunk &chunk, const nlohmann::json &documentMetadata) const noexcept {
  try {
    if (!chunk.videoOrigin) {
      return chunk.content;
    }

    const auto frameIt = documentMetadata.is_object()
                             ? documentMetadata.find("frame_description")
                             : documentMetadata.end();
    const auto transcriptIt = documentMetadata.is_object()
                                  ? documentMetadata.find("transcript")
                                  : documentMetadata.end();
    if (frameIt == documentMetadata.end() ||
        transcriptIt == documentMetadata.end() || !frameIt->is_object() ||
        !transcriptIt->is_object()) {
      std::cerr << "Warning: Invalid frame description or transcript - not a "
                   "dictionary"
                << std::endl;
      return chunk.content;
    }

    const TimeSeriesIndex frames = TimeSeriesIndex::fromJson(*frameIt);
    const TimeSeriesIndex transcript = TimeSeriesIndex::fromJson(*transcriptIt);

    std::vector<double> times = frames.timesFor(chunk.content);
    std::vector<double> spoken = transcript.timesFor(chunk.content);
    times.insert(times.end(), spoken.begin(), spoken.end());
    std::sort(times.begin(), times.end());
    times.erase(std::unique(times.begin(), times.end()), times.end());

    if (times.empty()) {
      return chunk.content;
    }

    std::string augmented;
    for (double t : times) {
      if (!augmented.empty()) {
        augmented += "\n\n";
      }
      augmented += "Frame description: " + frames.at(t, config.framePadding) +
                   "\n\nTranscript: " +
                   transcript.at(t, config.transcriptPadding);
    }
    return augmented;
  } catch (const std::exception &e) {
    std::cerr << "Warning: Could not augment video chunk: " << e.what()
              << std::endl;
    return chunk.content;
  }
}

} // namespace video_timeline
