#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace video_timeline {

constexpr int kCaptioningDisabled = -1;

struct ModelConfig {
  std::string modelName;
  std::string apiBase;
  bool vision = false;
  // Every other key of the registered model entry, forwarded verbatim into
  // the completion request.
  nlohmann::json extraParams = nlohmann::json::object();
};

struct VisionConfig {
  std::string model;
  double transcriptPadding = 10.0;
  int maxImageSize = 0; // 0 = send frames at native resolution
  long timeoutSeconds = 120;
};

struct TranscriptionConfig {
  std::string baseUrl = "https://api.assemblyai.com";
  long pollIntervalMs = 3000;
  long timeoutSeconds = 1800;
  bool speakerLabels = true;
};

struct AugmentationConfig {
  double framePadding = 0.0;
  double transcriptPadding = 0.0;
};

struct Config {
  int frameSampleRate = 120;
  // Per-video stride overrides keyed by file name.
  std::map<std::string, int> videoOverrides;
  VisionConfig vision;
  std::map<std::string, ModelConfig> registeredModels;
  TranscriptionConfig transcription;
  AugmentationConfig augmentation;

  // Explicit argument, then the override for the file name, then the
  // default. Throws std::invalid_argument unless the result is -1 or >= 1.
  int resolveFrameSampleRate(const std::string &videoPath,
                             std::optional<int> explicitRate) const;

  const ModelConfig &visionModel() const;
};

Config configFromJson(const nlohmann::json &json);

Config loadConfig(const std::string &path);

std::optional<std::string> getEnvVar(std::string_view key);

} // namespace video_timeline
