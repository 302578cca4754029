#include "video_timeline/config.hpp"
#include "video_timeline/errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace video_timeline {

namespace {

void validateStride(int rate) {
  if (rate != kCaptioningDisabled && rate < 1) {
    throw std::invalid_argument("frame_sample_rate must be -1 or >= 1, got " +
                                std::to_string(rate));
  }
}

ModelConfig parseModel(const std::string &key, const nlohmann::json &entry) {
  if (!entry.is_object()) {
    throw ConfigError("registered_models." + key + " must be an object");
  }
  ModelConfig model;
  model.modelName = entry.value("model_name", "");
  model.apiBase = entry.value("api_base", "");
  model.vision = entry.value("vision", false);
  for (const auto &item : entry.items()) {
    if (item.key() != "model_name" && item.key() != "api_base" &&
        item.key() != "vision") {
      model.extraParams[item.key()] = item.value();
    }
  }
  if (model.modelName.empty()) {
    throw ConfigError("registered_models." + key + " has no model_name");
  }
  return model;
}

} // namespace

int Config::resolveFrameSampleRate(const std::string &videoPath,
                                   std::optional<int> explicitRate) const {
  int rate = frameSampleRate;
  if (explicitRate) {
    rate = *explicitRate;
  } else {
    const std::string name =
        std::filesystem::path(videoPath).filename().string();
    auto it = videoOverrides.find(name);
    if (it != videoOverrides.end()) {
      rate = it->second;
    }
  }
  validateStride(rate);
  return rate;
}

const ModelConfig &Config::visionModel() const {
  auto it = registeredModels.find(vision.model);
  if (it == registeredModels.end()) {
    throw ConfigError("Model '" + vision.model +
                      "' not found in registered_models configuration");
  }
  return it->second;
}

Config configFromJson(const nlohmann::json &json) {
  if (!json.is_object()) {
    throw ConfigError("Configuration root must be a JSON object");
  }

  Config config;
  try {
    config.frameSampleRate =
        json.value("frame_sample_rate", config.frameSampleRate);
    validateStride(config.frameSampleRate);

    if (json.contains("video_overrides")) {
      for (const auto &item : json.at("video_overrides").items()) {
        int rate = item.value().at("frame_sample_rate").get<int>();
        validateStride(rate);
        config.videoOverrides[item.key()] = rate;
      }
    }

    if (json.contains("vision")) {
      const auto &vision = json.at("vision");
      config.vision.model = vision.value("model", config.vision.model);
      config.vision.transcriptPadding =
          vision.value("transcript_padding", config.vision.transcriptPadding);
      config.vision.maxImageSize =
          vision.value("max_image_size", config.vision.maxImageSize);
      config.vision.timeoutSeconds =
          vision.value("timeout_seconds", config.vision.timeoutSeconds);
    }

    if (json.contains("registered_models")) {
      for (const auto &item : json.at("registered_models").items()) {
        config.registeredModels.emplace(item.key(),
                                        parseModel(item.key(), item.value()));
      }
    }

    if (json.contains("transcription")) {
      const auto &t = json.at("transcription");
      config.transcription.baseUrl =
          t.value("base_url", config.transcription.baseUrl);
      config.transcription.pollIntervalMs =
          t.value("poll_interval_ms", config.transcription.pollIntervalMs);
      config.transcription.timeoutSeconds =
          t.value("timeout_seconds", config.transcription.timeoutSeconds);
      config.transcription.speakerLabels =
          t.value("speaker_labels", config.transcription.speakerLabels);
    }

    if (json.contains("augmentation")) {
      const auto &a = json.at("augmentation");
      config.augmentation.framePadding =
          a.value("frame_padding", config.augmentation.framePadding);
      config.augmentation.transcriptPadding =
          a.value("transcript_padding", config.augmentation.transcriptPadding);
    }
  } catch (const nlohmann::json::exception &e) {
    throw ConfigError(std::string("Invalid configuration: ") + e.what());
  } catch (const std::invalid_argument &e) {
    throw ConfigError(std::string("Invalid configuration: ") + e.what());
  }

  if (!config.vision.model.empty()) {
    auto it = config.registeredModels.find(config.vision.model);
    if (it != config.registeredModels.end() && !it->second.vision) {
      std::cerr << "Warning: Model '" << config.vision.model
                << "' does not have vision capability marked in config"
                << std::endl;
    }
  }
  return config;
}

Config loadConfig(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError("Could not open config file: " + path);
  }
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(file);
  } catch (const nlohmann::json::parse_error &e) {
    throw ConfigError("Failed to parse config file " + path + ": " + e.what());
  }
  return configFromJson(json);
}

std::optional<std::string> getEnvVar(std::string_view key) {
  if (auto val = std::getenv(std::string(key).c_str()))
    return std::string(val);
  return std::nullopt;
}

} // namespace video_timeline
