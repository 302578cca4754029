#include <cxxopts.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "video_timeline/chunk_augmentor.hpp"
#include "video_timeline/config.hpp"
#include "video_timeline/errors.hpp"
#include "video_timeline/transcription.hpp"
#include "video_timeline/video_processor.hpp"
#include "video_timeline/vision_client.hpp"

namespace fs = std::filesystem;
using namespace video_timeline;

namespace {

int runParse(const cxxopts::ParseResult &result, const Config &config) {
  if (!result.count("input")) {
    std::cerr << "Error: Video file must be specified" << std::endl;
    return 1;
  }
  const std::string videoPath = result["input"].as<std::string>();
  if (!fs::exists(videoPath)) {
    std::cerr << "Error: Video file does not exist: " << videoPath
              << std::endl;
    return 1;
  }

  auto assemblyKey = getEnvVar("ASSEMBLYAI_API_KEY");
  if (!assemblyKey) {
    std::cerr << "Error: ASSEMBLYAI_API_KEY environment variable is not set."
              << std::endl;
    return 1;
  }

  std::optional<int> frameSampleRate;
  if (result.count("frame-sample-rate")) {
    frameSampleRate = result["frame-sample-rate"].as<int>();
  }
  const int stride = config.resolveFrameSampleRate(videoPath, frameSampleRate);

  // The vision model only has to be registered when frames are captioned.
  ModelConfig model;
  if (stride != kCaptioningDisabled) {
    model = config.visionModel();
  }
  VisionModelClient vision(model, getEnvVar("VISION_API_KEY").value_or(""),
                           config.vision.timeoutSeconds);
  AssemblyAiTranscriber transcriber(config.transcription, *assemblyKey);

  VideoProcessor processor(config, transcriber, vision);
  ParseVideoResult parsed = processor.process(videoPath, stride);

  const std::string output = result["output"].as<std::string>();
  if (output.empty() || output == "-") {
    std::cout << parsed.toJson().dump(2) << std::endl;
  } else {
    std::ofstream out(output);
    if (!out.is_open()) {
      std::cerr << "Error: Could not write output file: " << output
                << std::endl;
      return 1;
    }
    out << parsed.toJson().dump(2) << std::endl;
    std::cout << "Wrote " << output << std::endl;
  }
  return 0;
}

int runAugment(const cxxopts::ParseResult &result, const Config &config) {
  if (!result.count("document") || !result.count("text")) {
    std::cerr << "Error: augment needs --document and --text" << std::endl;
    return 1;
  }

  const std::string documentPath = result["document"].as<std::string>();
  std::ifstream file(documentPath);
  if (!file.is_open()) {
    std::cerr << "Error: Could not open document metadata: " << documentPath
              << std::endl;
    return 1;
  }
  nlohmann::json document = nlohmann::json::parse(file);

  nlohmann::json chunkMetadata = nlohmann::json::object();
  if (result["timestamp"].as<bool>()) {
    chunkMetadata["timestamp"] = nullptr;
  }
  Chunk chunk =
      Chunk::fromMetadata(result["text"].as<std::string>(), chunkMetadata);

  ChunkAugmentor augmentor(config.augmentation);
  std::cout << augmentor.augment(chunk, document) << std::endl;
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  cxxopts::Options options(
      "video_timeline",
      "Index video transcripts and frame descriptions on a shared timeline");
  options.add_options()
      ("h,help", "Print help")
      ("command", "parse | augment", cxxopts::value<std::string>())
      ("input", "Video file (parse)", cxxopts::value<std::string>())
      ("c,config", "JSON configuration file", cxxopts::value<std::string>())
      ("r,frame-sample-rate", "Caption every Nth frame, -1 disables captioning",
       cxxopts::value<int>())
      ("o,output", "Output JSON file (parse), '-' for stdout",
       cxxopts::value<std::string>()->default_value("-"))
      ("d,document", "Document metadata JSON (augment)",
       cxxopts::value<std::string>())
      ("t,text", "Chunk content (augment)", cxxopts::value<std::string>())
      ("timestamp", "Chunk originates from a video instant (augment)",
       cxxopts::value<bool>()->default_value("true"));
  options.parse_positional({"command", "input"});
  options.positional_help("<parse|augment> [video]");

  try {
    auto result = options.parse(argc, argv);

    if (result.count("help") || !result.count("command")) {
      std::cout << options.help() << std::endl;
      return result.count("help") ? 0 : 1;
    }

    Config config;
    if (result.count("config")) {
      config = loadConfig(result["config"].as<std::string>());
    }

    const std::string command = result["command"].as<std::string>();
    if (command == "parse") {
      return runParse(result, config);
    } else if (command == "augment") {
      return runAugment(result, config);
    }
    std::cerr << "Error: Invalid command: " << command << std::endl;
    return 1;
  } catch (const VideoTimelineError &e) {
    std::cerr << "Error [" << e.stage() << "]: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
