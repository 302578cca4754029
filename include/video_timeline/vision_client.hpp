#pragma once

#include "config.hpp"
#include <atomic>
#include <nlohmann/json.hpp>
#include <string>

namespace video_timeline {

class VisionClient {
public:
  virtual ~VisionClient() = default;

  // imageBase64 is a JPEG. Throws VisionServiceError on failure.
  virtual std::string describeFrame(const std::string &imageBase64,
                                    const std::string &prompt) = 0;
};

// Model names containing "ollama" use Ollama's /api/chat, everything else an
// OpenAI-compatible /v1/chat/completions.
class VisionModelClient : public VisionClient {
public:
  VisionModelClient(const ModelConfig &model, const std::string &authToken,
                    long timeoutSeconds = 120,
                    const std::atomic<bool> *cancelFlag = nullptr);

  std::string describeFrame(const std::string &imageBase64,
                            const std::string &prompt) override;

  // Public for testing
  nlohmann::json preparePayload(const std::string &imageBase64,
                                const std::string &prompt) const;
  std::string endpoint() const;
  std::string parseResponse(const std::string &response) const;
  bool isOllama() const;

  static constexpr const char *kSystemPrompt =
      "You are a video frame description assistant. Describe the frame "
      "clearly and concisely.";

private:
  ModelConfig model;
  std::string token;
  long timeoutSeconds;
  const std::atomic<bool> *cancelFlag;
};

} // namespace video_timeline
