#include "video_timeline/vision_client.hpp"
#include "video_timeline/curl_wrapper.hpp"
#include "video_timeline/errors.hpp"
#include <algorithm>
#include <cctype>

namespace video_timeline {

namespace {

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string trimTrailingSlash(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

} // namespace

VisionModelClient::VisionModelClient(const ModelConfig &model,
                                     const std::string &authToken,
                                     long timeoutSeconds,
                                     const std::atomic<bool> *cancelFlag)
    : model(model), token(authToken), timeoutSeconds(timeoutSeconds),
      cancelFlag(cancelFlag) {}

bool VisionModelClient::isOllama() const {
  return toLower(model.modelName).find("ollama") != std::string::npos;
}

std::string VisionModelClient::endpoint() const {
  if (isOllama()) {
    std::string base = model.apiBase.empty() ? "http://localhost:11434"
                                             : model.apiBase;
    return trimTrailingSlash(base) + "/api/chat";
  }
  std::string base =
      model.apiBase.empty() ? "https://api.openai.com" : model.apiBase;
  return trimTrailingSlash(base) + "/v1/chat/completions";
}

nlohmann::json
VisionModelClient::preparePayload(const std::string &imageBase64,
                                  const std::string &prompt) const {
  nlohmann::json payload;
  nlohmann::json systemMessage = {{"role", "system"},
                                  {"content", kSystemPrompt}};

  if (isOllama()) {
    // "ollama/llava" or "ollama_chat/llava" -> "llava"
    std::string name = model.modelName;
    size_t pos = name.find('/');
    if (pos != std::string::npos) {
      name = name.substr(pos + 1);
    }
    payload["model"] = name;
    payload["messages"] = {systemMessage,
                           {{"role", "user"},
                            {"content", prompt},
                            {"images", nlohmann::json::array({imageBase64})}}};
    payload["stream"] = false;
  } else {
    payload["model"] = model.modelName;
    payload["messages"] = {
        systemMessage,
        {{"role", "user"},
         {"content",
          {{{"type", "text"}, {"text", prompt}},
           {{"type", "image_url"},
            {"image_url",
             {{"url", "data:image/jpeg;base64," + imageBase64}}}}}}}};
    payload["max_tokens"] = 300;
    payload["stream"] = false;
  }

  for (const auto &item : model.extraParams.items()) {
    payload[item.key()] = item.value();
  }
  return payload;
}

std::string VisionModelClient::parseResponse(const std::string &response) const {
  nlohmann::json result;
  try {
    result = nlohmann::json::parse(response);
  } catch (const nlohmann::json::parse_error &e) {
    throw VisionServiceError(std::string("Unparseable vision response: ") +
                             e.what());
  }

  if (result.contains("error")) {
    throw VisionServiceError("Vision model returned an error: " +
                             result["error"].dump());
  }

  const nlohmann::json *message = nullptr;
  if (isOllama()) {
    if (result.contains("message")) {
      message = &result["message"];
    }
  } else if (result.contains("choices") && result["choices"].is_array() &&
             !result["choices"].empty() &&
             result["choices"][0].contains("message")) {
    message = &result["choices"][0]["message"];
  }

  if (!message || !message->contains("content") ||
      !(*message)["content"].is_string()) {
    throw VisionServiceError("Vision response has no message content: " +
                             response);
  }
  return (*message)["content"].get<std::string>();
}

std::string VisionModelClient::describeFrame(const std::string &imageBase64,
                                             const std::string &prompt) {
  if (cancelFlag && cancelFlag->load()) {
    throw ProcessingCancelled("Cancelled before vision request");
  }

  std::string payloadStr = preparePayload(imageBase64, prompt).dump();
  std::string response;
  try {
    CurlWrapper curl;
    curl.setUrl(endpoint())
        .setPostFields(payloadStr)
        .addHeader("Content-Type: application/json")
        .setTimeoutSeconds(timeoutSeconds)
        .setCancelFlag(cancelFlag);
    if (!token.empty()) {
      curl.addHeader("Authorization: Bearer " + token);
    }
    response = curl.perform();
  } catch (const ProcessingCancelled &) {
    throw;
  } catch (const std::runtime_error &e) {
    throw VisionServiceError(std::string("HTTP request failed: ") + e.what());
  }
  return parseResponse(response);
}

} // namespace video_timeline
