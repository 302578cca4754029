#include "video_timeline/transcription.hpp"
#include "video_timeline/curl_wrapper.hpp"
#include "video_timeline/errors.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>

namespace video_timeline {

TimeSeriesIndex buildTranscript(TranscriptionService &service,
                                const std::string &mediaPath) {
  std::cout << "Starting video transcription" << std::endl;
  TranscriptResult result = service.transcribe(mediaPath);
  if (result.status == TranscriptResult::Status::Error) {
    std::cerr << "Error: Transcription failed: " << result.error << std::endl;
    throw TranscriptionError("Transcription failed: " + result.error);
  }

  TimeSeriesIndex transcript;
  if (result.utterances.empty()) {
    std::cerr << "Warning: No utterances found in transcript for "
              << mediaPath << std::endl;
    return transcript;
  }

  for (const auto &utterance : result.utterances) {
    // Provider timestamps are milliseconds.
    transcript.insert(utterance.startMs / 1000.0, utterance.text);
  }
  std::cout << "Transcription completed: " << transcript.size()
            << " utterances" << std::endl;
  return transcript;
}

AssemblyAiTranscriber::AssemblyAiTranscriber(const TranscriptionConfig &config,
                                             const std::string &apiKey,
                                             const std::atomic<bool> *cancelFlag)
    : config(config), apiKey(apiKey), cancelFlag(cancelFlag) {}

void AssemblyAiTranscriber::checkCancelled() const {
  if (cancelFlag && cancelFlag->load()) {
    throw ProcessingCancelled("Transcription cancelled");
  }
}

nlohmann::json
AssemblyAiTranscriber::prepareRequest(const std::string &audioUrl) const {
  return nlohmann::json{{"audio_url", audioUrl},
                        {"speaker_labels", config.speakerLabels}};
}

bool AssemblyAiTranscriber::isTerminal(const nlohmann::json &transcript) {
  const std::string status = transcript.value("status", "");
  return status == "completed" || status == "error";
}

TranscriptResult
AssemblyAiTranscriber::parseTranscript(const nlohmann::json &transcript) {
  TranscriptResult result;
  const std::string status = transcript.value("status", "");
  if (status == "error") {
    result.status = TranscriptResult::Status::Error;
    result.error = transcript.contains("error") && transcript["error"].is_string()
                       ? transcript["error"].get<std::string>()
                       : std::string("unknown error");
    return result;
  }
  if (status != "completed") {
    result.status = TranscriptResult::Status::Error;
    result.error = "unexpected transcript status '" + status + "'";
    return result;
  }

  const auto it = transcript.find("utterances");
  if (it == transcript.end() || !it->is_array()) {
    return result;
  }
  for (const auto &u : *it) {
    Utterance utterance;
    utterance.startMs = u.value("start", int64_t{0});
    utterance.endMs = u.value("end", int64_t{0});
    utterance.text = u.value("text", "");
    if (u.contains("speaker") && u["speaker"].is_string()) {
      utterance.speaker = u["speaker"].get<std::string>();
    }
    result.utterances.push_back(std::move(utterance));
  }
  return result;
}

std::string AssemblyAiTranscriber::upload(const std::string &mediaPath) {
  std::ifstream file(mediaPath, std::ios::binary);
  if (!file.is_open()) {
    throw TranscriptionError("Unable to open media file: " + mediaPath);
  }
  const auto size = std::filesystem::file_size(mediaPath);

  CurlWrapper curl;
  std::string response =
      curl.setUrl(config.baseUrl + "/v2/upload")
          .setUploadStream(file, static_cast<curl_off_t>(size))
          .addHeader("Content-Type: application/octet-stream")
          .addHeader("Authorization: " + apiKey)
          .setTimeoutSeconds(config.timeoutSeconds)
          .setCancelFlag(cancelFlag)
          .perform();
  return nlohmann::json::parse(response).at("upload_url").get<std::string>();
}

std::string AssemblyAiTranscriber::submit(const std::string &audioUrl) {
  CurlWrapper curl;
  std::string response = curl.setUrl(config.baseUrl + "/v2/transcript")
                             .setPostFields(prepareRequest(audioUrl).dump())
                             .addHeader("Content-Type: application/json")
                             .addHeader("Authorization: " + apiKey)
                             .setTimeoutSeconds(config.timeoutSeconds)
                             .setCancelFlag(cancelFlag)
                             .perform();
  return nlohmann::json::parse(response).at("id").get<std::string>();
}

nlohmann::json AssemblyAiTranscriber::fetch(const std::string &transcriptId) {
  CurlWrapper curl;
  std::string response =
      curl.setUrl(config.baseUrl + "/v2/transcript/" + transcriptId)
          .setGet()
          .addHeader("Authorization: " + apiKey)
          .setTimeoutSeconds(config.timeoutSeconds)
          .setCancelFlag(cancelFlag)
          .perform();
  return nlohmann::json::parse(response);
}

TranscriptResult
AssemblyAiTranscriber::transcribe(const std::string &mediaPath) {
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::seconds(config.timeoutSeconds);
  try {
    checkCancelled();
    std::string audioUrl = upload(mediaPath);
    checkCancelled();
    std::string transcriptId = submit(audioUrl);
    std::cout << "Submitted transcript " << transcriptId << std::endl;

    while (true) {
      checkCancelled();
      nlohmann::json transcript = fetch(transcriptId);
      if (isTerminal(transcript)) {
        return parseTranscript(transcript);
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        throw TranscriptionError("Transcription timed out after " +
                                 std::to_string(config.timeoutSeconds) + "s");
      }
      std::this_thread::sleep_for(
          std::chrono::milliseconds(config.pollIntervalMs));
    }
  } catch (const VideoTimelineError &) {
    throw;
  } catch (const nlohmann::json::exception &e) {
    throw TranscriptionError(std::string("Malformed AssemblyAI response: ") +
                             e.what());
  } catch (const std::filesystem::filesystem_error &e) {
    throw TranscriptionError(std::string("Unable to read media file: ") +
                             e.what());
  } catch (const std::runtime_error &e) {
    throw TranscriptionError(std::string("AssemblyAI request failed: ") +
                             e.what());
  }
}

} // namespace video_timeline
