#pragma once

#include "config.hpp"
#include "time_series_index.hpp"
#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace video_timeline {

struct Utterance {
  int64_t startMs = 0;
  int64_t endMs = 0;
  std::string text;
  std::string speaker;
};

struct TranscriptResult {
  enum class Status { Completed, Error };

  Status status = Status::Completed;
  std::string error;
  std::vector<Utterance> utterances;
};

// transcribe() blocks until the job reaches a terminal status.
class TranscriptionService {
public:
  virtual ~TranscriptionService() = default;
  virtual TranscriptResult transcribe(const std::string &mediaPath) = 0;
};

// Utterances indexed by start time in seconds.
TimeSeriesIndex buildTranscript(TranscriptionService &service,
                                const std::string &mediaPath);

class AssemblyAiTranscriber : public TranscriptionService {
public:
  AssemblyAiTranscriber(const TranscriptionConfig &config,
                        const std::string &apiKey,
                        const std::atomic<bool> *cancelFlag = nullptr);

  TranscriptResult transcribe(const std::string &mediaPath) override;

  // Public for testing
  nlohmann::json prepareRequest(const std::string &audioUrl) const;
  static TranscriptResult parseTranscript(const nlohmann::json &transcript);
  static bool isTerminal(const nlohmann::json &transcript);

protected:
  // One HTTP round trip each; upload() streams the file from disk.
  virtual std::string upload(const std::string &mediaPath);
  virtual std::string submit(const std::string &audioUrl);
  virtual nlohmann::json fetch(const std::string &transcriptId);

private:
  TranscriptionConfig config;
  std::string apiKey;
  const std::atomic<bool> *cancelFlag;

  void checkCancelled() const;
};

} // namespace video_timeline
