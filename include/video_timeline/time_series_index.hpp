#pragma once

#include <cstddef>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace video_timeline {

/**
 * @brief Bidirectional time <-> content index for one time series of a video
 * (transcript utterances or frame descriptions).
 *
 * Times are seconds from the start of the video. Each time holds exactly one
 * content string; inserting at an existing time replaces the old content.
 * The same content may be stored at many times and timesFor() returns all of
 * them.
 *
 * Not synchronized: one producer fills the index, readers only see it once
 * the producer is done.
 */
class TimeSeriesIndex {
public:
  static constexpr const char *kSeparator = "\n\n";

  TimeSeriesIndex() = default;

  // Replaces whatever was stored at time.
  void insert(double time, const std::string &content);

  // Contents in [time - padding, time + padding], oldest first, joined with
  // kSeparator.
  std::string at(double time, double padding = 0.0) const;

  std::vector<std::string> window(double time, double padding = 0.0) const;

  std::vector<double> timesFor(const std::string &content) const;

  const std::map<double, std::string> &entries() const { return entries_; }
  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  // {"<time>": "<content>"}, keys printed with 17 significant digits so they
  // parse back to the same double.
  nlohmann::json toJson() const;

  static TimeSeriesIndex fromJson(const nlohmann::json &json);

  static std::string formatTime(double time);

private:
  std::map<double, std::string> entries_;
  std::unordered_map<std::string, std::vector<double>> reverse_;

  void unlinkReverse(const std::string &content, double time);
};

} // namespace video_timeline
