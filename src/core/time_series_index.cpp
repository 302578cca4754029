#include "video_timeline/time_series_index.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace video_timeline {

void TimeSeriesIndex::insert(double time, const std::string &content) {
  if (!std::isfinite(time) || time < 0.0) {
    throw std::invalid_argument("Invalid time for index entry: " +
                                std::to_string(time));
  }

  auto it = entries_.find(time);
  if (it != entries_.end()) {
    if (it->second == content) {
      return;
    }
    // Last write wins; drop the stale reverse link first.
    unlinkReverse(it->second, time);
    it->second = content;
  } else {
    entries_.emplace(time, content);
  }

  std::vector<double> &times = reverse_[content];
  times.insert(std::lower_bound(times.begin(), times.end(), time), time);
}

void TimeSeriesIndex::unlinkReverse(const std::string &content, double time) {
  auto it = reverse_.find(content);
  if (it == reverse_.end()) {
    return;
  }
  std::vector<double> &times = it->second;
  auto pos = std::lower_bound(times.begin(), times.end(), time);
  if (pos != times.end() && *pos == time) {
    times.erase(pos);
  }
  if (times.empty()) {
    reverse_.erase(it);
  }
}

std::vector<std::string> TimeSeriesIndex::window(double time,
                                                 double padding) const {
  if (padding < 0.0 || std::isnan(padding)) {
    throw std::invalid_argument("Padding must be non-negative");
  }

  std::vector<std::string> matches;
  auto first = entries_.lower_bound(time - padding);
  auto last = entries_.upper_bound(time + padding);
  for (auto it = first; it != last; ++it) {
    matches.push_back(it->second);
  }
  return matches;
}

std::string TimeSeriesIndex::at(double time, double padding) const {
  std::string joined;
  bool first = true;
  for (const auto &content : window(time, padding)) {
    if (!first) {
      joined += kSeparator;
    }
    joined += content;
    first = false;
  }
  return joined;
}

std::vector<double>
TimeSeriesIndex::timesFor(const std::string &content) const {
  auto it = reverse_.find(content);
  if (it == reverse_.end()) {
    return {};
  }
  return it->second;
}

std::string TimeSeriesIndex::formatTime(double time) {
  std::ostringstream out;
  out.imbue(std::locale::classic());
  out << std::setprecision(std::numeric_limits<double>::max_digits10) << time;
  return out.str();
}

nlohmann::json TimeSeriesIndex::toJson() const {
  nlohmann::json json = nlohmann::json::object();
  for (const auto &[time, content] : entries_) {
    json[formatTime(time)] = content;
  }
  return json;
}

TimeSeriesIndex TimeSeriesIndex::fromJson(const nlohmann::json &json) {
  if (!json.is_object()) {
    throw std::invalid_argument("Time series must be a JSON object, got " +
                                std::string(json.type_name()));
  }

  TimeSeriesIndex index;
  for (const auto &item : json.items()) {
    const std::string &key = item.key();
    std::istringstream in(key);
    in.imbue(std::locale::classic());
    double time = 0.0;
    in >> time;
    if (in.fail() || in.peek() != std::char_traits<char>::eof()) {
      throw std::invalid_argument("Time key is not a number: '" + key + "'");
    }
    if (!item.value().is_string()) {
      throw std::invalid_argument("Content at time '" + key +
                                  "' is not a string");
    }
    index.insert(time, item.value().get<std::string>());
  }
  return index;
}

} // namespace video_timeline
