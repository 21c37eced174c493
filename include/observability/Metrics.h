/***
 * Name: pymarshal::obs::Metrics
 * Purpose: Collect simple per-stage timings and object geometry for visibility.
 * Inputs:
 *   - Calls to start/stop timers for named stages (Read, Decode, Encode, ...).
 *   - Geometry of the decoded object, counters and gauges recorded by the tool.
 * Outputs:
 *   - Human-readable text and JSON summaries, plus derived hints.
 * Theory of Operation:
 *   Uses steady_clock timestamps to measure durations. Stores a map from
 *   stage names to microseconds. Pass statistics are kept per pass name.
 *   Formatting is performed on demand.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "observability/Geometry.h"

namespace pymarshal::obs {

class Metrics {
 public:
  using Clock = std::chrono::steady_clock;

  void start(const std::string& name);
  void stop(const std::string& name);

  void setGeometry(ObjectGeometry geometry) { geom_ = geometry; }
  const std::optional<ObjectGeometry>& geometry() const { return geom_; }

  void setPassStat(const std::string& pass, const std::string& key, uint64_t value) { passStats_[pass][key] = value; }
  const auto& passStats() const { return passStats_; }

  void incCounter(const std::string& key, uint64_t delta = 1) { counters_[key] += delta; }
  void setCounter(const std::string& key, uint64_t value) { counters_[key] = value; }
  void setGauge(const std::string& key, uint64_t value) { gauges_[key] = value; }
  const auto& counters() const { return counters_; }
  const auto& gauges() const { return gauges_; }
  const std::map<std::string, uint64_t>& durations() const { return durations_us_; }

  std::string summaryText() const;
  std::string summaryJson() const;
  std::vector<std::string> hints() const;

 private:
  std::map<std::string, Clock::time_point> active_{};
  std::map<std::string, uint64_t> durations_us_{};
  std::optional<ObjectGeometry> geom_{};
  std::map<std::string, std::map<std::string, uint64_t>> passStats_{};
  std::map<std::string, uint64_t> counters_{};
  std::map<std::string, uint64_t> gauges_{};
};

}  // namespace pymarshal::obs
