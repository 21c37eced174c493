/***
 * Name: pymarshal::obs::Metrics (impl)
 * Purpose: Implement simple timing, formatting and hints.
 */
#include "observability/Metrics.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <ios>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace pymarshal::obs {

namespace {
constexpr double kUsPerMs = 1000.0;
constexpr int kIndent4 = 4;
constexpr int kIndent6 = 6;
constexpr uint64_t kDeepNesting = 1000;

std::string to_lower_copy(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return s;
}

void appendDurations(std::ostringstream& oss, const std::map<std::string, uint64_t>& durations) {
  oss << "  \"durations_ms\": {";
  bool first = true;
  for (const auto& [key, val] : durations) {
    if (!first) {
      oss << ",";
    }
    first = false;
    const double millis = static_cast<double>(val) / kUsPerMs;
    // JSON uses lowercase stage keys
    oss << "\n    \"" << to_lower_copy(key) << "\": " << std::fixed << std::setprecision(3) << millis;
  }
  oss << "\n  }";
}

void appendGeometry(std::ostringstream& oss, const std::optional<ObjectGeometry>& geom) {
  if (!geom) {
    return;
  }
  oss << ",\n  \"object\": { \"nodes\": " << geom->nodes << ", \"max_depth\": " << geom->maxDepth
      << ", \"store_refs\": " << geom->storeRefs << ", \"load_refs\": " << geom->loadRefs << " }";
}

void appendKeyValueObject(std::ostringstream& oss, const std::map<std::string, uint64_t>& values, int indent) {
  const std::string pad(static_cast<std::size_t>(indent), ' ');
  bool first = true;
  for (const auto& [key, val] : values) {
    if (!first) {
      oss << ",";
    }
    first = false;
    oss << "\n" << pad << "\"" << key << "\": " << val;
  }
}

void appendSection(std::ostringstream& oss, const char* name, const std::map<std::string, uint64_t>& values) {
  if (values.empty()) {
    return;
  }
  oss << ",\n  \"" << name << "\": {";
  appendKeyValueObject(oss, values, kIndent4);
  oss << "\n  }";
}

void appendPasses(std::ostringstream& oss, const std::map<std::string, std::map<std::string, uint64_t>>& passes) {
  if (passes.empty()) {
    return;
  }
  oss << ",\n  \"passes\": {";
  bool firstPass = true;
  for (const auto& [pass, passMap] : passes) {
    if (!firstPass) {
      oss << ",";
    }
    firstPass = false;
    oss << "\n    \"" << pass << "\": {";
    appendKeyValueObject(oss, passMap, kIndent6);
    oss << "\n    }";
  }
  oss << "\n  }";
}

}  // namespace

void Metrics::start(const std::string& name) { active_[name] = Clock::now(); }

void Metrics::stop(const std::string& name) {
  auto iter = active_.find(name);
  if (iter == active_.end()) {
    return;
  }
  auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - iter->second).count();
  durations_us_[name] += static_cast<uint64_t>(microseconds);
  active_.erase(iter);
}

std::string Metrics::summaryText() const {
  std::ostringstream oss;
  oss << "== Metrics ==\n";
  for (const auto& [key, val] : durations_us_) {
    const double millis = static_cast<double>(val) / kUsPerMs;
    oss << "  " << key << ": " << std::fixed << std::setprecision(3) << millis << " ms\n";
  }
  if (geom_) {
    oss << "  Object: nodes=" << geom_->nodes << ", max_depth=" << geom_->maxDepth
        << ", store_refs=" << geom_->storeRefs << ", load_refs=" << geom_->loadRefs << "\n";
  }
  for (const auto& [key, val] : counters_) {
    oss << "  " << key << "=" << val << "\n";
  }
  for (const auto& [key, val] : gauges_) {
    oss << "  " << key << "=" << val << "\n";
  }
  for (const auto& [pass, passMap] : passStats_) {
    oss << "  " << pass << ":";
    for (const auto& [key, val] : passMap) {
      oss << " " << key << "=" << val;
    }
    oss << "\n";
  }
  for (const auto& hint : hints()) {
    oss << "  hint: " << hint << "\n";
  }
  return oss.str();
}

std::string Metrics::summaryJson() const {
  std::ostringstream oss;
  oss << "{\n";
  appendDurations(oss, durations_us_);
  appendGeometry(oss, geom_);
  appendSection(oss, "counters", counters_);
  appendSection(oss, "gauges", gauges_);
  appendPasses(oss, passStats_);
  const auto hs = hints();
  if (!hs.empty()) {
    oss << ",\n  \"hints\": [";
    for (std::size_t i = 0; i < hs.size(); ++i) {
      if (i != 0) {
        oss << ", ";
      }
      oss << "\"" << hs[i] << "\"";
    }
    oss << "]";
  }
  oss << "\n}\n";
  return oss.str();
}

std::vector<std::string> Metrics::hints() const {
  std::vector<std::string> out;
  const auto itCyclic = gauges_.find("refs.recursive");
  if (itCyclic != gauges_.end() && itCyclic->second > 0) {
    out.emplace_back("cyclic_refs_present");
  }
  const auto itMismatch = counters_.find("verify.mismatch");
  if (itMismatch != counters_.end() && itMismatch->second > 0) {
    out.emplace_back("roundtrip_mismatch");
  }
  if (geom_ && geom_->maxDepth >= kDeepNesting) {
    out.emplace_back("deep_nesting");
  }
  return out;
}

}  // namespace pymarshal::obs
