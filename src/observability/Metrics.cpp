/***
 * Name: rbparse::obs::Metrics (impl)
 * Purpose: Stage bookkeeping and the two summary renderings.
 */
#include "observability/Metrics.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <ios>
#include <numeric>
#include <sstream>
#include <string>
#include <vector>

namespace rbparse::obs {

namespace {

constexpr double kUsPerMs = 1000.0;
constexpr int kNameColumn = 28;

std::string formatMillis(const uint64_t micros) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(3) << static_cast<double>(micros) / kUsPerMs;
  return oss.str();
}

// Stage names are class names (NumericLiteralNormalizer); JSON consumers get snake case.
std::string snakeCase(const std::string& name) {
  std::string out;
  for (std::size_t i = 0; i < name.size(); ++i) {
    const char c = name[i];
    if (c >= 'A' && c <= 'Z') {
      if (i > 0) { out += '_'; }
      out += static_cast<char>(c - 'A' + 'a');
    } else {
      out += c;
    }
  }
  return out;
}

} // namespace

void Metrics::start(const std::string& name) { active_[name] = Clock::now(); }

void Metrics::stop(const std::string& name) {
  const auto iter = active_.find(name);
  if (iter == active_.end()) { return; }
  const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - iter->second);
  active_.erase(iter);
  if (durations_us_.count(name) == 0) { order_.push_back(name); }
  durations_us_[name] += static_cast<uint64_t>(elapsed.count());
}

std::vector<StageTiming> Metrics::stages() const {
  std::vector<StageTiming> out;
  out.reserve(order_.size());
  for (const auto& name : order_) { out.push_back(StageTiming{name, durations_us_.at(name)}); }
  return out;
}

uint64_t Metrics::totalMicros() const {
  return std::accumulate(durations_us_.begin(), durations_us_.end(), uint64_t{0},
                         [](const uint64_t sum, const auto& entry) { return sum + entry.second; });
}

std::string Metrics::summaryText() const {
  std::ostringstream oss;
  oss << "== Metrics ==\n";
  const auto timings = stages();
  for (const auto& stage : timings) {
    oss << "  " << std::left << std::setw(kNameColumn) << stage.name << formatMillis(stage.micros) << " ms\n";
  }
  if (!timings.empty()) {
    oss << "  " << std::left << std::setw(kNameColumn) << "total" << formatMillis(totalMicros()) << " ms\n";
  }
  for (const auto& [key, value] : counters_) { oss << "  " << key << " = " << value << "\n"; }
  if (geom_) { oss << "  AST: nodes=" << geom_->nodes << ", max_depth=" << geom_->maxDepth << "\n"; }
  return oss.str();
}

std::string Metrics::summaryJson() const {
  std::ostringstream oss;
  oss << "{\n  \"stages\": [";
  const auto timings = stages();
  for (std::size_t i = 0; i < timings.size(); ++i) {
    oss << (i == 0 ? "\n" : ",\n") << "    { \"name\": \"" << snakeCase(timings[i].name)
        << "\", \"ms\": " << formatMillis(timings[i].micros) << " }";
  }
  oss << (timings.empty() ? "]" : "\n  ]");
  oss << ",\n  \"total_ms\": " << formatMillis(totalMicros());
  if (!counters_.empty()) {
    oss << ",\n  \"counters\": {";
    bool first = true;
    for (const auto& [key, value] : counters_) {
      oss << (first ? "\n" : ",\n") << "    \"" << key << "\": " << value;
      first = false;
    }
    oss << "\n  }";
  }
  if (geom_) { oss << ",\n  \"ast\": { \"nodes\": " << geom_->nodes << ", \"max_depth\": " << geom_->maxDepth << " }"; }
  oss << "\n}\n";
  return oss.str();
}

} // namespace rbparse::obs
