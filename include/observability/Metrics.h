/***
 * Name: rbparse::obs::Metrics
 * Purpose: Per-stage timings, counters and AST geometry of one parse.
 * Inputs:
 *   - start/stop calls around named stages (Lex, Parse, pass names)
 *   - counters set by the parser facade (tokens, shifts, reductions, rewrites)
 *   - AST summary values computed by ComputeGeometry
 * Outputs:
 *   - Human-readable text and JSON summaries.
 * Theory of Operation:
 *   steady_clock timestamps, accumulated in microseconds per stage name; a
 *   stage run twice sums up. Stages are reported in the order they first
 *   finished, which for one parse is pipeline order. Counters are reported
 *   sorted by key.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rbparse::obs {

struct StageTiming {
  std::string name;
  uint64_t micros{0};
};

struct AstGeometry {
  uint64_t nodes{0};
  uint64_t maxDepth{0};
};

class Metrics {
 public:
  using Clock = std::chrono::steady_clock;

  void start(const std::string& name);
  void stop(const std::string& name);

  void setAstGeometry(AstGeometry g) { geom_ = g; }
  const std::optional<AstGeometry>& astGeometry() const { return geom_; }

  void incCounter(const std::string& key, uint64_t delta = 1) { counters_[key] += delta; }
  void setCounter(const std::string& key, uint64_t value) { counters_[key] = value; }
  const std::map<std::string, uint64_t>& counters() const { return counters_; }
  const std::map<std::string, uint64_t>& durations() const { return durations_us_; }
  std::vector<StageTiming> stages() const;
  uint64_t totalMicros() const;

  std::string summaryText() const;
  std::string summaryJson() const;

 private:
  std::map<std::string, Clock::time_point> active_{};
  std::map<std::string, uint64_t> durations_us_{};
  std::vector<std::string> order_{};
  std::map<std::string, uint64_t> counters_{};
  std::optional<AstGeometry> geom_{};
};

// Times a scope; a null Metrics turns it into a no-op.
class ScopedStage {
 public:
  ScopedStage(Metrics* metrics, std::string name) : metrics_(metrics), name_(std::move(name)) {
    if (metrics_ != nullptr) { metrics_->start(name_); }
  }
  ~ScopedStage() {
    if (metrics_ != nullptr) { metrics_->stop(name_); }
  }
  ScopedStage(const ScopedStage&) = delete;
  ScopedStage& operator=(const ScopedStage&) = delete;

 private:
  Metrics* metrics_;
  std::string name_;
};

} // namespace rbparse::obs
