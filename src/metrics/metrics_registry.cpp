#include "foa_codec/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace foa {

void MetricsRegistry::reset() {
  entities_ = bytes_ = 0;
  by_kind_.fill(0);
  buffer_ = DecoderStats{};
  stage_accum_us_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::start_stage(std::string_view name) {
  stage_starts_[std::string(name)] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_us_[key] += static_cast<std::uint64_t>(us);
  stage_starts_.erase(it);
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.entities = entities_;
  r.bytes = bytes_;
  r.by_kind = by_kind_;
  r.wall_ms = wall_ms;
  const double sec = wall_ms / 1000.0;
  r.throughput_mb_s = (sec > 0.0) ? (bytes_ / (1024.0 * 1024.0)) / sec : 0.0;
  r.entities_per_sec = (sec > 0.0) ? entities_ / sec : 0.0;
  r.buffer_grows = buffer_.grows;
  r.buffer_compactions = buffer_.compactions;
  r.buffer_high_water = buffer_.high_water;

  r.stages.reserve(stage_accum_us_.size());
  for (auto& kv : stage_accum_us_) r.stages.push_back(StageTiming{kv.first, kv.second});
  std::sort(r.stages.begin(), r.stages.end(),
            [](const StageTiming& a, const StageTiming& b) { return a.name < b.name; });
  return r;
}

}
