#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "foa_codec/entity.hpp"
#include "foa_codec/frame_source.hpp"

namespace foa {

struct StageTiming {
  std::string name;
  std::uint64_t duration_us = 0;
};

struct RunStats {
  std::uint64_t entities = 0;
  std::uint64_t bytes = 0;
  std::array<std::uint64_t, 5> by_kind{}; // indexed by EntityKind
  double wall_ms = 0.0;
  double throughput_mb_s = 0.0;
  double entities_per_sec = 0.0;

  std::uint64_t buffer_grows = 0;
  std::uint64_t buffer_compactions = 0;
  std::size_t buffer_high_water = 0;

  std::vector<StageTiming> stages;

  std::string to_json() const;
};

class MetricsRegistry {
public:
  void reset();
  void add_entity(EntityKind k) noexcept { ++entities_; ++by_kind_[static_cast<std::size_t>(k)]; }
  void add_bytes(std::uint64_t b) noexcept { bytes_ += b; }
  void set_buffer_stats(const DecoderStats& s) noexcept { buffer_ = s; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t entities_{0};
  std::uint64_t bytes_{0};
  std::array<std::uint64_t, 5> by_kind_{};
  DecoderStats buffer_{};
  std::unordered_map<std::string, std::uint64_t> stage_accum_us_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
