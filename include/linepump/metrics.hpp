#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lp {

struct StageTiming {
  std::string name;
  double duration_ms = 0.0;
};

struct RunStats {
  std::uint64_t units = 0;        // lines or buffer views
  std::uint64_t bytes = 0;
  double wall_ms = 0.0;
  double throughput_mb_s = 0.0;
  double units_per_sec = 0.0;
  std::vector<StageTiming> stages;
};

class MetricsRegistry {
public:
  void reset();
  void add_unit(std::uint64_t bytes) noexcept { ++units_; bytes_ += bytes; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t units_{0};
  std::uint64_t bytes_{0};
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, double> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
