#include "linepump/metrics.hpp"
#include <algorithm>

namespace lp {

void MetricsRegistry::reset() {
  units_ = bytes_ = 0;
  stage_order_.clear();
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::start_stage(std::string_view name) {
  std::string key(name);
  if (std::find(stage_order_.begin(), stage_order_.end(), key) == stage_order_.end())
    stage_order_.push_back(key);
  stage_starts_[key] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto it = stage_starts_.find(std::string(name));
  if (it == stage_starts_.end()) return;
  stage_accum_ms_[it->first] += std::chrono::duration<double, std::milli>(
      std::chrono::steady_clock::now() - it->second).count();
  stage_starts_.erase(it);
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.units = units_;
  r.bytes = bytes_;
  r.wall_ms = wall_ms;
  const double sec = wall_ms / 1000.0;
  r.throughput_mb_s = sec > 0.0 ? (bytes_ / (1024.0 * 1024.0)) / sec : 0.0;
  r.units_per_sec = sec > 0.0 ? units_ / sec : 0.0;

  r.stages.reserve(stage_order_.size());
  for (auto& name : stage_order_) {
    auto it = stage_accum_ms_.find(name);
    r.stages.push_back(StageTiming{name, it == stage_accum_ms_.end() ? 0.0 : it->second});
  }
  return r;
}

}
