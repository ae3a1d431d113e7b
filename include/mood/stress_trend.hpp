#pragma once

#include "model/metric_sample.hpp"

namespace tuxmood::mood {

// Exponentially smoothed stress score. Degraded samples never feed the EMA.
class StressTrend {
 public:
  explicit StressTrend(float alpha = 0.35F) noexcept;

  float sample(const model::metric_sample& sample, float stress_score) noexcept;

  [[nodiscard]] float value() const noexcept { return ema_; }
  [[nodiscard]] bool seeded() const noexcept { return has_ema_; }

 private:
  float alpha_;
  float ema_{0.0F};
  bool has_ema_{false};
};

}  // namespace tuxmood::mood
