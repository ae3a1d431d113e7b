#include "mood/stress_trend.hpp"

#include "core/math.hpp"

namespace tuxmood::mood {

StressTrend::StressTrend(const float alpha) noexcept : alpha_(core::clamp01(alpha)) {}

float StressTrend::sample(const model::metric_sample& sample, const float stress_score) noexcept {
  const float score = core::clamp_percent(core::sanitize(stress_score));

  if (sample.degraded) {
    // Until a trustworthy sample arrives, pass the score through unsmoothed.
    return has_ema_ ? ema_ : score;
  }

  if (!has_ema_) {
    ema_ = score;
    has_ema_ = true;
  } else {
    ema_ = ((1.0F - alpha_) * ema_) + (alpha_ * score);
  }

  ema_ = core::clamp_percent(ema_);
  return ema_;
}

}  // namespace tuxmood::mood
