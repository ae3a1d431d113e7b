#pragma once

#include <array>
#include <cstdint>

#include "model/metric_sample.hpp"

namespace tuxmood::mood {

// Turns a raw reading into a complete sample. Missing fields take the last
// known good value, or zero before any value was seen; either way the sample
// is flagged degraded.
class MetricGate {
 public:
  model::metric_sample admit(const model::raw_metrics& raw) noexcept;

  [[nodiscard]] std::uint32_t degraded_samples() const noexcept { return degraded_samples_; }

 private:
  struct FieldState {
    float last_good{0.0F};
    bool has_last_good{false};
    bool unavailable{false};
  };

  float resolve(model::metric_field field, const std::optional<float>& reading, float upper_bound,
                model::metric_sample& sample) noexcept;

  std::array<FieldState, 3> fields_{};
  std::uint32_t degraded_samples_{0};
};

}  // namespace tuxmood::mood
