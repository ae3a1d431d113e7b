#pragma once

#include <cstdint>
#include <string>

#include "model/emotion.hpp"
#include "model/metric_sample.hpp"
#include "model/thresholds.hpp"

namespace tuxmood::mood {

struct Classification {
  model::emotion_state state{model::emotion_state::CALM};
  float stress_score{0.0F};
  // field_bit() mask of the metrics above their high threshold.
  std::uint8_t stressors{0};
};

class EmotionClassifier {
 public:
  explicit EmotionClassifier(const model::threshold_config& thresholds);

  [[nodiscard]] Classification classify(const model::metric_sample& sample,
                                        model::focus_mode mode = model::focus_mode::EMOTION) const noexcept;

 private:
  const model::threshold_config& thresholds_;
};

// Stateless form; thresholds are assumed valid.
Classification classify(const model::metric_sample& sample, const model::threshold_config& thresholds,
                        model::focus_mode mode = model::focus_mode::EMOTION) noexcept;

std::string describe_stressors(const model::metric_sample& sample, std::uint8_t stressors);

}  // namespace tuxmood::mood
