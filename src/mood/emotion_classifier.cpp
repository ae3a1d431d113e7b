#include "mood/emotion_classifier.hpp"

#include <array>
#include <cstdio>

#include "core/math.hpp"

namespace tuxmood::mood {
namespace {

struct MetricView {
  model::metric_field field;
  float value;
  const model::metric_thresholds* limits;
};

float normalized_severity(const float value, const model::metric_thresholds& limits) {
  const float span = limits.critical - limits.max;
  if (span <= 0.0F) {
    return value > limits.max ? 1.0F : 0.0F;
  }
  return (value - limits.max) / span;
}

Classification classify_focus(const model::metric_field field, const float value,
                              const model::focus_thresholds& ladder) noexcept {
  Classification result{};
  if (value >= ladder.walk) {
    result.state = model::emotion_state::STRESSED;
    result.stressors = model::field_bit(field);
  } else if (value >= ladder.idle) {
    result.state = model::emotion_state::BUSY;
  } else {
    result.state = model::emotion_state::CALM;
  }
  result.stress_score = core::clamp01(value / ladder.walk) * 100.0F;
  return result;
}

}  // namespace

EmotionClassifier::EmotionClassifier(const model::threshold_config& thresholds) : thresholds_(thresholds) {}

Classification EmotionClassifier::classify(const model::metric_sample& sample,
                                           const model::focus_mode mode) const noexcept {
  return mood::classify(sample, thresholds_, mode);
}

Classification classify(const model::metric_sample& sample, const model::threshold_config& thresholds,
                        const model::focus_mode mode) noexcept {
  switch (mode) {
    case model::focus_mode::CPU:
      return classify_focus(model::metric_field::CPU, core::sanitize(sample.cpu_pct), thresholds.cpu_focus);
    case model::focus_mode::RAM:
      return classify_focus(model::metric_field::RAM, core::sanitize(sample.ram_pct), thresholds.ram_focus);
    case model::focus_mode::NETWORK:
      return classify_focus(model::metric_field::NETWORK, core::sanitize(sample.net_kbps), thresholds.network_focus);
    case model::focus_mode::EMOTION:
      break;
  }

  const std::array<MetricView, 3> metrics = {{
      {model::metric_field::CPU, core::sanitize(sample.cpu_pct), &thresholds.cpu},
      {model::metric_field::RAM, core::sanitize(sample.ram_pct), &thresholds.ram},
      {model::metric_field::NETWORK, core::sanitize(sample.net_kbps), &thresholds.network},
  }};

  bool any_critical = false;
  bool any_busy = false;
  bool any_active = false;
  std::uint32_t high_count = 0;
  float worst = 0.0F;
  Classification result{};

  for (const auto& metric : metrics) {
    const auto& limits = *metric.limits;
    any_critical = any_critical || metric.value > limits.critical;
    any_busy = any_busy || metric.value > limits.busy;
    any_active = any_active || metric.value > limits.max;
    if (metric.value > limits.high) {
      ++high_count;
      result.stressors |= model::field_bit(metric.field);
    }

    const float severity = normalized_severity(metric.value, limits);
    if (severity > worst) {
      worst = severity;
    }
  }

  if (any_critical) {
    result.state = model::emotion_state::OVERLOADED;
  } else if (high_count >= thresholds.multiple_resources_threshold) {
    result.state = model::emotion_state::STRESSED;
  } else if (any_busy) {
    result.state = model::emotion_state::BUSY;
  } else if (any_active) {
    result.state = model::emotion_state::ACTIVE;
  } else {
    result.state = model::emotion_state::CALM;
  }

  result.stress_score = core::clamp_percent(worst * 100.0F);
  return result;
}

std::string describe_stressors(const model::metric_sample& sample, const std::uint8_t stressors) {
  std::string out;
  char buffer[64]{};

  const auto append = [&out](const char* text) {
    if (!out.empty()) {
      out += ", ";
    }
    out += text;
  };

  if ((stressors & model::field_bit(model::metric_field::CPU)) != 0) {
    std::snprintf(buffer, sizeof(buffer), "High CPU (%.1f%%)", static_cast<double>(sample.cpu_pct));
    append(buffer);
  }
  if ((stressors & model::field_bit(model::metric_field::RAM)) != 0) {
    std::snprintf(buffer, sizeof(buffer), "High RAM (%.1f%%)", static_cast<double>(sample.ram_pct));
    append(buffer);
  }
  if ((stressors & model::field_bit(model::metric_field::NETWORK)) != 0) {
    std::snprintf(buffer, sizeof(buffer), "High Network (%.1f KB/s)", static_cast<double>(sample.net_kbps));
    append(buffer);
  }

  return out;
}

}  // namespace tuxmood::mood
