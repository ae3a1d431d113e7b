#include "mood/metric_gate.hpp"

#include <cmath>
#include <iostream>
#include <limits>

namespace tuxmood::mood {
namespace {

const char* field_name(const model::metric_field field) {
  switch (field) {
    case model::metric_field::CPU:
      return "cpu";
    case model::metric_field::RAM:
      return "ram";
    case model::metric_field::NETWORK:
      return "network";
  }
  return "unknown";
}

}  // namespace

model::metric_sample MetricGate::admit(const model::raw_metrics& raw) noexcept {
  model::metric_sample sample{};
  sample.timestamp_ns = raw.timestamp_ns;

  sample.cpu_pct = resolve(model::metric_field::CPU, raw.cpu_pct, 100.0F, sample);
  sample.ram_pct = resolve(model::metric_field::RAM, raw.ram_pct, 100.0F, sample);
  sample.net_kbps = resolve(model::metric_field::NETWORK, raw.net_kbps, std::numeric_limits<float>::max(), sample);

  sample.degraded = sample.substituted != 0;
  if (sample.degraded) {
    ++degraded_samples_;
  }
  return sample;
}

float MetricGate::resolve(const model::metric_field field, const std::optional<float>& reading,
                          const float upper_bound, model::metric_sample& sample) noexcept {
  FieldState& state = fields_[static_cast<std::size_t>(field)];

  if (reading.has_value() && std::isfinite(*reading)) {
    float value = *reading;
    if (value < 0.0F) {
      value = 0.0F;
    }
    if (value > upper_bound) {
      value = upper_bound;
    }

    if (state.unavailable) {
      std::cerr << "[gate] " << field_name(field) << " metric recovered\n";
      state.unavailable = false;
    }
    state.last_good = value;
    state.has_last_good = true;
    return value;
  }

  if (!state.unavailable) {
    std::cerr << "[gate] " << field_name(field) << " metric unavailable; substituting "
              << (state.has_last_good ? "last known value" : "zero") << '\n';
    state.unavailable = true;
  }

  sample.substituted |= model::field_bit(field);
  return state.has_last_good ? state.last_good : 0.0F;
}

}  // namespace tuxmood::mood
