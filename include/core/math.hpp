#pragma once

#include <algorithm>
#include <cmath>

namespace tuxmood::core {

inline constexpr float clamp01(const float value) noexcept {
  return std::clamp(value, 0.0F, 1.0F);
}

inline constexpr float clamp_percent(const float value) noexcept {
  return std::clamp(value, 0.0F, 100.0F);
}

// Non-finite inputs become zero so a broken counter cannot poison downstream math.
inline float sanitize(const float value) noexcept {
  return std::isfinite(value) ? value : 0.0F;
}

}  // namespace tuxmood::core
