#pragma once

#include <array>
#include <cstddef>
#include <optional>

#include "core/timestamp.hpp"
#include "model/animation.hpp"
#include "model/emotion.hpp"

namespace tuxmood::animation {

// Cyclic per-state frame player with its own clock. Only the animation worker
// touches an instance; the poll side communicates through set_state/set_stress
// calls made on that same worker.
class AnimationScheduler {
 public:
  static constexpr float kDefaultMaxMultiplier = 2.5F;

  explicit AnimationScheduler(const model::animation_set& animations,
                              float max_playback_multiplier = kDefaultMaxMultiplier);

  // Switches to the resolved sequence of state and restarts it at frame 0.
  void set_state(model::emotion_state state) noexcept;

  // Maps a stress score in [0, 100] onto [1, max_playback_multiplier].
  void set_stress(float stress_score) noexcept;

  // Returns the frame to display at now. Only advances when now has crossed a
  // frame boundary; repeated calls with the same time are pure reads.
  model::frame_handle tick(core::Clock::time_point now) noexcept;

  [[nodiscard]] model::frame_handle current_frame() const noexcept;
  [[nodiscard]] model::emotion_state active_state() const noexcept { return active_state_; }
  [[nodiscard]] std::size_t frame_index() const noexcept { return frame_index_; }
  [[nodiscard]] std::size_t sequence_length() const noexcept { return sequence().size(); }
  [[nodiscard]] float playback_multiplier() const noexcept { return playback_multiplier_; }

  // State whose frames are played for state, or nullopt for the placeholder.
  [[nodiscard]] std::optional<model::emotion_state> resolved_source(model::emotion_state state) const noexcept;

 private:
  [[nodiscard]] const model::frame_sequence& sequence() const noexcept;
  [[nodiscard]] std::chrono::nanoseconds scaled_duration(const model::frame& frame) const noexcept;

  std::array<model::frame_sequence, model::kEmotionStateCount> resolved_{};
  std::array<std::optional<model::emotion_state>, model::kEmotionStateCount> sources_{};
  float max_playback_multiplier_;

  model::emotion_state active_state_{model::emotion_state::CALM};
  std::size_t frame_index_{0};
  std::optional<core::Clock::time_point> frame_started_{};
  float playback_multiplier_{1.0F};
};

}  // namespace tuxmood::animation
