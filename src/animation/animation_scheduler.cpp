#include "animation/animation_scheduler.hpp"

#include <iostream>

#include "core/math.hpp"

namespace tuxmood::animation {
namespace {

constexpr std::chrono::nanoseconds kMinFrameDuration = std::chrono::milliseconds(1);

}  // namespace

AnimationScheduler::AnimationScheduler(const model::animation_set& animations, const float max_playback_multiplier)
    : max_playback_multiplier_(max_playback_multiplier < 1.0F ? 1.0F : max_playback_multiplier) {
  const model::frame_sequence placeholder{model::frame{model::kPlaceholderFrame, model::kDefaultFrameDuration}};

  for (const auto state : model::kAllEmotionStates) {
    const std::size_t slot = model::index_of(state);

    // Walk down the severity ladder until a state with frames is found.
    for (std::size_t candidate = slot + 1; candidate-- > 0;) {
      if (!animations.sequences[candidate].empty()) {
        sources_[slot] = model::kAllEmotionStates[candidate];
        resolved_[slot] = animations.sequences[candidate];
        break;
      }
    }

    if (!sources_[slot].has_value()) {
      resolved_[slot] = placeholder;
      std::cerr << "[animation] no frames for " << model::to_string(state)
                << "; degraded mode, showing placeholder frame\n";
    } else if (*sources_[slot] != state) {
      std::cerr << "[animation] no frames for " << model::to_string(state) << "; degraded mode, using "
                << model::to_string(*sources_[slot]) << " frames\n";
    }
  }
}

void AnimationScheduler::set_state(const model::emotion_state state) noexcept {
  active_state_ = state;
  frame_index_ = 0;
  frame_started_.reset();
}

void AnimationScheduler::set_stress(const float stress_score) noexcept {
  const float ratio = core::clamp01(core::sanitize(stress_score) / 100.0F);
  playback_multiplier_ = 1.0F + ((max_playback_multiplier_ - 1.0F) * ratio);
}

model::frame_handle AnimationScheduler::tick(const core::Clock::time_point now) noexcept {
  if (!frame_started_.has_value()) {
    frame_started_ = now;
    return current_frame();
  }

  if (now <= *frame_started_) {
    return current_frame();
  }

  const model::frame_sequence& frames = sequence();
  auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(now - *frame_started_);
  if (elapsed <= scaled_duration(frames[frame_index_])) {
    return current_frame();
  }

  // Skip whole cycles after a long stall instead of stepping through them.
  std::chrono::nanoseconds cycle{0};
  for (const auto& frame : frames) {
    cycle += scaled_duration(frame);
  }
  if (elapsed > cycle) {
    const auto skipped = cycle * (elapsed / cycle);
    elapsed -= skipped;
    *frame_started_ += std::chrono::duration_cast<core::Clock::duration>(skipped);
  }

  while (true) {
    const auto threshold = scaled_duration(frames[frame_index_]);
    if (elapsed <= threshold) {
      break;
    }
    elapsed -= threshold;
    *frame_started_ += std::chrono::duration_cast<core::Clock::duration>(threshold);
    frame_index_ = (frame_index_ + 1) % frames.size();
  }

  return current_frame();
}

model::frame_handle AnimationScheduler::current_frame() const noexcept {
  return sequence()[frame_index_].handle;
}

std::optional<model::emotion_state> AnimationScheduler::resolved_source(const model::emotion_state state) const noexcept {
  return sources_[model::index_of(state)];
}

const model::frame_sequence& AnimationScheduler::sequence() const noexcept {
  return resolved_[model::index_of(active_state_)];
}

std::chrono::nanoseconds AnimationScheduler::scaled_duration(const model::frame& frame) const noexcept {
  const auto nominal = std::chrono::duration_cast<std::chrono::nanoseconds>(frame.duration);
  const auto scaled = std::chrono::nanoseconds(
      static_cast<std::chrono::nanoseconds::rep>(static_cast<double>(nominal.count()) / playback_multiplier_));
  return scaled < kMinFrameDuration ? kMinFrameDuration : scaled;
}

}  // namespace tuxmood::animation
