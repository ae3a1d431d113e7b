#include "mood/state_tracker.hpp"

namespace tuxmood::mood {

StateTracker::StateTracker(const std::uint32_t dwell_cycles) noexcept
    : dwell_cycles_(dwell_cycles == 0 ? 1 : dwell_cycles) {}

TrackerUpdate StateTracker::update(const model::emotion_state classified, const std::uint64_t now_ns) noexcept {
  if (classified == state_.committed) {
    state_.candidate = classified;
    state_.candidate_streak = 0;
    return {false, state_.committed};
  }

  if (classified == model::emotion_state::OVERLOADED && model::more_severe(classified, state_.committed)) {
    return commit(classified, now_ns);
  }

  if (classified == state_.candidate && state_.candidate_streak > 0) {
    ++state_.candidate_streak;
  } else {
    state_.candidate = classified;
    state_.candidate_streak = 1;
  }

  if (state_.candidate_streak >= dwell_cycles_) {
    return commit(classified, now_ns);
  }

  return {false, state_.committed};
}

TrackerUpdate StateTracker::commit(const model::emotion_state next, const std::uint64_t now_ns) noexcept {
  state_.committed = next;
  state_.candidate = next;
  state_.candidate_streak = 0;
  state_.last_commit_ns = now_ns;
  return {true, state_.committed};
}

}  // namespace tuxmood::mood
