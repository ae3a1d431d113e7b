#pragma once

#include <cstdint>

#include "model/emotion.hpp"

namespace tuxmood::mood {

struct TrackerState {
  model::emotion_state committed{model::emotion_state::CALM};
  model::emotion_state candidate{model::emotion_state::CALM};
  std::uint32_t candidate_streak{0};
  std::uint64_t last_commit_ns{0};
};

struct TrackerUpdate {
  bool changed{false};
  model::emotion_state committed{model::emotion_state::CALM};
};

// Anti-flicker layer between the classifier and the animation. A new state is
// committed only after it was observed on dwell_cycles consecutive polls, except
// escalation to OVERLOADED which commits on the first observation.
class StateTracker {
 public:
  static constexpr std::uint32_t kDefaultDwellCycles = 3;

  explicit StateTracker(std::uint32_t dwell_cycles = kDefaultDwellCycles) noexcept;

  TrackerUpdate update(model::emotion_state classified, std::uint64_t now_ns) noexcept;

  [[nodiscard]] const TrackerState& state() const noexcept { return state_; }
  [[nodiscard]] std::uint32_t dwell_cycles() const noexcept { return dwell_cycles_; }

 private:
  TrackerUpdate commit(model::emotion_state next, std::uint64_t now_ns) noexcept;

  std::uint32_t dwell_cycles_;
  TrackerState state_{};
};

}  // namespace tuxmood::mood
