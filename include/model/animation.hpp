#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <vector>

#include "model/emotion.hpp"

namespace tuxmood::model {

// Opaque to the scheduler; the skin loader maps handles to bitmap files.
using frame_handle = std::uint32_t;

inline constexpr frame_handle kPlaceholderFrame = 0;
inline constexpr std::chrono::milliseconds kDefaultFrameDuration{42};

struct frame {
    frame_handle handle{kPlaceholderFrame};
    std::chrono::milliseconds duration{kDefaultFrameDuration};
};

using frame_sequence = std::vector<frame>;

struct animation_set {
    std::array<frame_sequence, kEmotionStateCount> sequences{};

    [[nodiscard]] const frame_sequence& at(const emotion_state state) const noexcept {
        return sequences[index_of(state)];
    }

    [[nodiscard]] frame_sequence& at(const emotion_state state) noexcept { return sequences[index_of(state)]; }
};

} // namespace tuxmood::model
