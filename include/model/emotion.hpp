#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace tuxmood::model {

// Severity ordered; comparisons between states rely on the underlying values.
enum class emotion_state : std::uint8_t {
    CALM = 0,
    ACTIVE = 1,
    BUSY = 2,
    STRESSED = 3,
    OVERLOADED = 4,
};

inline constexpr std::size_t kEmotionStateCount = 5;

inline constexpr std::array<emotion_state, kEmotionStateCount> kAllEmotionStates = {
    emotion_state::CALM, emotion_state::ACTIVE, emotion_state::BUSY, emotion_state::STRESSED,
    emotion_state::OVERLOADED,
};

inline constexpr std::size_t index_of(const emotion_state state) noexcept {
    return static_cast<std::size_t>(state);
}

inline constexpr bool more_severe(const emotion_state lhs, const emotion_state rhs) noexcept {
    return static_cast<std::uint8_t>(lhs) > static_cast<std::uint8_t>(rhs);
}

inline constexpr std::string_view to_string(const emotion_state state) noexcept {
    switch (state) {
        case emotion_state::CALM:
            return "calm";
        case emotion_state::ACTIVE:
            return "active";
        case emotion_state::BUSY:
            return "busy";
        case emotion_state::STRESSED:
            return "stressed";
        case emotion_state::OVERLOADED:
            return "overloaded";
    }
    return "calm";
}

inline constexpr std::string_view display_name(const emotion_state state) noexcept {
    switch (state) {
        case emotion_state::CALM:
            return "Calm";
        case emotion_state::ACTIVE:
            return "Active";
        case emotion_state::BUSY:
            return "Busy";
        case emotion_state::STRESSED:
            return "Stressed";
        case emotion_state::OVERLOADED:
            return "Overloaded";
    }
    return "Calm";
}

// EMOTION classifies on every metric. The others run the single-metric focus
// ladder on the named metric alone, where OVERLOADED and ACTIVE never occur.
enum class focus_mode : std::uint8_t {
    EMOTION = 0,
    CPU = 1,
    RAM = 2,
    NETWORK = 3,
};

inline constexpr std::string_view to_string(const focus_mode mode) noexcept {
    switch (mode) {
        case focus_mode::EMOTION:
            return "emotion";
        case focus_mode::CPU:
            return "cpu";
        case focus_mode::RAM:
            return "ram";
        case focus_mode::NETWORK:
            return "network";
    }
    return "emotion";
}

} // namespace tuxmood::model
