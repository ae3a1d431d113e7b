#pragma once

#include <cstdint>
#include <type_traits>

#include "model/emotion.hpp"

namespace tuxmood::model {

// Per-poll record handed to the observability sinks.
// POD layout: one timestamp + raw inputs + classification output + health.
struct mood_frame {
    struct AgentHealth {
        std::uint64_t heartbeat_ms;
        float poll_time_ms;
        float redis_latency_ms;
        std::uint32_t redis_errors;
        std::uint32_t degraded_samples;
        std::uint32_t render_failures;
        std::uint32_t missed_polls;
    };

    std::uint64_t timestamp;

    // Raw inputs after gating.
    float cpu;
    float ram;
    float network;
    bool degraded;

    // Classification.
    emotion_state raw_state;
    emotion_state state;
    focus_mode mode;
    std::uint8_t stressors;
    float stress_score;
    float stress_trend;

    AgentHealth agent;
};

static_assert(std::is_standard_layout_v<mood_frame>, "mood_frame must be standard layout");
static_assert(std::is_trivial_v<mood_frame>, "mood_frame must be trivial");

} // namespace tuxmood::model
