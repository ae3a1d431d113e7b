#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

#include "animation/animation_scheduler.hpp"
#include "core/config.hpp"
#include "core/timestamp.hpp"
#include "model/animation.hpp"
#include "model/emotion.hpp"
#include "model/mood_frame.hpp"
#include "model/thresholds.hpp"
#include "mood/emotion_classifier.hpp"
#include "mood/metric_gate.hpp"
#include "mood/state_tracker.hpp"
#include "mood/stress_trend.hpp"
#include "sensors/metric_source.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"

namespace tuxmood::core {

// Called on the animation worker with the frame to show and its tooltip.
using RenderCallback = std::function<void(model::frame_handle frame, const std::string& tooltip)>;

struct MoodSnapshot {
  model::emotion_state state{model::emotion_state::CALM};
  float stress_score{0.0F};
  model::focus_mode mode{model::focus_mode::EMOTION};
};

// "<Mood> (<score>% stress)", prefixed with the metric name in single-metric modes.
std::string format_tooltip(const MoodSnapshot& mood);

class Orchestrator {
 public:
  Orchestrator(AgentConfig config, std::unique_ptr<sensors::MetricSource> source, model::animation_set animations,
               RenderCallback render);
  ~Orchestrator();

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  void start();
  // Blocks until both workers exited. No render happens once this returns.
  void stop();
  [[nodiscard]] bool running() const noexcept;

  // Both take effect at the start of the next poll cycle.
  void set_mode(model::focus_mode mode) noexcept;
  void set_thresholds(const model::threshold_config& thresholds);

  [[nodiscard]] MoodSnapshot mood() const noexcept;

  // One unit of work of each worker. Exposed so a caller without threads can
  // drive the pipeline. Returns false when the sample was discarded.
  bool run_poll_cycle();
  void run_animation_tick(Clock::time_point now);

  [[nodiscard]] const model::mood_frame& last_frame() const noexcept { return frame_; }
  [[nodiscard]] const mood::TrackerState& tracker_state() const noexcept { return tracker_.state(); }
  [[nodiscard]] std::uint32_t render_failures() const noexcept { return render_failures_.load(); }

 private:
  static std::uint64_t pack(const MoodSnapshot& mood) noexcept;
  static MoodSnapshot unpack(std::uint64_t cell) noexcept;

  void poll_loop(std::stop_token stop);
  void animation_loop(std::stop_token stop);
  bool sleep_until(const std::stop_token& stop, Clock::time_point deadline);

  void apply_pending();
  // A throwing source reads as every field unavailable.
  model::raw_metrics read_source();
  void publish_sinks();

  AgentConfig config_;
  std::unique_ptr<sensors::MetricSource> source_;
  RenderCallback render_;

  // Poll worker.
  mood::MetricGate gate_{};
  mood::EmotionClassifier classifier_;
  mood::StressTrend trend_;
  mood::StateTracker tracker_;
  model::focus_mode applied_mode_{model::focus_mode::EMOTION};
  model::mood_frame frame_{};
  bool source_was_ok_{true};
  std::uint32_t missed_polls_{0};
  std::uint32_t redis_errors_{0};
  sinks::StdoutDebugSink stdout_sink_{};
  std::unique_ptr<sinks::RedisTsSink> redis_sink_{};
  bool redis_was_ok_{true};

  // Animation worker.
  animation::AnimationScheduler scheduler_;
  std::optional<model::frame_handle> last_rendered_{};
  bool render_was_ok_{true};

  // Shared.
  std::atomic<std::uint64_t> mood_cell_{0};
  std::atomic<model::focus_mode> requested_mode_{model::focus_mode::EMOTION};
  std::mutex pending_mutex_;
  std::optional<model::threshold_config> pending_thresholds_{};
  std::atomic<std::uint32_t> render_failures_{0};
  std::atomic<bool> stopping_{false};

  std::mutex wake_mutex_;
  std::condition_variable_any wake_cv_;
  std::jthread poll_thread_{};
  std::jthread animation_thread_{};
};

}  // namespace tuxmood::core
