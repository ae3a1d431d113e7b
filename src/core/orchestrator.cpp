#include "core/orchestrator.hpp"

#include <bit>
#include <chrono>
#include <cmath>
#include <exception>
#include <iostream>
#include <sstream>
#include <string_view>
#include <utility>
#include <vector>

namespace tuxmood::core {
namespace {

constexpr std::uint64_t kScoreMask = 0xFFFF'FFFFULL;
constexpr unsigned kStateShift = 32;
constexpr unsigned kModeShift = 40;

std::string_view metric_label(const model::focus_mode mode) {
  switch (mode) {
    case model::focus_mode::CPU:
      return "CPU";
    case model::focus_mode::RAM:
      return "RAM";
    case model::focus_mode::NETWORK:
      return "Network";
    case model::focus_mode::EMOTION:
      break;
  }
  return {};
}

std::vector<std::string> enabled_redis_metrics(const AgentConfig& config) {
  std::vector<std::string> metrics = {
      "raw:cpu",    "raw:ram",           "raw:network",        "mood:raw_state",
      "mood:state", "mood:stress_score", "mood:stress_trend",
  };

  if (config.publish_health) {
    metrics.push_back("agent:heartbeat");
    metrics.push_back("agent:poll_time");
    metrics.push_back("agent:redis_latency");
    metrics.push_back("agent:redis_errors");
    metrics.push_back("agent:degraded_samples");
    metrics.push_back("agent:render_failures");
    metrics.push_back("agent:missed_polls");
  }

  return metrics;
}

}  // namespace

std::string format_tooltip(const MoodSnapshot& mood) {
  std::ostringstream output;
  const std::string_view label = metric_label(mood.mode);
  if (!label.empty()) {
    output << label << ": ";
  }
  output << model::display_name(mood.state) << " (" << static_cast<int>(std::lround(mood.stress_score))
         << "% stress)";
  return output.str();
}

Orchestrator::Orchestrator(AgentConfig config, std::unique_ptr<sensors::MetricSource> source,
                           model::animation_set animations, RenderCallback render)
    : config_(std::move(config)),
      source_(std::move(source)),
      render_(std::move(render)),
      classifier_(config_.thresholds),
      trend_(config_.stress_smoothing_alpha),
      tracker_(config_.dwell_cycles),
      applied_mode_(config_.mode),
      scheduler_(animations, config_.max_playback_multiplier),
      mood_cell_(pack(MoodSnapshot{.mode = config_.mode})),
      requested_mode_(config_.mode) {
  validate_thresholds(config_.thresholds);

  if (config_.redis.enabled) {
    sinks::RedisTsOptions options{};
    options.host = config_.redis.host;
    options.port = config_.redis.port;
    options.unix_socket = config_.redis.unix_socket;
    options.password = config_.redis.password;
    options.db = config_.redis.db;
    options.key_prefix = config_.redis.key_prefix;
    options.connect_timeout_ms = config_.redis.connect_timeout_ms;
    options.publish_health = config_.publish_health;
    options.enabled_metrics = enabled_redis_metrics(config_);
    redis_sink_ = std::make_unique<sinks::RedisTsSink>(options);

    const std::string address =
        !options.unix_socket.empty() ? "unix://" + options.unix_socket : options.host + ':' + std::to_string(options.port);
    if (redis_sink_->check_connectivity()) {
      std::cerr << "[agent] redis connectivity confirmed at " << address << '\n';
    } else {
      std::cerr << "[agent] redis connectivity check failed at " << address << '\n';
    }
  }
}

Orchestrator::~Orchestrator() { stop(); }

void Orchestrator::start() {
  if (poll_thread_.joinable() || animation_thread_.joinable()) {
    return;
  }

  stopping_.store(false);
  poll_thread_ = std::jthread([this](std::stop_token stop) { poll_loop(stop); });
  animation_thread_ = std::jthread([this](std::stop_token stop) { animation_loop(stop); });
}

void Orchestrator::stop() {
  stopping_.store(true);

  if (poll_thread_.joinable()) {
    poll_thread_.request_stop();
  }
  if (animation_thread_.joinable()) {
    animation_thread_.request_stop();
  }
  if (poll_thread_.joinable()) {
    poll_thread_.join();
  }
  if (animation_thread_.joinable()) {
    animation_thread_.join();
  }
}

bool Orchestrator::running() const noexcept {
  return !stopping_.load() && (poll_thread_.joinable() || animation_thread_.joinable());
}

void Orchestrator::set_mode(const model::focus_mode mode) noexcept { requested_mode_.store(mode); }

void Orchestrator::set_thresholds(const model::threshold_config& thresholds) {
  validate_thresholds(thresholds);

  const std::lock_guard<std::mutex> lock(pending_mutex_);
  pending_thresholds_ = thresholds;
}

MoodSnapshot Orchestrator::mood() const noexcept { return unpack(mood_cell_.load(std::memory_order_acquire)); }

std::uint64_t Orchestrator::pack(const MoodSnapshot& mood) noexcept {
  const auto score_bits = static_cast<std::uint64_t>(std::bit_cast<std::uint32_t>(mood.stress_score));
  const auto state_bits = static_cast<std::uint64_t>(static_cast<std::uint8_t>(mood.state)) << kStateShift;
  const auto mode_bits = static_cast<std::uint64_t>(static_cast<std::uint8_t>(mood.mode)) << kModeShift;
  return mode_bits | state_bits | score_bits;
}

MoodSnapshot Orchestrator::unpack(const std::uint64_t cell) noexcept {
  return MoodSnapshot{
      .state = static_cast<model::emotion_state>((cell >> kStateShift) & 0xFFU),
      .stress_score = std::bit_cast<float>(static_cast<std::uint32_t>(cell & kScoreMask)),
      .mode = static_cast<model::focus_mode>((cell >> kModeShift) & 0xFFU),
  };
}

void Orchestrator::apply_pending() {
  const model::focus_mode requested = requested_mode_.load();
  if (requested != applied_mode_) {
    std::cerr << "[agent] focus mode " << model::to_string(applied_mode_) << " -> " << model::to_string(requested)
              << '\n';
    applied_mode_ = requested;
  }

  const std::lock_guard<std::mutex> lock(pending_mutex_);
  if (pending_thresholds_.has_value()) {
    config_.thresholds = *pending_thresholds_;
    pending_thresholds_.reset();
    std::cerr << "[agent] thresholds updated\n";
  }
}

model::raw_metrics Orchestrator::read_source() {
  try {
    model::raw_metrics raw = source_->sample();
    if (!source_was_ok_) {
      std::cerr << "[agent] metric source recovered\n";
      source_was_ok_ = true;
    }
    return raw;
  } catch (const std::exception& ex) {
    if (source_was_ok_) {
      std::cerr << "[agent] metric source failed: " << ex.what() << "; treating metrics as unavailable\n";
    }
  } catch (...) {
    if (source_was_ok_) {
      std::cerr << "[agent] metric source failed: unknown error; treating metrics as unavailable\n";
    }
  }
  source_was_ok_ = false;
  return model::raw_metrics{.timestamp_ns = monotonic_timestamp_now_ns()};
}

bool Orchestrator::run_poll_cycle() {
  if (stopping_.load()) {
    return false;
  }

  const auto cycle_start = Clock::now();
  apply_pending();

  const model::raw_metrics raw = read_source();
  if (stopping_.load()) {
    return false;
  }

  const model::metric_sample sample = gate_.admit(raw);
  const mood::Classification classification = classifier_.classify(sample, applied_mode_);
  const float trend = trend_.sample(sample, classification.stress_score);
  const mood::TrackerUpdate update = tracker_.update(classification.state, sample.timestamp_ns);

  if (update.changed) {
    std::cerr << "[agent] mood -> " << model::to_string(update.committed);
    if (classification.stressors != 0) {
      std::cerr << " (" << mood::describe_stressors(sample, classification.stressors) << ')';
    }
    std::cerr << '\n';
  }

  mood_cell_.store(pack(MoodSnapshot{.state = update.committed, .stress_score = trend, .mode = applied_mode_}),
                   std::memory_order_release);

  frame_.timestamp = unix_timestamp_now_ms();
  frame_.cpu = sample.cpu_pct;
  frame_.ram = sample.ram_pct;
  frame_.network = sample.net_kbps;
  frame_.degraded = sample.degraded;
  frame_.raw_state = classification.state;
  frame_.state = update.committed;
  frame_.mode = applied_mode_;
  frame_.stressors = classification.stressors;
  frame_.stress_score = classification.stress_score;
  frame_.stress_trend = trend;

  publish_sinks();

  const float poll_time_ms = to_ms_float(Clock::now() - cycle_start);
  if (poll_time_ms > to_ms_float(config_.poll_interval)) {
    ++missed_polls_;
  }

  if (config_.publish_health) {
    frame_.agent.heartbeat_ms = frame_.timestamp;
    frame_.agent.poll_time_ms = poll_time_ms;
    frame_.agent.redis_errors = redis_errors_;
    frame_.agent.degraded_samples = gate_.degraded_samples();
    frame_.agent.render_failures = render_failures_.load();
    frame_.agent.missed_polls = missed_polls_;
  }

  return true;
}

void Orchestrator::publish_sinks() {
  if (config_.stdout_debug) {
    stdout_sink_.publish(frame_);
  }

  if (redis_sink_ != nullptr) {
    const bool ok = redis_sink_->publish(frame_);
    if (!ok) {
      ++redis_errors_;
      if (redis_was_ok_) {
        std::cerr << "[redis] publish failed\n";
        redis_was_ok_ = false;
      }
    } else if (!redis_was_ok_) {
      std::cerr << "[redis] publish recovered\n";
      redis_was_ok_ = true;
    }
  }
}

void Orchestrator::run_animation_tick(const Clock::time_point now) {
  if (stopping_.load()) {
    return;
  }

  const MoodSnapshot snapshot = mood();
  if (snapshot.state != scheduler_.active_state()) {
    scheduler_.set_state(snapshot.state);
    // A restarted sequence always gets drawn, even if it starts on the same handle.
    last_rendered_.reset();
  }
  scheduler_.set_stress(snapshot.stress_score);

  const model::frame_handle frame = scheduler_.tick(now);
  if (last_rendered_.has_value() && *last_rendered_ == frame) {
    return;
  }
  if (!render_) {
    last_rendered_ = frame;
    return;
  }

  try {
    render_(frame, format_tooltip(snapshot));
    last_rendered_ = frame;
    if (!render_was_ok_) {
      std::cerr << "[render] recovered\n";
      render_was_ok_ = true;
    }
  } catch (const std::exception& ex) {
    render_failures_.fetch_add(1);
    if (render_was_ok_) {
      std::cerr << "[render] failed: " << ex.what() << '\n';
      render_was_ok_ = false;
    }
  } catch (...) {
    render_failures_.fetch_add(1);
    if (render_was_ok_) {
      std::cerr << "[render] failed: unknown error\n";
      render_was_ok_ = false;
    }
  }
}

void Orchestrator::poll_loop(std::stop_token stop) {
  auto next_wakeup = Clock::now();
  while (!stop.stop_requested()) {
    run_poll_cycle();

    next_wakeup += config_.poll_interval;
    const auto now = Clock::now();
    if (next_wakeup < now) {
      next_wakeup = now;
    }
    if (!sleep_until(stop, next_wakeup)) {
      break;
    }
  }
}

void Orchestrator::animation_loop(std::stop_token stop) {
  auto next_wakeup = Clock::now();
  while (!stop.stop_requested()) {
    run_animation_tick(Clock::now());

    next_wakeup += config_.animation_interval;
    const auto now = Clock::now();
    if (next_wakeup < now) {
      next_wakeup = now;
    }
    if (!sleep_until(stop, next_wakeup)) {
      break;
    }
  }
}

bool Orchestrator::sleep_until(const std::stop_token& stop, const Clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(wake_mutex_);
  wake_cv_.wait_until(lock, stop, deadline, [] { return false; });
  return !stop.stop_requested();
}

}  // namespace tuxmood::core
