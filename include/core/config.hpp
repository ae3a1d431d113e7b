#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "model/emotion.hpp"
#include "model/thresholds.hpp"

namespace tuxmood::core {

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"tuxmood"};
  std::uint32_t connect_timeout_ms{1000};
  bool enabled{false};
};

struct AgentConfig {
  std::chrono::milliseconds poll_interval{500};
  std::chrono::milliseconds animation_interval{33};
  std::uint32_t dwell_cycles{3};
  float max_playback_multiplier{2.5F};
  float stress_smoothing_alpha{0.35F};
  model::focus_mode mode{model::focus_mode::EMOTION};
  std::string skin_dir{"assets/skins/default"};
  bool publish_health{true};
  bool stdout_debug{true};
  bool render_stdout{false};
  RedisConfig redis{};
  model::threshold_config thresholds{};
};

// Throws ConfigError when ordering or range invariants are violated.
void validate_thresholds(const model::threshold_config& thresholds);

model::focus_mode parse_focus_mode(const std::string& value);

AgentConfig load_agent_config(const std::string& path);

}  // namespace tuxmood::core
