#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace tuxmood::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string to_lower(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool parse_bool(const std::string& value) {
  const std::string lower = to_lower(value);
  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

float parse_float(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  float parsed = 0.0F;
  try {
    parsed = std::stof(value, &consumed);
  } catch (const std::exception&) {
    throw ConfigError(key + " must be a number, got '" + value + "'");
  }
  if (consumed != value.size() || !std::isfinite(parsed)) {
    throw ConfigError(key + " must be a number, got '" + value + "'");
  }
  return parsed;
}

long long parse_integer(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::exception&) {
    throw ConfigError(key + " must be an integer, got '" + value + "'");
  }
  if (consumed != value.size()) {
    throw ConfigError(key + " must be an integer, got '" + value + "'");
  }
  return parsed;
}

long long parse_integer_in_range(const std::string& key, const std::string& value, const long long min_value,
                                 const long long max_value) {
  const long long parsed = parse_integer(key, value);
  if (parsed < min_value || parsed > max_value) {
    throw ConfigError(key + " must be in range " + std::to_string(min_value) + ".." + std::to_string(max_value));
  }
  return parsed;
}

bool apply_focus_key(model::threshold_config& thresholds, const std::string& key, const std::string& value) {
  const std::string full_key = "thresholds.modes." + key;

  model::focus_thresholds* ladder = nullptr;
  std::string field;
  if (key.rfind("cpu_", 0) == 0) {
    ladder = &thresholds.cpu_focus;
    field = key.substr(4);
  } else if (key.rfind("ram_", 0) == 0) {
    ladder = &thresholds.ram_focus;
    field = key.substr(4);
  } else if (key.rfind("network_", 0) == 0) {
    ladder = &thresholds.network_focus;
    field = key.substr(8);
    if (field.size() > 5 && field.compare(field.size() - 5, 5, "_kbps") == 0) {
      field.erase(field.size() - 5);
    }
  } else {
    return false;
  }

  if (field == "idle") {
    ladder->idle = parse_float(full_key, value);
  } else if (field == "walk") {
    ladder->walk = parse_float(full_key, value);
  } else {
    return false;
  }
  return true;
}

bool apply_threshold_key(model::threshold_config& thresholds, const std::string& key, const std::string& value) {
  const std::string full_key = "thresholds." + key;

  if (key.rfind("modes.", 0) == 0) {
    return apply_focus_key(thresholds, key.substr(std::string("modes.").size()), value);
  }

  if (key == "multiple_resources_threshold") {
    thresholds.multiple_resources_threshold = static_cast<std::uint32_t>(parse_integer_in_range(full_key, value, 1, 3));
    return true;
  }

  model::metric_thresholds* metric = nullptr;
  std::string field;
  if (key.rfind("cpu_", 0) == 0) {
    metric = &thresholds.cpu;
    field = key.substr(4);
  } else if (key.rfind("ram_", 0) == 0) {
    metric = &thresholds.ram;
    field = key.substr(4);
  } else if (key.rfind("network_", 0) == 0) {
    metric = &thresholds.network;
    field = key.substr(8);
    if (field.size() > 5 && field.compare(field.size() - 5, 5, "_kbps") == 0) {
      field.erase(field.size() - 5);
    }
  } else {
    return false;
  }

  if (field == "max") {
    metric->max = parse_float(full_key, value);
  } else if (field == "busy") {
    metric->busy = parse_float(full_key, value);
  } else if (field == "high") {
    metric->high = parse_float(full_key, value);
  } else if (field == "critical") {
    metric->critical = parse_float(full_key, value);
  } else {
    return false;
  }
  return true;
}

void apply_key_value(AgentConfig& config, const std::string& key, const std::string& value) {
  if (key == "poll_interval_ms") {
    config.poll_interval = std::chrono::milliseconds(parse_integer_in_range(key, value, 50, 60000));
    return;
  }

  if (key == "animation_interval_ms") {
    config.animation_interval = std::chrono::milliseconds(parse_integer_in_range(key, value, 5, 1000));
    return;
  }

  if (key == "dwell_cycles") {
    config.dwell_cycles = static_cast<std::uint32_t>(parse_integer_in_range(key, value, 1, 100));
    return;
  }

  if (key == "max_playback_multiplier") {
    config.max_playback_multiplier = parse_float(key, value);
    if (config.max_playback_multiplier < 1.0F || config.max_playback_multiplier > 10.0F) {
      throw ConfigError("max_playback_multiplier must be in range 1..10");
    }
    return;
  }

  if (key == "stress_smoothing_alpha") {
    config.stress_smoothing_alpha = parse_float(key, value);
    if (config.stress_smoothing_alpha <= 0.0F || config.stress_smoothing_alpha > 1.0F) {
      throw ConfigError("stress_smoothing_alpha must be in range (0, 1]");
    }
    return;
  }

  if (key == "mode") {
    config.mode = parse_focus_mode(value);
    return;
  }

  if (key == "skin_dir") {
    config.skin_dir = value;
    return;
  }

  if (key == "agent.publish_health") {
    config.publish_health = parse_bool(value);
    return;
  }

  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "agent.render_stdout") {
    config.render_stdout = parse_bool(value);
    return;
  }

  if (key == "redis.address") {
    config.redis.enabled = !value.empty();
    if (value.rfind("unix://", 0) == 0) {
      config.redis.unix_socket = value.substr(std::string("unix://").size());
      config.redis.host.clear();
      config.redis.port = 0;
      return;
    }

    if (!value.empty() && value.front() == '/') {
      config.redis.unix_socket = value;
      config.redis.host.clear();
      config.redis.port = 0;
      return;
    }

    config.redis.unix_socket.clear();
    const auto split = value.find(':');
    if (split == std::string::npos) {
      config.redis.host = value;
      return;
    }

    config.redis.host = value.substr(0, split);
    config.redis.port =
        static_cast<std::uint16_t>(parse_integer_in_range("redis.address port", value.substr(split + 1), 1, 65535));
    return;
  }

  if (key == "redis.password") {
    config.redis.password = value;
    return;
  }

  if (key == "redis.db") {
    config.redis.db = static_cast<int>(parse_integer_in_range(key, value, 0, 15));
    return;
  }

  if (key == "redis.key_prefix") {
    config.redis.key_prefix = value;
    return;
  }

  if (key == "redis.connect_timeout_ms") {
    config.redis.connect_timeout_ms = static_cast<std::uint32_t>(parse_integer_in_range(key, value, 10, 60000));
    return;
  }

  if (key.rfind("thresholds.", 0) == 0) {
    (void)apply_threshold_key(config.thresholds, key.substr(std::string("thresholds.").size()), value);
  }
}

void validate_metric(const char* name, const model::metric_thresholds& metric) {
  const std::string prefix = std::string("thresholds.") + name;
  for (const float value : {metric.max, metric.busy, metric.high, metric.critical}) {
    if (!std::isfinite(value) || value < 0.0F) {
      throw ConfigError(prefix + " values must be finite and non-negative");
    }
  }
  if (metric.max > metric.busy) {
    throw ConfigError(prefix + ": max must not exceed busy");
  }
  if (metric.busy > metric.high) {
    throw ConfigError(prefix + ": busy must not exceed high");
  }
  if (metric.high > metric.critical) {
    throw ConfigError(prefix + ": high must not exceed critical");
  }
  if (metric.max >= metric.critical) {
    throw ConfigError(prefix + ": max must be below critical");
  }
}

void validate_focus(const char* name, const model::focus_thresholds& ladder) {
  const std::string prefix = std::string("thresholds.modes.") + name;
  if (!std::isfinite(ladder.idle) || !std::isfinite(ladder.walk) || ladder.idle < 0.0F) {
    throw ConfigError(prefix + " values must be finite and non-negative");
  }
  if (ladder.idle >= ladder.walk) {
    throw ConfigError(prefix + ": idle must be below walk");
  }
}

}  // namespace

void validate_thresholds(const model::threshold_config& thresholds) {
  validate_metric("cpu", thresholds.cpu);
  validate_metric("ram", thresholds.ram);
  validate_metric("network", thresholds.network);
  validate_focus("cpu", thresholds.cpu_focus);
  validate_focus("ram", thresholds.ram_focus);
  validate_focus("network", thresholds.network_focus);

  if (thresholds.multiple_resources_threshold < 1 || thresholds.multiple_resources_threshold > 3) {
    throw ConfigError("thresholds.multiple_resources_threshold must be in range 1..3");
  }
}

model::focus_mode parse_focus_mode(const std::string& value) {
  const std::string lower = to_lower(trim(value));
  if (lower == "emotion") {
    return model::focus_mode::EMOTION;
  }
  if (lower == "cpu") {
    return model::focus_mode::CPU;
  }
  if (lower == "ram") {
    return model::focus_mode::RAM;
  }
  if (lower == "network") {
    return model::focus_mode::NETWORK;
  }
  throw ConfigError("mode must be one of emotion, cpu, ram, network; got '" + value + "'");
}

AgentConfig load_agent_config(const std::string& path) {
  AgentConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw ConfigError("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  if (config.animation_interval >= config.poll_interval) {
    throw ConfigError("animation_interval_ms must be shorter than poll_interval_ms");
  }

  validate_thresholds(config.thresholds);
  return config;
}

}  // namespace tuxmood::core
