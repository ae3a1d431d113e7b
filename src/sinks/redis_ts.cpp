#include "sinks/redis_ts.hpp"

#include "core/timestamp.hpp"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstring>
#include <iostream>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace tuxmood::sinks {
namespace {

constexpr std::size_t kMetricCountBase = 7;
constexpr std::size_t kMetricCountHealth = 7;
constexpr std::size_t kMaxMetricCount = kMetricCountBase + kMetricCountHealth;
constexpr std::size_t kMaxCommandArgCount = 1 + (kMaxMetricCount * 3);

double sanitize_value(const float value) {
  return std::isfinite(value) ? static_cast<double>(value) : 0.0;
}

void add_metric_args(std::vector<std::string>& args, const std::string& key_prefix,
                     const std::uint64_t timestamp_ms, const char* suffix, const double value) {
  args.emplace_back(key_prefix + ":" + suffix);
  args.emplace_back(std::to_string(timestamp_ms));
  args.emplace_back(std::to_string(value));
}

std::vector<std::string> default_metric_suffixes(const bool publish_health) {
  std::vector<std::string> suffixes = {
      "raw:cpu",
      "raw:ram",
      "raw:network",
      "mood:raw_state",
      "mood:state",
      "mood:stress_score",
      "mood:stress_trend",
  };
  if (publish_health) {
    suffixes.insert(suffixes.end(), {
                                        "agent:heartbeat",
                                        "agent:poll_time",
                                        "agent:redis_latency",
                                        "agent:redis_errors",
                                        "agent:degraded_samples",
                                        "agent:render_failures",
                                        "agent:missed_polls",
                                    });
  }
  return suffixes;
}

// Frees the reply. Empty on success, the error text otherwise.
std::string session_command_error(redisReply* reply) {
  if (reply == nullptr) {
    return "no reply";
  }
  std::string error;
  if (reply->type == REDIS_REPLY_ERROR) {
    error = reply->str != nullptr ? reply->str : "error";
  }
  freeReplyObject(reply);
  return error;
}

}  // namespace

RedisTsSink::RedisTsSink(RedisTsOptions options) : options_(std::move(options)) {
  enabled_metrics_ = options_.enabled_metrics.empty() ? default_metric_suffixes(options_.publish_health)
                                                      : options_.enabled_metrics;
  enabled_metric_set_ = std::unordered_set<std::string>(enabled_metrics_.begin(), enabled_metrics_.end());
  reserve_command_buffers();
}

RedisTsSink::~RedisTsSink() = default;

RedisTsSink::RedisTsSink(RedisTsSink&&) noexcept = default;
RedisTsSink& RedisTsSink::operator=(RedisTsSink&&) noexcept = default;

bool RedisTsSink::check_connectivity() {
  return ensure_connected();
}

void RedisTsSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisTsSink::ensure_connected() {
  if (!timeseries_available_) {
    return false;
  }

  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisTsSink::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return false;
  }

  context_.reset(raw);
  if (!prepare_session() || !ensure_schema()) {
    context_.reset();
    return false;
  }

  return true;
}

bool RedisTsSink::prepare_session() {
  if (!options_.password.empty()) {
    const std::string reply = session_command_error(
        static_cast<redisReply*>(redisCommand(context_.get(), "AUTH %s", options_.password.c_str())));
    if (!reply.empty()) {
      std::cerr << "[redis] AUTH rejected: " << reply << '\n';
      return false;
    }
  }

  if (options_.db != 0) {
    const std::string reply =
        session_command_error(static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db)));
    if (!reply.empty()) {
      std::cerr << "[redis] SELECT " << options_.db << " failed: " << reply << '\n';
      return false;
    }
  }

  return true;
}

bool RedisTsSink::ensure_schema() {
  if (schema_ready_) {
    return true;
  }

  for (const auto& suffix : enabled_metrics_) {
    const std::string key = options_.key_prefix + ":" + suffix;
    redisReply* reply = static_cast<redisReply*>(
        redisCommand(context_.get(), "TS.CREATE %s DUPLICATE_POLICY LAST", key.c_str()));
    if (reply == nullptr) {
      return false;
    }

    const bool already_exists =
        reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "already exists") != nullptr;
    const bool unknown_command =
        reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "unknown command") != nullptr;
    const bool ok = reply->type != REDIS_REPLY_ERROR || already_exists;
    const std::string reply_message = reply->str != nullptr ? reply->str : "unknown";
    freeReplyObject(reply);

    if (unknown_command) {
      std::cerr << "[redis] RedisTimeSeries module not available (TS.CREATE unknown command)\n";
      timeseries_available_ = false;
      return false;
    }
    if (!ok) {
      std::cerr << "[redis] schema error on TS.CREATE " << key << ": " << reply_message << '\n';
      return false;
    }
  }

  schema_ready_ = true;
  return true;
}

bool RedisTsSink::publish(model::mood_frame& frame) {
  if (!ensure_connected()) {
    return false;
  }

  if (publish_impl(frame)) {
    return true;
  }

  if (!reconnect()) {
    return false;
  }
  return publish_impl(frame);
}

bool RedisTsSink::publish_impl(model::mood_frame& frame) {
  const std::uint64_t timestamp_ms = frame.timestamp;

  command_args_.clear();
  command_argv_.clear();
  command_argv_len_.clear();
  command_args_.emplace_back("TS.MADD");

  const auto append_metric = [&](const char* suffix, const double value) {
    if (enabled_metric_set_.find(suffix) == enabled_metric_set_.end()) {
      return;
    }
    add_metric_args(command_args_, options_.key_prefix, timestamp_ms, suffix, value);
  };

  append_metric("raw:cpu", sanitize_value(frame.cpu));
  append_metric("raw:ram", sanitize_value(frame.ram));
  append_metric("raw:network", sanitize_value(frame.network));
  append_metric("mood:raw_state", static_cast<double>(static_cast<std::uint8_t>(frame.raw_state)));
  append_metric("mood:state", static_cast<double>(static_cast<std::uint8_t>(frame.state)));
  append_metric("mood:stress_score", sanitize_value(frame.stress_score));
  append_metric("mood:stress_trend", sanitize_value(frame.stress_trend));

  if (options_.publish_health) {
    append_metric("agent:heartbeat", static_cast<double>(frame.agent.heartbeat_ms));
    append_metric("agent:poll_time", sanitize_value(frame.agent.poll_time_ms));
    append_metric("agent:redis_latency", sanitize_value(frame.agent.redis_latency_ms));
    append_metric("agent:redis_errors", static_cast<double>(frame.agent.redis_errors));
    append_metric("agent:degraded_samples", static_cast<double>(frame.agent.degraded_samples));
    append_metric("agent:render_failures", static_cast<double>(frame.agent.render_failures));
    append_metric("agent:missed_polls", static_cast<double>(frame.agent.missed_polls));
  }

  if (command_args_.size() == 1) {
    return true;
  }

  for (const auto& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  const auto publish_start = core::Clock::now();
  redisReply* reply = static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(),
                       command_argv_len_.data()));
  const auto publish_end = core::Clock::now();
  frame.agent.redis_latency_ms = core::to_ms_float(publish_end - publish_start);
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

void RedisTsSink::reserve_command_buffers() {
  command_args_.reserve(kMaxCommandArgCount);
  command_argv_.reserve(kMaxCommandArgCount);
  command_argv_len_.reserve(kMaxCommandArgCount);
}

}  // namespace tuxmood::sinks
