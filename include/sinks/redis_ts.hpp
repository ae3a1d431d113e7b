#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "model/mood_frame.hpp"

struct redisContext;

namespace tuxmood::sinks {

struct RedisTsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"tuxmood"};
  std::uint32_t connect_timeout_ms{1000};
  bool publish_health{true};
  // Empty means every known series.
  std::vector<std::string> enabled_metrics{};
};

class RedisTsSink {
 public:
  explicit RedisTsSink(RedisTsOptions options = {});
  ~RedisTsSink();

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;
  RedisTsSink(RedisTsSink&&) noexcept;
  RedisTsSink& operator=(RedisTsSink&&) noexcept;

  bool check_connectivity();
  // Fills frame.agent.redis_latency_ms with the TS.MADD round trip.
  bool publish(model::mood_frame& frame);

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  // AUTH and SELECT, each skipped when not configured.
  bool prepare_session();
  bool ensure_schema();
  bool publish_impl(model::mood_frame& frame);
  void reserve_command_buffers();

  RedisTsOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> enabled_metrics_;
  std::unordered_set<std::string> enabled_metric_set_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
  bool timeseries_available_{true};
  bool schema_ready_{false};
};

}  // namespace tuxmood::sinks
