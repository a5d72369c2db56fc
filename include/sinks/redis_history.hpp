#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "sinks/history_sink.hpp"

struct redisContext;

namespace interview_agent::sinks {

struct RedisHistoryOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  std::string key_prefix{"interview"};
  std::uint32_t connect_timeout_ms{1000};
};

RedisHistoryOptions make_redis_history_options(const core::RedisConfig& config);

// Keys written:
//   <prefix>:session:<id>:history   RPUSH of one JSON entry per evaluation
//   <prefix>:session:<id>           SET of the latest interview record JSON
//   <prefix>:sessions               LPUSH of the session id on first save
class RedisHistorySink final : public HistorySink {
 public:
  explicit RedisHistorySink(RedisHistoryOptions options = {});
  ~RedisHistorySink() override;

  RedisHistorySink(const RedisHistorySink&) = delete;
  RedisHistorySink& operator=(const RedisHistorySink&) = delete;

  bool check_connectivity();
  bool record_evaluation(const std::string& session_id, const model::history_entry& entry) override;
  bool save_interview(const model::interview_record& record) override;

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool run_command(const std::vector<std::string>& args);
  bool run_with_retry(const std::vector<std::string>& args);

  RedisHistoryOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> indexed_sessions_;
  std::mutex mutex_;
};

}  // namespace interview_agent::sinks
