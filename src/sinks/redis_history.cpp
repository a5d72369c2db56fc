#include "sinks/redis_history.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>
#include <nlohmann/json.hpp>

namespace interview_agent::sinks {

RedisHistoryOptions make_redis_history_options(const core::RedisConfig& config) {
  RedisHistoryOptions options{};
  options.host = config.host;
  options.port = config.port;
  options.unix_socket = config.unix_socket;
  options.password = config.password;
  options.key_prefix = config.key_prefix;
  return options;
}

RedisHistorySink::RedisHistorySink(RedisHistoryOptions options) : options_(std::move(options)) {}

RedisHistorySink::~RedisHistorySink() = default;

void RedisHistorySink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisHistorySink::check_connectivity() {
  std::lock_guard<std::mutex> lock(mutex_);
  return ensure_connected();
}

bool RedisHistorySink::ensure_connected() {
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisHistorySink::reconnect() {
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
  if (!authenticate()) {
    context_.reset();
    return false;
  }
  return true;
}

bool RedisHistorySink::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "AUTH %s", options_.password.c_str()));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] AUTH rejected\n";
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisHistorySink::run_command(const std::vector<std::string>& args) {
  std::vector<const char*> argv;
  std::vector<std::size_t> argv_len;
  argv.reserve(args.size());
  argv_len.reserve(args.size());
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
    argv_len.push_back(arg.size());
  }

  redisReply* reply = static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(argv.size()), argv.data(), argv_len.data()));
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] " << args.front() << " failed: " << (reply->str != nullptr ? reply->str : "unknown")
              << '\n';
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisHistorySink::run_with_retry(const std::vector<std::string>& args) {
  if (!ensure_connected()) {
    return false;
  }
  if (run_command(args)) {
    return true;
  }
  if (!reconnect()) {
    return false;
  }
  return run_command(args);
}

bool RedisHistorySink::record_evaluation(const std::string& session_id, const model::history_entry& entry) {
  const nlohmann::json payload = entry;
  std::lock_guard<std::mutex> lock(mutex_);
  return run_with_retry({"RPUSH", options_.key_prefix + ":session:" + session_id + ":history", payload.dump()});
}

bool RedisHistorySink::save_interview(const model::interview_record& record) {
  const nlohmann::json payload = record;
  std::lock_guard<std::mutex> lock(mutex_);
  if (!run_with_retry({"SET", options_.key_prefix + ":session:" + record.session_id, payload.dump()})) {
    return false;
  }

  if (std::find(indexed_sessions_.begin(), indexed_sessions_.end(), record.session_id) != indexed_sessions_.end()) {
    return true;
  }
  if (!run_with_retry({"LPUSH", options_.key_prefix + ":sessions", record.session_id})) {
    return false;
  }
  indexed_sessions_.push_back(record.session_id);
  return true;
}

}  // namespace interview_agent::sinks
