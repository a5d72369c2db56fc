#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

#include "core/config.hpp"
#include "core/mailbox.hpp"
#include "pipeline/frame_similarity.hpp"
#include "session/outbound_sink.hpp"
#include "session/state_machine.hpp"

namespace interview_agent::gateway {

// Owns every live session, keyed by session id. Transports open a session per
// connection, feed it raw client messages and close it when the channel ends.
class ConnectionGateway {
 public:
  using ComparatorFactory = std::function<std::unique_ptr<pipeline::FrameComparator>()>;

  ConnectionGateway(core::InterviewConfig config, session::SessionServices services,
                    ComparatorFactory comparator_factory);
  ~ConnectionGateway();

  ConnectionGateway(const ConnectionGateway&) = delete;
  ConnectionGateway& operator=(const ConnectionGateway&) = delete;

  std::string open_session(std::shared_ptr<session::OutboundSink> outbound);
  // Malformed messages are logged and dropped; returns whether the message was delivered.
  bool dispatch(const std::string& session_id, std::string_view raw);
  bool close_session(const std::string& session_id);
  // Hands the session to the retire worker; safe to call from the session's own thread.
  void close_session_async(const std::string& session_id);
  void close_all();

  [[nodiscard]] std::size_t active_sessions() const;
  [[nodiscard]] bool session_busy(const std::string& session_id) const;
  // Sessions handed to close_session_async() that are not torn down yet.
  [[nodiscard]] std::size_t retiring_sessions() const { return retiring_count_.load(); }
  [[nodiscard]] const core::InterviewConfig& config() const { return config_; }

 private:
  std::string next_session_id();
  std::shared_ptr<session::SessionStateMachine> find(const std::string& session_id) const;
  std::shared_ptr<session::SessionStateMachine> take(const std::string& session_id);
  void run_retire_worker();

  core::InterviewConfig config_;
  session::SessionServices services_;
  ComparatorFactory comparator_factory_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<session::SessionStateMachine>> sessions_;
  std::uint64_t session_counter_{0};

  core::Mailbox<std::shared_ptr<session::SessionStateMachine>> retiring_;
  std::atomic<std::size_t> retiring_count_{0};
  std::thread retire_worker_;
};

}  // namespace interview_agent::gateway
