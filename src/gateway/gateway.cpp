#include "gateway/gateway.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "core/timestamp.hpp"
#include "gateway/codec.hpp"

namespace interview_agent::gateway {

ConnectionGateway::ConnectionGateway(core::InterviewConfig config, session::SessionServices services,
                                     ComparatorFactory comparator_factory)
    : config_(std::move(config)), services_(services), comparator_factory_(std::move(comparator_factory)) {
  retire_worker_ = std::thread([this] { run_retire_worker(); });
}

ConnectionGateway::~ConnectionGateway() {
  close_all();
  retiring_.close();
  if (retire_worker_.joinable()) {
    retire_worker_.join();
  }
}

void ConnectionGateway::run_retire_worker() {
  while (auto machine = retiring_.pop()) {
    const std::string session_id = (*machine)->id();
    (*machine)->shutdown();
    machine->reset();
    retiring_count_ -= 1;
    std::cerr << "[gateway] session " << session_id << " retired (" << active_sessions() << " active)\n";
  }
}

std::string ConnectionGateway::next_session_id() {
  std::lock_guard<std::mutex> lock(mutex_);
  session_counter_ += 1;
  return core::local_time_string("%Y%m%d_%H%M%S") + "-" + std::to_string(session_counter_);
}

std::string ConnectionGateway::open_session(std::shared_ptr<session::OutboundSink> outbound) {
  const std::string session_id = next_session_id();
  auto machine = std::make_shared<session::SessionStateMachine>(session_id, config_, services_,
                                                                comparator_factory_(), std::move(outbound));
  machine->set_fatal_handler([this](const std::string& failed_id) { close_session_async(failed_id); });

  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.emplace(session_id, machine);
  }
  machine->start();
  std::cerr << "[gateway] session " << session_id << " opened (" << active_sessions() << " active)\n";
  return session_id;
}

std::shared_ptr<session::SessionStateMachine> ConnectionGateway::find(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(session_id);
  return it != sessions_.end() ? it->second : nullptr;
}

std::shared_ptr<session::SessionStateMachine> ConnectionGateway::take(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  auto machine = std::move(it->second);
  sessions_.erase(it);
  return machine;
}

bool ConnectionGateway::dispatch(const std::string& session_id, const std::string_view raw) {
  const auto machine = find(session_id);
  if (machine == nullptr) {
    std::cerr << "[gateway] message for unknown session " << session_id << " dropped\n";
    return false;
  }

  try {
    return machine->deliver(decode_inbound(raw, core::monotonic_timestamp_now_ns()));
  } catch (const std::invalid_argument& ex) {
    std::cerr << "[gateway] session " << session_id << ": dropping malformed message: " << ex.what() << '\n';
    return false;
  }
}

bool ConnectionGateway::close_session(const std::string& session_id) {
  const auto machine = take(session_id);
  if (machine == nullptr) {
    return false;
  }
  machine->shutdown();
  std::cerr << "[gateway] session " << session_id << " removed (" << active_sessions() << " active)\n";
  return true;
}

void ConnectionGateway::close_session_async(const std::string& session_id) {
  // Counted before leaving the registry so the session is never invisible to both.
  retiring_count_ += 1;
  auto machine = take(session_id);
  if (machine == nullptr) {
    retiring_count_ -= 1;
    return;
  }

  if (!retiring_.push(machine)) {
    retiring_count_ -= 1;
    std::cerr << "[gateway] session " << session_id << " closed while the gateway shuts down\n";
  }
}

void ConnectionGateway::close_all() {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ids.reserve(sessions_.size());
    for (const auto& [session_id, _] : sessions_) {
      ids.push_back(session_id);
    }
  }
  for (const auto& session_id : ids) {
    close_session(session_id);
  }
}

std::size_t ConnectionGateway::active_sessions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

bool ConnectionGateway::session_busy(const std::string& session_id) const {
  const auto machine = find(session_id);
  return machine != nullptr && machine->busy();
}

}  // namespace interview_agent::gateway
