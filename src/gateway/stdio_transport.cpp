#include "gateway/stdio_transport.hpp"

#include <cstddef>
#include <istream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

#include "core/timestamp.hpp"
#include "gateway/codec.hpp"
#include "model/errors.hpp"

namespace interview_agent::gateway {
namespace {

constexpr auto kDrainPollInterval = std::chrono::milliseconds(20);

class StreamOutboundSink final : public session::OutboundSink {
 public:
  explicit StreamOutboundSink(std::ostream& out) : out_(out) {}

  void emit(const model::outbound_event& event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failed_) {
      throw model::ConnectionError("output stream closed");
    }
    out_ << encode_outbound(event, core::unix_timestamp_now_s()) << '\n';
    out_.flush();
    if (!out_) {
      failed_ = true;
      throw model::ConnectionError("output stream closed");
    }
  }

  [[nodiscard]] bool failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
  }

 private:
  std::ostream& out_;
  mutable std::mutex mutex_;
  bool failed_{false};
};

}  // namespace

StdioTransport::StdioTransport(ConnectionGateway& gateway, const std::chrono::milliseconds drain_timeout)
    : gateway_(gateway), drain_timeout_(drain_timeout) {}

int StdioTransport::run(std::istream& in, std::ostream& out, std::ostream& err) {
  auto sink = std::make_shared<StreamOutboundSink>(out);
  const std::string session_id = gateway_.open_session(sink);
  err << "interview-agent: stdio session " << session_id << " ready\n";

  std::string line;
  std::size_t dropped = 0;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }
    if (!gateway_.dispatch(session_id, line)) {
      dropped += 1;
    }
  }

  const auto deadline = std::chrono::steady_clock::now() + drain_timeout_;
  while (gateway_.session_busy(session_id) && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(kDrainPollInterval);
  }
  if (gateway_.session_busy(session_id)) {
    err << "interview-agent: closing session " << session_id << " with work still outstanding\n";
  }

  gateway_.close_session(session_id);
  if (dropped > 0) {
    err << "interview-agent: " << dropped << " input line(s) dropped\n";
  }
  return sink->failed() ? 1 : 0;
}

}  // namespace interview_agent::gateway
