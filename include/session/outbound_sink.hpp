#pragma once

#include "model/messages.hpp"

namespace interview_agent::session {

// Client-bound side of one connection. Events arrive in emission order.
class OutboundSink {
 public:
  // Throws model::ConnectionError when the channel is gone.
  virtual void emit(const model::outbound_event& event) = 0;
  virtual ~OutboundSink() = default;
};

}  // namespace interview_agent::session
