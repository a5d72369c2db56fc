#pragma once

#include <chrono>
#include <iosfwd>

#include "gateway/gateway.hpp"

namespace interview_agent::gateway {

// Runs one session over line-delimited JSON: each input line is a client
// message and each output line an outbound event. At end of input the session
// is given up to drain_timeout to finish outstanding work before it is closed.
class StdioTransport {
 public:
  StdioTransport(ConnectionGateway& gateway, std::chrono::milliseconds drain_timeout);

  int run(std::istream& in, std::ostream& out, std::ostream& err);

 private:
  ConnectionGateway& gateway_;
  std::chrono::milliseconds drain_timeout_;
};

}  // namespace interview_agent::gateway
