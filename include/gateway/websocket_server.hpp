#pragma once

#include <cstdint>
#include <memory>

#include "core/config.hpp"
#include "gateway/gateway.hpp"

namespace interview_agent::gateway {

// WebSocket endpoint. Each accepted connection on the configured path becomes
// one gateway session; text frames are client messages.
class WebSocketServer {
 public:
  WebSocketServer(ConnectionGateway& gateway, const core::ServerConfig& config);
  ~WebSocketServer();

  WebSocketServer(const WebSocketServer&) = delete;
  WebSocketServer& operator=(const WebSocketServer&) = delete;

  // Binds the listener and starts the I/O threads. Throws std::runtime_error
  // when the address cannot be bound.
  void start();
  void stop();

  // Port actually bound; differs from the configured one when that was 0.
  [[nodiscard]] std::uint16_t port() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace interview_agent::gateway
