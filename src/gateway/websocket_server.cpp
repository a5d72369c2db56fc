#include "gateway/websocket_server.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "core/timestamp.hpp"
#include "gateway/codec.hpp"
#include "model/errors.hpp"

namespace interview_agent::gateway {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

constexpr auto kHandshakeTimeout = std::chrono::seconds(30);
constexpr std::size_t kMaxMessageBytes = 16U * 1024U * 1024U;

std::string target_path(const beast::string_view target) {
  const auto query = target.find('?');
  return std::string(query == beast::string_view::npos ? target : target.substr(0, query));
}

class Connection;

// Hands encoded events from the session thread to the connection strand.
class ConnectionOutbound final : public session::OutboundSink {
 public:
  explicit ConnectionOutbound(std::weak_ptr<Connection> connection) : connection_(std::move(connection)) {}

  void emit(const model::outbound_event& event) override;

 private:
  std::weak_ptr<Connection> connection_;
};

class Connection : public std::enable_shared_from_this<Connection> {
 public:
  Connection(tcp::socket&& socket, ConnectionGateway& gateway, const core::ServerConfig& config)
      : ws_(std::move(socket)), keepalive_(ws_.get_executor()), gateway_(gateway), config_(config) {}

  void run() {
    net::dispatch(ws_.get_executor(), [self = shared_from_this()] { self->read_request(); });
  }

  [[nodiscard]] bool closed() const { return closed_.load(); }

  void send(std::string text) {
    net::post(ws_.get_executor(), [self = shared_from_this(), text = std::move(text)]() mutable {
      self->queue_write(std::move(text));
    });
  }

 private:
  void read_request() {
    beast::get_lowest_layer(ws_).expires_after(kHandshakeTimeout);
    http::async_read(ws_.next_layer(), buffer_, request_,
                     [self = shared_from_this()](beast::error_code ec, std::size_t) { self->on_request(ec); });
  }

  void on_request(const beast::error_code ec) {
    if (ec) {
      if (ec != http::error::end_of_stream) {
        std::cerr << "[websocket] request read failed: " << ec.message() << '\n';
      }
      return;
    }

    if (!websocket::is_upgrade(request_)) {
      reject(http::status::bad_request, "websocket upgrade required\n");
      return;
    }
    if (target_path(request_.target()) != config_.path) {
      reject(http::status::not_found, "unknown path\n");
      return;
    }

    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.read_message_max(kMaxMessageBytes);
    ws_.async_accept(request_, [self = shared_from_this()](beast::error_code accept_ec) { self->on_accept(accept_ec); });
  }

  void reject(const http::status status, const std::string& body) {
    auto response = std::make_shared<http::response<http::string_body>>(status, request_.version());
    response->set(http::field::content_type, "text/plain");
    response->keep_alive(false);
    response->body() = body;
    response->prepare_payload();
    http::async_write(ws_.next_layer(), *response,
                      [self = shared_from_this(), response](beast::error_code, std::size_t) {
                        beast::error_code ignored;
                        beast::get_lowest_layer(self->ws_).socket().shutdown(tcp::socket::shutdown_send, ignored);
                      });
  }

  void on_accept(const beast::error_code ec) {
    if (ec) {
      std::cerr << "[websocket] handshake failed: " << ec.message() << '\n';
      return;
    }

    ws_.text(true);
    last_send_ = std::chrono::steady_clock::now();
    session_id_ = gateway_.open_session(std::make_shared<ConnectionOutbound>(weak_from_this()));
    arm_keepalive();
    read_message();
  }

  void read_message() {
    ws_.async_read(buffer_, [self = shared_from_this()](beast::error_code ec, std::size_t) { self->on_read(ec); });
  }

  void on_read(const beast::error_code ec) {
    if (ec) {
      if (ec != websocket::error::closed) {
        std::cerr << "[websocket] session " << session_id_ << " read failed: " << ec.message() << '\n';
      }
      on_close();
      return;
    }

    gateway_.dispatch(session_id_, beast::buffers_to_string(buffer_.data()));
    buffer_.consume(buffer_.size());
    read_message();
  }

  void queue_write(std::string text) {
    if (closed_.load()) {
      return;
    }
    write_queue_.push_back(std::move(text));
    if (write_queue_.size() == 1) {
      write_front();
    }
  }

  void write_front() {
    ws_.async_write(net::buffer(write_queue_.front()),
                    [self = shared_from_this()](beast::error_code ec, std::size_t) { self->on_write(ec); });
  }

  void on_write(const beast::error_code ec) {
    if (ec) {
      std::cerr << "[websocket] session " << session_id_ << " write failed: " << ec.message() << '\n';
      write_queue_.clear();
      on_close();
      return;
    }

    last_send_ = std::chrono::steady_clock::now();
    write_queue_.pop_front();
    if (!write_queue_.empty()) {
      write_front();
    }
  }

  void arm_keepalive() {
    keepalive_.expires_after(config_.keepalive_interval);
    keepalive_.async_wait([self = shared_from_this()](beast::error_code ec) {
      if (ec || self->closed_.load()) {
        return;
      }
      if (std::chrono::steady_clock::now() - self->last_send_ >= self->config_.keepalive_interval) {
        self->queue_write(encode_outbound(model::keepalive_event{}, core::unix_timestamp_now_s()));
      }
      self->arm_keepalive();
    });
  }

  void on_close() {
    if (closed_.exchange(true)) {
      return;
    }
    keepalive_.cancel();
    if (!session_id_.empty()) {
      gateway_.close_session_async(session_id_);
    }
  }

  websocket::stream<beast::tcp_stream> ws_;
  net::steady_timer keepalive_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> request_;
  ConnectionGateway& gateway_;
  const core::ServerConfig& config_;
  std::string session_id_{};
  std::deque<std::string> write_queue_{};
  std::chrono::steady_clock::time_point last_send_{};
  std::atomic<bool> closed_{false};
};

void ConnectionOutbound::emit(const model::outbound_event& event) {
  const auto connection = connection_.lock();
  if (connection == nullptr || connection->closed()) {
    throw model::ConnectionError("websocket connection closed");
  }
  connection->send(encode_outbound(event, core::unix_timestamp_now_s()));
}

}  // namespace

struct WebSocketServer::Impl {
  Impl(ConnectionGateway& gateway_ref, const core::ServerConfig& server_config)
      : gateway(gateway_ref), config(server_config), ioc(static_cast<int>(server_config.io_threads)), acceptor(ioc) {}

  void accept() {
    acceptor.async_accept(net::make_strand(ioc), [this](beast::error_code ec, tcp::socket socket) {
      if (ec) {
        if (ec != net::error::operation_aborted) {
          std::cerr << "[websocket] accept failed: " << ec.message() << '\n';
        }
      } else {
        std::make_shared<Connection>(std::move(socket), gateway, config)->run();
      }
      if (acceptor.is_open()) {
        accept();
      }
    });
  }

  ConnectionGateway& gateway;
  core::ServerConfig config;
  net::io_context ioc;
  tcp::acceptor acceptor;
  std::vector<std::thread> threads{};
  bool running{false};
};

WebSocketServer::WebSocketServer(ConnectionGateway& gateway, const core::ServerConfig& config)
    : impl_(std::make_unique<Impl>(gateway, config)) {}

WebSocketServer::~WebSocketServer() { stop(); }

void WebSocketServer::start() {
  if (impl_->running) {
    return;
  }

  beast::error_code ec;
  const auto address = net::ip::make_address(impl_->config.host, ec);
  if (ec) {
    throw std::runtime_error("invalid server.host " + impl_->config.host + ": " + ec.message());
  }
  const tcp::endpoint endpoint(address, impl_->config.port);

  auto& acceptor = impl_->acceptor;
  acceptor.open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor.set_option(net::socket_base::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor.bind(endpoint, ec);
  }
  if (!ec) {
    acceptor.listen(net::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    throw std::runtime_error("unable to listen on " + impl_->config.host + ":" + std::to_string(impl_->config.port) +
                             ": " + ec.message());
  }

  impl_->running = true;
  impl_->accept();
  for (std::size_t i = 0; i < impl_->config.io_threads; ++i) {
    impl_->threads.emplace_back([this] { impl_->ioc.run(); });
  }
  std::cerr << "[websocket] listening on " << impl_->config.host << ':' << port() << impl_->config.path << '\n';
}

void WebSocketServer::stop() {
  if (!impl_->running) {
    return;
  }
  impl_->running = false;

  net::post(impl_->ioc, [this] {
    beast::error_code ignored;
    impl_->acceptor.close(ignored);
  });
  impl_->ioc.stop();
  for (auto& thread : impl_->threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  impl_->threads.clear();
}

std::uint16_t WebSocketServer::port() const {
  beast::error_code ec;
  const auto endpoint = impl_->acceptor.local_endpoint(ec);
  return ec ? impl_->config.port : endpoint.port();
}

}  // namespace interview_agent::gateway
