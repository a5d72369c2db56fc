#include "capabilities/ollama.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace interview_agent::capabilities {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

constexpr double kTemperature = 0.2;
constexpr std::uint64_t kResponseBodyLimit = 16U * 1024U * 1024U;

}  // namespace

OllamaClient::OllamaClient(core::OllamaConfig config) : config_(std::move(config)) {}

nlohmann::json OllamaClient::post(const std::string& target, const nlohmann::json& body) const {
  net::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::tcp_stream stream(ioc);

  http::request<http::string_body> request{http::verb::post, target, 11};
  request.set(http::field::host, config_.host);
  request.set(http::field::content_type, "application/json");
  request.set(http::field::user_agent, "interview-agent");
  request.body() = body.dump();
  request.prepare_payload();

  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(kResponseBodyLimit);
  beast::error_code failure;

  // Async operations so that the stream deadline covers connect, write and read.
  resolver.async_resolve(
      config_.host, std::to_string(config_.port),
      [&](const beast::error_code& resolve_ec, const tcp::resolver::results_type& results) {
        if (resolve_ec) {
          failure = resolve_ec;
          return;
        }
        stream.expires_after(config_.timeout);
        stream.async_connect(results, [&](const beast::error_code& connect_ec, const tcp::endpoint&) {
          if (connect_ec) {
            failure = connect_ec;
            return;
          }
          http::async_write(stream, request, [&](const beast::error_code& write_ec, std::size_t) {
            if (write_ec) {
              failure = write_ec;
              return;
            }
            http::async_read(stream, buffer, parser,
                             [&](const beast::error_code& read_ec, std::size_t) { failure = read_ec; });
          });
        });
      });
  ioc.run();

  if (failure) {
    throw std::runtime_error("ollama " + target + " failed: " + failure.message());
  }

  beast::error_code shutdown_ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);

  const auto& response = parser.get();
  if (response.result() != http::status::ok) {
    throw std::runtime_error("ollama " + target + " returned HTTP " +
                             std::to_string(static_cast<unsigned>(response.result_int())) + ": " +
                             response.body().substr(0, 200));
  }

  try {
    return nlohmann::json::parse(response.body());
  } catch (const nlohmann::json::exception& ex) {
    throw std::runtime_error("ollama " + target + " returned invalid JSON: " + ex.what());
  }
}

std::string OllamaClient::generate(const std::string& model, const std::string& prompt,
                                   const std::vector<std::string>& images_base64, const bool force_json) const {
  nlohmann::json request{{"model", model},
                         {"prompt", prompt},
                         {"stream", false},
                         {"options", {{"temperature", kTemperature}}}};
  if (!images_base64.empty()) {
    request["images"] = images_base64;
  }
  if (force_json) {
    request["format"] = "json";
  }

  const auto body = post("/api/generate", request);
  const auto response_it = body.find("response");
  if (response_it == body.end() || !response_it->is_string()) {
    throw std::runtime_error("ollama /api/generate reply has no response text");
  }
  return response_it->get<std::string>();
}

std::string OllamaClient::chat(const std::string& model, const nlohmann::json& messages,
                               const bool force_json) const {
  nlohmann::json request{{"model", model},
                         {"messages", messages},
                         {"stream", false},
                         {"options", {{"temperature", kTemperature}}}};
  if (force_json) {
    request["format"] = "json";
  }

  const auto body = post("/api/chat", request);
  const auto message_it = body.find("message");
  if (message_it == body.end() || !message_it->is_object() || !message_it->contains("content") ||
      !message_it->at("content").is_string()) {
    throw std::runtime_error("ollama /api/chat reply has no message content");
  }
  return message_it->at("content").get<std::string>();
}

}  // namespace interview_agent::capabilities
