#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include "capabilities/ollama.hpp"
#include "capabilities/synthesizer.hpp"
#include "capabilities/transcriber.hpp"
#include "core/config.hpp"
#include "gateway/gateway.hpp"
#include "gateway/stdio_transport.hpp"
#include "gateway/websocket_server.hpp"
#include "pipeline/frame_similarity.hpp"
#include "sinks/history_sink.hpp"
#include "sinks/redis_history.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

constexpr auto kShutdownPollInterval = std::chrono::milliseconds(200);
constexpr auto kStdioDrainSlack = std::chrono::seconds(10);

}  // namespace

std::string format_config_settings(const interview_agent::core::InterviewConfig& config,
                                   const std::string& config_path) {
  std::ostringstream output;
  output << "[interview-agent] loaded config from " << config_path << " | listen=" << config.server.host << ':'
         << config.server.port << config.server.path << " | io_threads=" << config.server.io_threads
         << " | screen_grace_period_ms=" << config.session.screen_grace_period.count()
         << " | vision_change_threshold=" << config.vision.change_threshold
         << " | vision_min_interval_ms=" << config.vision.min_interval.count()
         << " | transcription=" << (config.transcription.command.empty() ? "none" : "process")
         << " | playback=" << (config.playback.command.empty() ? "silent" : "process")
         << " | ollama=" << config.ollama.host << ':' << config.ollama.port << '/' << config.ollama.model
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false") << " | redis_address=";

  if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port;
  }
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);
  std::signal(SIGPIPE, SIG_IGN);

  std::string config_path = "configs/interview.yaml";
  bool stdio_mode = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--stdio") {
      stdio_mode = true;
    } else {
      config_path = arg;
    }
  }

  interview_agent::core::InterviewConfig config{};
  try {
    config = interview_agent::core::load_interview_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  namespace capabilities = interview_agent::capabilities;
  namespace sinks = interview_agent::sinks;

  std::unique_ptr<capabilities::Transcriber> transcriber;
  std::unique_ptr<capabilities::Synthesizer> synthesizer;
  try {
    if (config.transcription.command.empty()) {
      std::cerr << "[interview-agent] transcription.command not set; audio will not be transcribed\n";
      transcriber = capabilities::make_none_transcriber();
    } else {
      transcriber = capabilities::make_process_transcriber(config.transcription);
    }
    synthesizer = config.playback.command.empty() ? capabilities::make_silent_synthesizer()
                                                  : capabilities::make_process_synthesizer(config.playback);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  const auto ollama = std::make_shared<const capabilities::OllamaClient>(config.ollama);
  const auto vision = capabilities::make_ollama_vision_analyzer(ollama);
  const auto generator = capabilities::make_ollama_question_generator(ollama);
  const auto summarizer = capabilities::make_ollama_report_summarizer(ollama);

  std::unique_ptr<sinks::HistorySink> history;
  if (config.redis.enabled) {
    history = std::make_unique<sinks::RedisHistorySink>(sinks::make_redis_history_options(config.redis));
  } else {
    history = sinks::make_none_history_sink();
  }

  interview_agent::gateway::ConnectionGateway gateway{
      config,
      interview_agent::session::SessionServices{
          .transcriber = *transcriber,
          .vision = *vision,
          .generator = *generator,
          .summarizer = *summarizer,
          .synthesizer = *synthesizer,
          .history = *history,
      },
      [] { return interview_agent::pipeline::make_ssim_comparator(); },
  };

  if (stdio_mode) {
    const auto drain_timeout =
        std::chrono::duration_cast<std::chrono::milliseconds>(config.ollama.timeout + kStdioDrainSlack);
    interview_agent::gateway::StdioTransport transport{gateway, drain_timeout};
    return transport.run(std::cin, std::cout, std::cerr);
  }

  interview_agent::gateway::WebSocketServer server{gateway, config.server};
  try {
    server.start();
  } catch (const std::exception& ex) {
    std::cerr << "server error: " << ex.what() << '\n';
    return 1;
  }

  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(kShutdownPollInterval);
  }

  std::cerr << "[interview-agent] shutdown signal received; closing " << gateway.active_sessions()
            << " session(s)\n";
  server.stop();
  gateway.close_all();

  return 0;
}
