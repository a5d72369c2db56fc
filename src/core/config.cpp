#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace interview_agent::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

double parse_positive_seconds(const std::string& key, const std::string& value) {
  const double seconds = std::stod(value);
  if (!std::isfinite(seconds) || seconds <= 0.0) {
    throw std::runtime_error(key + " must be greater than 0");
  }
  return seconds;
}

std::chrono::milliseconds seconds_to_ms(const double seconds) {
  return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
}

std::uint16_t parse_port(const std::string& key, const std::string& value) {
  const auto parsed_port = std::stoi(value);
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error(key + " must be in range 1..65535");
  }
  return static_cast<std::uint16_t>(parsed_port);
}

std::uint64_t parse_positive_integer(const std::string& key, const std::string& value) {
  const auto parsed = std::stoll(value);
  if (parsed <= 0) {
    throw std::runtime_error(key + " must be greater than 0");
  }
  return static_cast<std::uint64_t>(parsed);
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  redis.port = parse_port("redis.address port", value.substr(split + 1));
}

void apply_key_value(InterviewConfig& config, const std::string& key, const std::string& raw_value) {
  const std::string value = unquote(raw_value);

  if (key == "server.host") {
    config.server.host = value;
    return;
  }
  if (key == "server.port") {
    config.server.port = parse_port(key, value);
    return;
  }
  if (key == "server.path") {
    if (value.empty() || value.front() != '/') {
      throw std::runtime_error("server.path must start with '/'");
    }
    config.server.path = value;
    return;
  }
  if (key == "server.io_threads") {
    const auto threads = parse_positive_integer(key, value);
    if (threads > 64) {
      throw std::runtime_error("server.io_threads must be less than or equal to 64");
    }
    config.server.io_threads = static_cast<std::size_t>(threads);
    return;
  }
  if (key == "gateway.keepalive_interval_s") {
    config.server.keepalive_interval = seconds_to_ms(parse_positive_seconds(key, value));
    return;
  }

  if (key == "session.screen_grace_period_s") {
    config.session.screen_grace_period = seconds_to_ms(parse_positive_seconds(key, value));
    return;
  }
  if (key == "session.barge_in_min_rms") {
    config.session.barge_in_min_rms = std::stod(value);
    if (config.session.barge_in_min_rms < 0.0) {
      throw std::runtime_error("session.barge_in_min_rms must be greater than or equal to 0");
    }
    return;
  }
  if (key == "session.video_restores_screen") {
    config.session.video_restores_screen = parse_bool(value);
    return;
  }
  if (key == "session.opening_question") {
    config.session.opening_question = value;
    return;
  }
  if (key == "session.screen_lost_prompt") {
    config.session.screen_lost_prompt = value;
    return;
  }
  if (key == "session.screen_restored_prompt") {
    config.session.screen_restored_prompt = value;
    return;
  }
  if (key == "session.screen_timeout_prompt") {
    config.session.screen_timeout_prompt = value;
    return;
  }

  if (key == "vision.change_threshold") {
    config.vision.change_threshold = std::stod(value);
    if (config.vision.change_threshold < 0.0 || config.vision.change_threshold > 1.0) {
      throw std::runtime_error("vision.change_threshold must be in range 0..1");
    }
    return;
  }
  if (key == "vision.min_interval_s") {
    const double seconds = std::stod(value);
    if (!std::isfinite(seconds) || seconds < 0.0) {
      throw std::runtime_error("vision.min_interval_s must be greater than or equal to 0");
    }
    config.vision.min_interval = seconds_to_ms(seconds);
    return;
  }

  if (key == "transcription.command") {
    config.transcription.command = value;
    return;
  }
  if (key == "transcription.max_reconnect_attempts") {
    config.transcription.max_reconnect_attempts = static_cast<std::uint32_t>(parse_positive_integer(key, value));
    return;
  }
  if (key == "transcription.backoff_initial_ms") {
    config.transcription.backoff_initial = std::chrono::milliseconds(parse_positive_integer(key, value));
    return;
  }
  if (key == "transcription.retry_cooldown_ms") {
    config.transcription.retry_cooldown = std::chrono::milliseconds(parse_positive_integer(key, value));
    return;
  }
  if (key == "transcription.max_buffered_bytes") {
    config.transcription.max_buffered_bytes = static_cast<std::size_t>(parse_positive_integer(key, value));
    return;
  }

  if (key == "playback.command") {
    config.playback.command = value;
    return;
  }
  if (key == "playback.chunk_bytes") {
    config.playback.chunk_bytes = static_cast<std::size_t>(parse_positive_integer(key, value));
    return;
  }

  if (key == "ollama.host") {
    config.ollama.host = value;
    return;
  }
  if (key == "ollama.port") {
    config.ollama.port = parse_port(key, value);
    return;
  }
  if (key == "ollama.model") {
    config.ollama.model = value;
    return;
  }
  if (key == "ollama.vision_model") {
    config.ollama.vision_model = value;
    return;
  }
  if (key == "ollama.timeout_s") {
    config.ollama.timeout = std::chrono::seconds(parse_positive_integer(key, value));
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }
  if (key == "redis.password") {
    config.redis.password = value;
    return;
  }
  if (key == "redis.key_prefix") {
    if (value.empty()) {
      throw std::runtime_error("redis.key_prefix must not be empty");
    }
    config.redis.key_prefix = value;
  }
}

std::string strip_comment(const std::string& line) {
  char quote = '\0';
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quote != '\0') {
      if (c == quote) {
        quote = '\0';
      }
      continue;
    }
    if (c == '"' || c == '\'') {
      quote = c;
      continue;
    }
    if (c == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

}  // namespace

InterviewConfig load_interview_config(const std::string& path) {
  InterviewConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    line = strip_comment(line);

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  return config;
}

}  // namespace interview_agent::core
