#include "model/interview.hpp"

#include <cmath>
#include <cstddef>

namespace interview_agent::model {

const char* to_string(const session_state state) noexcept {
  switch (state) {
    case session_state::IDLE:
      return "idle";
    case session_state::CONNECTING:
      return "connecting";
    case session_state::LISTENING:
      return "listening";
    case session_state::THINKING:
      return "thinking";
    case session_state::SPEAKING:
      return "speaking";
    case session_state::STOPPED:
      return "stopped";
    case session_state::COMPLETE:
      return "complete";
  }
  return "unknown";
}

const char* to_string(const screen_state state) noexcept {
  return state == screen_state::SCREEN_OK ? "screen_ok" : "screen_lost";
}

const char* to_string(const segment_kind kind) noexcept {
  return kind == segment_kind::FINAL ? "final" : "interim";
}

double linear16_rms(const byte_buffer& samples) noexcept {
  const std::size_t count = samples.size() / 2;
  if (count == 0) {
    return 0.0;
  }

  double sum_squares = 0.0;
  for (std::size_t i = 0; i < count; ++i) {
    const auto low = static_cast<std::uint16_t>(samples[2 * i]);
    const auto high = static_cast<std::uint16_t>(samples[(2 * i) + 1]);
    const auto sample = static_cast<std::int16_t>(static_cast<std::uint16_t>(low | (high << 8U)));
    const double normalized = static_cast<double>(sample) / 32768.0;
    sum_squares += normalized * normalized;
  }
  return std::sqrt(sum_squares / static_cast<double>(count));
}

void to_json(nlohmann::json& out, const evaluation& value) {
  out = nlohmann::json{{"score", value.score},
                       {"next_question", value.next_question},
                       {"conflict_detected", value.conflict_detected},
                       {"feedback", value.feedback},
                       {"topic", value.topic}};
}

void to_json(nlohmann::json& out, const history_entry& value) {
  out = nlohmann::json{{"sequence", value.sequence},
                       {"transcript", value.transcript},
                       {"score", value.result.score},
                       {"conflict", value.result.conflict_detected},
                       {"feedback", value.result.feedback},
                       {"question", value.result.next_question},
                       {"topic", value.result.topic},
                       {"screen_context", value.screen_context},
                       {"timestamp", value.timestamp}};
}

void to_json(nlohmann::json& out, const interview_record& value) {
  out = nlohmann::json{{"session_id", value.session_id},
                       {"started_at", value.started_at},
                       {"ended_at", value.ended_at},
                       {"auto_ended", value.auto_ended},
                       {"total_questions", value.history.size()},
                       {"screen_contexts_count", value.screen_contexts_count},
                       {"history", value.history}};
  if (value.summary.has_value()) {
    out["summary"] = *value.summary;
  }
}

}  // namespace interview_agent::model
