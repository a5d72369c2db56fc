#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/interview.hpp"

namespace interview_agent::session {

struct InFlight {
  bool transcription{false};
  bool vision{false};
  bool generation{false};
};

struct GraceTimer {
  std::uint64_t id{0};
  std::chrono::steady_clock::time_point deadline{};
};

// Per-connection state. Only the session actor thread reads or writes it.
struct Session {
  std::string id{};
  model::session_state state{model::session_state::IDLE};
  model::screen_state screen{model::screen_state::SCREEN_OK};

  std::vector<model::transcript_segment> transcript{};
  std::optional<model::transcript_segment> interim{};
  std::optional<model::vision_context> vision{};
  std::vector<model::vision_context> vision_log{};
  std::string last_question{};

  std::optional<GraceTimer> grace_timer{};
  std::uint64_t next_timer_id{1};
  InFlight in_flight{};

  std::vector<model::history_entry> history{};
  std::string started_at{};
  std::string ended_at{};
  bool auto_ended{false};

  std::uint64_t next_sequence{1};
  std::uint64_t pending_evaluations{0};
  // 0 while nothing is being spoken.
  std::uint64_t active_utterance{0};
  std::uint64_t next_utterance{1};
  bool report_requested{false};
  bool report_running{false};
  std::optional<nlohmann::json> summary{};
};

model::interview_record make_record(const Session& session);

}  // namespace interview_agent::session
