#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "model/interview.hpp"

namespace interview_agent::model {

// Client -> server.

struct audio_message {
  shared_bytes data{};
  audio_format format{};
  std::uint64_t arrival_ns{0};
};

struct video_message {
  shared_bytes data{};
  std::uint64_t arrival_ns{0};
};

struct stop_message {};
struct generate_report_message {};
struct screen_share_lost_message {};
struct screen_share_restored_message {};

using inbound_message = std::variant<audio_message, video_message, stop_message, generate_report_message,
                                     screen_share_lost_message, screen_share_restored_message>;

// Server -> client.

struct status_event {
  session_state state{session_state::IDLE};
};

struct transcript_interim_event {
  std::string text{};
};

struct transcript_final_event {
  std::string text{};
};

struct evaluation_event {
  evaluation result{};
};

struct audio_chunk_event {
  shared_bytes audio{};
};

struct audio_end_event {};
struct stop_audio_event {};

struct screen_update_event {
  std::string context{};
};

struct screen_share_lost_event {
  double grace_period_s{0.0};
};

struct screen_share_restored_event {};

struct interview_stopped_event {
  std::string session_id{};
  std::size_t total_questions{0};
  bool has_content{false};
  bool auto_ended{false};
};

struct interview_complete_event {
  nlohmann::json summary{};
  nlohmann::json history{};
  std::string session_id{};
};

struct error_event {
  std::string message{};
};

struct ai_message_event {
  std::string text{};
};

struct keepalive_event {};

using outbound_event =
    std::variant<status_event, transcript_interim_event, transcript_final_event, evaluation_event, audio_chunk_event,
                 audio_end_event, stop_audio_event, screen_update_event, screen_share_lost_event,
                 screen_share_restored_event, interview_stopped_event, interview_complete_event, error_event,
                 ai_message_event, keepalive_event>;

// Wire name of the event ("status", "audio_chunk", ...).
const char* event_type(const outbound_event& event) noexcept;
const char* message_type(const inbound_message& message) noexcept;

// Characters of a vision description carried by screen_update.
inline constexpr std::size_t kScreenUpdatePreviewChars = 200;

}  // namespace interview_agent::model
