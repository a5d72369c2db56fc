#include "model/messages.hpp"

namespace interview_agent::model {
namespace {

struct EventTypeName {
  const char* operator()(const status_event&) const noexcept { return "status"; }
  const char* operator()(const transcript_interim_event&) const noexcept { return "transcript_interim"; }
  const char* operator()(const transcript_final_event&) const noexcept { return "transcript_final"; }
  const char* operator()(const evaluation_event&) const noexcept { return "evaluation"; }
  const char* operator()(const audio_chunk_event&) const noexcept { return "audio_chunk"; }
  const char* operator()(const audio_end_event&) const noexcept { return "audio_end"; }
  const char* operator()(const stop_audio_event&) const noexcept { return "stop_audio"; }
  const char* operator()(const screen_update_event&) const noexcept { return "screen_update"; }
  const char* operator()(const screen_share_lost_event&) const noexcept { return "screen_share_lost"; }
  const char* operator()(const screen_share_restored_event&) const noexcept { return "screen_share_restored"; }
  const char* operator()(const interview_stopped_event&) const noexcept { return "interview_stopped"; }
  const char* operator()(const interview_complete_event&) const noexcept { return "interview_complete"; }
  const char* operator()(const error_event&) const noexcept { return "error"; }
  const char* operator()(const ai_message_event&) const noexcept { return "ai_message"; }
  const char* operator()(const keepalive_event&) const noexcept { return "keepalive"; }
};

struct MessageTypeName {
  const char* operator()(const audio_message&) const noexcept { return "audio"; }
  const char* operator()(const video_message&) const noexcept { return "video"; }
  const char* operator()(const stop_message&) const noexcept { return "stop"; }
  const char* operator()(const generate_report_message&) const noexcept { return "generate_report"; }
  const char* operator()(const screen_share_lost_message&) const noexcept { return "screen_share_lost"; }
  const char* operator()(const screen_share_restored_message&) const noexcept { return "screen_share_restored"; }
};

}  // namespace

const char* event_type(const outbound_event& event) noexcept { return std::visit(EventTypeName{}, event); }

const char* message_type(const inbound_message& message) noexcept { return std::visit(MessageTypeName{}, message); }

}  // namespace interview_agent::model
