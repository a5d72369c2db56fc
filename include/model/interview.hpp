#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace interview_agent::model {

enum class session_state : std::uint8_t {
  IDLE = 0,
  CONNECTING = 1,
  LISTENING = 2,
  THINKING = 3,
  SPEAKING = 4,
  STOPPED = 5,
  COMPLETE = 6,
};

enum class screen_state : std::uint8_t {
  SCREEN_OK = 0,
  SCREEN_LOST = 1,
};

enum class segment_kind : std::uint8_t {
  INTERIM = 0,
  FINAL = 1,
};

const char* to_string(session_state state) noexcept;
const char* to_string(screen_state state) noexcept;
const char* to_string(segment_kind kind) noexcept;

[[nodiscard]] inline bool is_terminal(const session_state state) noexcept {
  return state == session_state::STOPPED || state == session_state::COMPLETE;
}

using byte_buffer = std::vector<std::uint8_t>;
using shared_bytes = std::shared_ptr<const byte_buffer>;

struct audio_format {
  std::string encoding{"linear16"};
  std::uint32_t sample_rate{16000};

  bool operator==(const audio_format&) const = default;
};

struct audio_chunk {
  shared_bytes samples{};
  audio_format format{};
  std::uint64_t arrival_ns{0};
};

struct transcript_segment {
  segment_kind kind{segment_kind::INTERIM};
  std::string text{};
  std::uint64_t timestamp_ns{0};
};

struct vision_frame {
  shared_bytes image{};
  std::uint64_t timestamp_ns{0};
  // Against the last analyzed frame; 0 when nothing was analyzed yet.
  double similarity{0.0};
};

struct vision_context {
  std::string description{};
  std::uint64_t timestamp_ns{0};
};

struct evaluation {
  double score{0.0};
  std::string next_question{};
  bool conflict_detected{false};
  std::string feedback{};
  std::string topic{};
};

struct history_entry {
  std::uint64_t sequence{0};
  std::string transcript{};
  evaluation result{};
  std::string screen_context{};
  std::string timestamp{};
};

struct interview_record {
  std::string session_id{};
  std::string started_at{};
  std::string ended_at{};
  bool auto_ended{false};
  std::vector<history_entry> history{};
  std::size_t screen_contexts_count{0};
  std::optional<nlohmann::json> summary{};
};

// Characters of screen context kept with each history entry.
inline constexpr std::size_t kHistoryContextChars = 300;

// Root mean square of little-endian signed 16-bit samples, normalized to [0, 1].
double linear16_rms(const byte_buffer& samples) noexcept;

void to_json(nlohmann::json& out, const evaluation& value);
void to_json(nlohmann::json& out, const history_entry& value);
void to_json(nlohmann::json& out, const interview_record& value);

}  // namespace interview_agent::model
