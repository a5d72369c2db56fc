#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "model/interview.hpp"

namespace interview_agent::pipeline {

// Results posted by component workers to the session actor.

struct transcript_received {
  model::transcript_segment segment{};
};

struct transcription_failed {
  std::string message{};
};

struct transcription_recovered {
  std::size_t replayed_bytes{0};
};

struct vision_analysis_started {
  std::uint64_t frame_timestamp_ns{0};
};

struct vision_analyzed {
  model::vision_context context{};
};

struct vision_analysis_failed {
  std::string message{};
};

struct evaluation_ready {
  std::uint64_t sequence{0};
  std::string answer{};
  model::evaluation result{};
  // Set when the generator failed and result is the fallback.
  std::string error{};
};

struct report_ready {
  nlohmann::json summary{};
  std::string error{};
};

struct synthesis_chunk {
  std::uint64_t utterance_id{0};
  model::shared_bytes audio{};
};

struct synthesis_finished {
  std::uint64_t utterance_id{0};
};

struct synthesis_failed {
  std::uint64_t utterance_id{0};
  std::string message{};
};

using component_event =
    std::variant<transcript_received, transcription_failed, transcription_recovered, vision_analysis_started,
                 vision_analyzed, vision_analysis_failed, evaluation_ready, report_ready, synthesis_chunk, synthesis_finished,
                 synthesis_failed>;

class EventSink {
 public:
  // Returns false once the receiver has shut down.
  virtual bool post(component_event event) = 0;
  virtual ~EventSink() = default;
};

}  // namespace interview_agent::pipeline
