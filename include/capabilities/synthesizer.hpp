#pragma once

#include <memory>
#include <optional>
#include <string>

#include "core/config.hpp"
#include "model/interview.hpp"

namespace interview_agent::capabilities {

class SynthesisStream {
 public:
  // Blocks until audio is available; nullopt once the utterance is drained
  // or cancelled. Throws model::PlaybackError.
  virtual std::optional<model::byte_buffer> next_chunk() = 0;
  // Safe to call from another thread while next_chunk() blocks.
  virtual void cancel() noexcept = 0;
  virtual ~SynthesisStream() = default;
};

class Synthesizer {
 public:
  // Throws model::PlaybackError.
  virtual std::unique_ptr<SynthesisStream> synthesize(const std::string& text) = 0;
  virtual ~Synthesizer() = default;
};

// Runs playback.command per utterance: text on stdin, audio bytes on stdout.
std::unique_ptr<Synthesizer> make_process_synthesizer(const core::PlaybackConfig& config);
// Every utterance drains immediately without audio.
std::unique_ptr<Synthesizer> make_silent_synthesizer();

}  // namespace interview_agent::capabilities
