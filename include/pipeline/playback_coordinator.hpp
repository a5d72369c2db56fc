#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include "capabilities/synthesizer.hpp"
#include "core/mailbox.hpp"
#include "pipeline/session_events.hpp"

namespace interview_agent::pipeline {

// Streams one utterance at a time from the synthesizer to the session.
// After cancel() no further chunk of that utterance is posted.
class PlaybackCoordinator {
 public:
  PlaybackCoordinator(capabilities::Synthesizer& synthesizer, EventSink& events, std::size_t chunk_bytes);
  ~PlaybackCoordinator();

  PlaybackCoordinator(const PlaybackCoordinator&) = delete;
  PlaybackCoordinator& operator=(const PlaybackCoordinator&) = delete;

  // Rejected while a previous utterance is still live.
  bool speak(std::uint64_t utterance_id, std::string text);
  void cancel();
  void stop();

  [[nodiscard]] bool busy() const;

 private:
  struct speak_request {
    std::uint64_t utterance_id{0};
    std::string text{};
  };

  void run();
  void play(const speak_request& request);
  [[nodiscard]] bool live(std::uint64_t utterance_id) const;
  // Releases the coordinator for the next utterance; true when the utterance
  // was still live and its completion should be reported.
  bool finish(std::uint64_t utterance_id);

  capabilities::Synthesizer& synthesizer_;
  EventSink& events_;
  std::size_t chunk_bytes_;

  mutable std::mutex mutex_;
  std::uint64_t current_id_{0};
  bool active_{false};
  bool cancelled_{false};
  capabilities::SynthesisStream* stream_{nullptr};

  core::Mailbox<speak_request> requests_;
  std::thread worker_;
};

}  // namespace interview_agent::pipeline
