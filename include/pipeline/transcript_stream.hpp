#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

#include "capabilities/transcriber.hpp"
#include "core/config.hpp"
#include "core/mailbox.hpp"
#include "model/interview.hpp"
#include "pipeline/session_events.hpp"

namespace interview_agent::pipeline {

// Forwards audio to one persistent transcriber stream and posts the segments
// it produces. A writer thread owns the stream; a reader thread drains it.
// When the transcriber cannot be reached, audio is held in a bounded buffer
// and replayed once a later attempt succeeds.
class TranscriptStream {
 public:
  TranscriptStream(capabilities::Transcriber& transcriber, EventSink& events, core::TranscriptionConfig config);
  ~TranscriptStream();

  TranscriptStream(const TranscriptStream&) = delete;
  TranscriptStream& operator=(const TranscriptStream&) = delete;

  bool submit(model::audio_chunk chunk);
  void stop();

  [[nodiscard]] std::size_t buffered_bytes() const { return buffered_bytes_.load(); }
  [[nodiscard]] std::uint64_t dropped_bytes() const { return dropped_bytes_.load(); }
  [[nodiscard]] bool degraded() const { return degraded_.load(); }

 private:
  void writer_loop();
  void reader_loop(capabilities::TranscriberStream& stream);
  void handle_chunk(model::audio_chunk chunk);
  void buffer_chunk(model::audio_chunk chunk);
  bool flush_pending();
  bool connect_with_backoff(const model::audio_format& format);
  void close_stream();
  void mark_degraded(const std::string& reason);
  bool wait_backoff(std::chrono::milliseconds delay);

  capabilities::Transcriber& transcriber_;
  EventSink& events_;
  core::TranscriptionConfig config_;

  core::Mailbox<model::audio_chunk> inbox_;
  std::deque<model::audio_chunk> pending_;
  std::atomic<std::size_t> buffered_bytes_{0};
  std::atomic<std::uint64_t> dropped_bytes_{0};
  std::atomic<bool> degraded_{false};
  std::chrono::steady_clock::time_point next_attempt_{};

  std::unique_ptr<capabilities::TranscriberStream> stream_;
  std::thread reader_;
  std::atomic<bool> closing_stream_{false};
  std::atomic<bool> stream_failed_{false};

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  bool stopping_{false};

  std::thread writer_;
};

}  // namespace interview_agent::pipeline
