#pragma once

#include <memory>
#include <optional>

#include "core/config.hpp"
#include "model/interview.hpp"

namespace interview_agent::capabilities {

// One persistent recognition stream. send() and read() are called from
// different threads; close() unblocks a pending read().
class TranscriberStream {
 public:
  virtual void send(const model::audio_chunk& chunk) = 0;
  // Blocks until the next segment; nullopt at end of stream.
  virtual std::optional<model::transcript_segment> read() = 0;
  virtual void close() noexcept = 0;
  virtual ~TranscriberStream() = default;
};

class Transcriber {
 public:
  // Throws model::TranscriptionError when the stream cannot be opened.
  virtual std::unique_ptr<TranscriberStream> open(const model::audio_format& format) = 0;
  virtual ~Transcriber() = default;
};

// Runs transcription.command per stream: PCM on stdin, JSON lines
// {"type":"interim"|"final","text":...} on stdout.
std::unique_ptr<Transcriber> make_process_transcriber(const core::TranscriptionConfig& config);
// Accepts audio and never produces segments.
std::unique_ptr<Transcriber> make_none_transcriber();

}  // namespace interview_agent::capabilities
