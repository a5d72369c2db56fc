#include "pipeline/transcript_stream.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>
#include <utility>

#include "model/errors.hpp"

namespace interview_agent::pipeline {
namespace {

bool is_blank(const std::string& text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::size_t chunk_size(const model::audio_chunk& chunk) {
  return chunk.samples != nullptr ? chunk.samples->size() : 0;
}

}  // namespace

TranscriptStream::TranscriptStream(capabilities::Transcriber& transcriber, EventSink& events,
                                   core::TranscriptionConfig config)
    : transcriber_(transcriber), events_(events), config_(std::move(config)) {
  writer_ = std::thread([this] { writer_loop(); });
}

TranscriptStream::~TranscriptStream() { stop(); }

bool TranscriptStream::submit(model::audio_chunk chunk) {
  if (chunk_size(chunk) == 0) {
    return false;
  }
  return inbox_.push(std::move(chunk));
}

void TranscriptStream::stop() {
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stopping_ = true;
  }
  stop_cv_.notify_all();
  inbox_.clear();
  inbox_.close();
  if (writer_.joinable()) {
    writer_.join();
  }
}

void TranscriptStream::writer_loop() {
  while (auto chunk = inbox_.pop()) {
    handle_chunk(std::move(*chunk));
  }
  close_stream();
}

void TranscriptStream::handle_chunk(model::audio_chunk chunk) {
  const model::audio_format format = chunk.format;
  buffer_chunk(std::move(chunk));

  if (stream_failed_.load()) {
    std::cerr << "[transcript] transcriber stream ended; reconnecting\n";
    close_stream();
  }

  if (stream_ == nullptr) {
    if (degraded_.load() && std::chrono::steady_clock::now() < next_attempt_) {
      return;
    }
    if (!connect_with_backoff(format)) {
      mark_degraded("Transcription unavailable; audio is buffered and will be replayed");
      return;
    }
  }

  if (!flush_pending()) {
    mark_degraded("Transcription unavailable; audio is buffered and will be replayed");
  }
}

void TranscriptStream::buffer_chunk(model::audio_chunk chunk) {
  buffered_bytes_ += chunk_size(chunk);
  pending_.push_back(std::move(chunk));

  while (buffered_bytes_.load() > config_.max_buffered_bytes && pending_.size() > 1) {
    const std::size_t dropped = chunk_size(pending_.front());
    pending_.pop_front();
    buffered_bytes_ -= dropped;
    dropped_bytes_ += dropped;
  }
}

bool TranscriptStream::flush_pending() {
  const bool recovering = degraded_.load();
  const std::size_t replay_bytes = buffered_bytes_.load();

  while (!pending_.empty()) {
    try {
      stream_->send(pending_.front());
    } catch (const model::TranscriptionError& ex) {
      std::cerr << "[transcript] send failed: " << ex.what() << '\n';
      close_stream();
      if (!connect_with_backoff(pending_.front().format)) {
        return false;
      }
      continue;
    }
    buffered_bytes_ -= chunk_size(pending_.front());
    pending_.pop_front();
  }

  if (recovering) {
    degraded_.store(false);
    std::cerr << "[transcript] transcriber recovered; replayed " << replay_bytes << " bytes\n";
    events_.post(transcription_recovered{.replayed_bytes = replay_bytes});
  }
  return true;
}

bool TranscriptStream::connect_with_backoff(const model::audio_format& format) {
  std::chrono::milliseconds delay = config_.backoff_initial;
  for (std::uint32_t attempt = 1; attempt <= config_.max_reconnect_attempts; ++attempt) {
    try {
      stream_ = transcriber_.open(format);
      stream_failed_.store(false);
      closing_stream_.store(false);
      capabilities::TranscriberStream& opened = *stream_;
      reader_ = std::thread([this, &opened] { reader_loop(opened); });
      return true;
    } catch (const std::exception& ex) {
      std::cerr << "[transcript] connect attempt " << attempt << '/' << config_.max_reconnect_attempts
                << " failed: " << ex.what() << '\n';
    }

    if (attempt == config_.max_reconnect_attempts || !wait_backoff(delay)) {
      break;
    }
    delay *= 2;
  }
  return false;
}

void TranscriptStream::close_stream() {
  if (stream_ == nullptr) {
    return;
  }
  closing_stream_.store(true);
  stream_->close();
  if (reader_.joinable()) {
    reader_.join();
  }
  stream_.reset();
  stream_failed_.store(false);
}

void TranscriptStream::mark_degraded(const std::string& reason) {
  next_attempt_ = std::chrono::steady_clock::now() + config_.retry_cooldown;
  if (degraded_.exchange(true)) {
    return;
  }
  std::cerr << "[transcript] " << reason << " (" << buffered_bytes_.load() << " bytes held)\n";
  events_.post(transcription_failed{.message = reason});
}

bool TranscriptStream::wait_backoff(const std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(stop_mutex_);
  return !stop_cv_.wait_for(lock, delay, [this] { return stopping_; });
}

void TranscriptStream::reader_loop(capabilities::TranscriberStream& stream) {
  try {
    while (auto segment = stream.read()) {
      if (is_blank(segment->text)) {
        continue;
      }
      events_.post(transcript_received{.segment = std::move(*segment)});
    }
  } catch (const std::exception& ex) {
    std::cerr << "[transcript] read failed: " << ex.what() << '\n';
  }

  if (!closing_stream_.load()) {
    stream_failed_.store(true);
  }
}

}  // namespace interview_agent::pipeline
