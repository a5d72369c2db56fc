#include "pipeline/playback_coordinator.hpp"

#include <algorithm>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace interview_agent::pipeline {

PlaybackCoordinator::PlaybackCoordinator(capabilities::Synthesizer& synthesizer, EventSink& events,
                                         const std::size_t chunk_bytes)
    : synthesizer_(synthesizer), events_(events), chunk_bytes_(std::max<std::size_t>(chunk_bytes, 1)) {
  worker_ = std::thread([this] { run(); });
}

PlaybackCoordinator::~PlaybackCoordinator() { stop(); }

bool PlaybackCoordinator::speak(const std::uint64_t utterance_id, std::string text) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (active_ && !cancelled_) {
    return false;
  }
  current_id_ = utterance_id;
  active_ = true;
  cancelled_ = false;
  if (!requests_.push(speak_request{.utterance_id = utterance_id, .text = std::move(text)})) {
    active_ = false;
    return false;
  }
  return true;
}

void PlaybackCoordinator::cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!active_ || cancelled_) {
    return;
  }
  cancelled_ = true;
  if (stream_ != nullptr) {
    stream_->cancel();
  }
}

void PlaybackCoordinator::stop() {
  cancel();
  requests_.clear();
  requests_.close();
  if (worker_.joinable()) {
    worker_.join();
  }
}

bool PlaybackCoordinator::busy() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_ && !cancelled_;
}

bool PlaybackCoordinator::live(const std::uint64_t utterance_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_ && !cancelled_ && current_id_ == utterance_id;
}

bool PlaybackCoordinator::finish(const std::uint64_t utterance_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  stream_ = nullptr;
  if (current_id_ != utterance_id) {
    return false;
  }
  const bool was_live = active_ && !cancelled_;
  active_ = false;
  return was_live;
}

void PlaybackCoordinator::run() {
  while (auto request = requests_.pop()) {
    play(*request);
  }
}

void PlaybackCoordinator::play(const speak_request& request) {
  if (!live(request.utterance_id)) {
    finish(request.utterance_id);
    return;
  }

  std::unique_ptr<capabilities::SynthesisStream> stream;
  try {
    stream = synthesizer_.synthesize(request.text);
  } catch (const std::exception& ex) {
    std::cerr << "[playback] synthesis " << request.utterance_id << " failed: " << ex.what() << '\n';
    if (finish(request.utterance_id)) {
      events_.post(synthesis_failed{.utterance_id = request.utterance_id, .message = ex.what()});
    }
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    stream_ = stream.get();
    if (cancelled_ || current_id_ != request.utterance_id) {
      stream_->cancel();
    }
  }

  std::string failure;
  try {
    while (auto chunk = stream->next_chunk()) {
      for (std::size_t offset = 0; offset < chunk->size(); offset += chunk_bytes_) {
        if (!live(request.utterance_id)) {
          break;
        }
        const std::size_t length = std::min(chunk_bytes_, chunk->size() - offset);
        auto slice = std::make_shared<const model::byte_buffer>(chunk->begin() + static_cast<std::ptrdiff_t>(offset),
                                                                chunk->begin() +
                                                                    static_cast<std::ptrdiff_t>(offset + length));
        events_.post(synthesis_chunk{.utterance_id = request.utterance_id, .audio = std::move(slice)});
      }
      if (!live(request.utterance_id)) {
        break;
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "[playback] stream " << request.utterance_id << " failed: " << ex.what() << '\n';
    failure = ex.what();
  }

  if (!finish(request.utterance_id)) {
    return;
  }
  if (failure.empty()) {
    events_.post(synthesis_finished{.utterance_id = request.utterance_id});
  } else {
    events_.post(synthesis_failed{.utterance_id = request.utterance_id, .message = std::move(failure)});
  }
}

}  // namespace interview_agent::pipeline
