#include "pipeline/frame_gate.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace interview_agent::pipeline {

FrameGatePolicy::FrameGatePolicy(const double change_threshold, const std::chrono::milliseconds min_interval)
    : change_threshold_(change_threshold),
      min_interval_ns_(static_cast<std::uint64_t>(
          std::chrono::duration_cast<std::chrono::nanoseconds>(min_interval).count())) {}

bool FrameGatePolicy::changed(const double similarity) const noexcept {
  return (1.0 - similarity) > change_threshold_;
}

bool FrameGatePolicy::should_analyze(const double similarity, const std::uint64_t timestamp_ns) const noexcept {
  if (!changed(similarity)) {
    return false;
  }
  if (!last_trigger_ns_.has_value()) {
    return true;
  }
  return timestamp_ns >= *last_trigger_ns_ && timestamp_ns - *last_trigger_ns_ >= min_interval_ns_;
}

void FrameGatePolicy::record_trigger(const std::uint64_t timestamp_ns) noexcept { last_trigger_ns_ = timestamp_ns; }

FrameGate::FrameGate(capabilities::VisionAnalyzer& analyzer, std::unique_ptr<FrameComparator> comparator,
                     EventSink& events, const core::VisionConfig& config)
    : analyzer_(analyzer),
      comparator_(std::move(comparator)),
      events_(events),
      policy_(config.change_threshold, config.min_interval) {
  worker_ = std::thread([this] { run(); });
}

FrameGate::~FrameGate() { stop(); }

bool FrameGate::submit(model::vision_frame frame) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (paused_ || stopping_) {
      return false;
    }
    if (slot_.has_value()) {
      frames_superseded_ += 1;
    }
    slot_ = std::move(frame);
  }
  frame_ready_.notify_one();
  return true;
}

void FrameGate::pause() {
  std::lock_guard<std::mutex> lock(mutex_);
  paused_ = true;
  slot_.reset();
}

void FrameGate::resume() {
  std::lock_guard<std::mutex> lock(mutex_);
  paused_ = false;
}

void FrameGate::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    slot_.reset();
  }
  frame_ready_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

bool FrameGate::paused() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return paused_;
}

void FrameGate::run() {
  while (true) {
    model::vision_frame frame;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      frame_ready_.wait(lock, [this] { return stopping_ || slot_.has_value(); });
      if (stopping_) {
        return;
      }
      frame = std::move(*slot_);
      slot_.reset();
    }
    evaluate(std::move(frame));
  }
}

void FrameGate::evaluate(model::vision_frame frame) {
  const auto similarity = comparator_->similarity(last_analyzed_, frame.image);
  if (!similarity.has_value()) {
    // Never analyzed and never the reference.
    frames_undecodable_ += 1;
    std::cerr << "[frame-gate] skipping undecodable frame at " << frame.timestamp_ns << " ns\n";
    return;
  }
  frame.similarity = last_analyzed_ == nullptr ? 0.0 : *similarity;
  if (!policy_.should_analyze(frame.similarity, frame.timestamp_ns)) {
    return;
  }

  policy_.record_trigger(frame.timestamp_ns);
  last_analyzed_ = frame.image;
  analyses_triggered_ += 1;
  events_.post(vision_analysis_started{.frame_timestamp_ns = frame.timestamp_ns});

  try {
    const std::string description = analyzer_.analyze(frame);
    events_.post(vision_analyzed{.context = model::vision_context{
                                     .description = description,
                                     .timestamp_ns = frame.timestamp_ns,
                                 }});
  } catch (const std::exception& ex) {
    std::cerr << "[frame-gate] analysis failed: " << ex.what() << '\n';
    events_.post(vision_analysis_failed{.message = ex.what()});
  }
}

}  // namespace interview_agent::pipeline
