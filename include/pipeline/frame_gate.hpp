#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "capabilities/vision_analyzer.hpp"
#include "core/config.hpp"
#include "model/interview.hpp"
#include "pipeline/frame_similarity.hpp"
#include "pipeline/session_events.hpp"

namespace interview_agent::pipeline {

// Change threshold plus minimum spacing between triggered analyses,
// measured on frame timestamps.
class FrameGatePolicy {
 public:
  FrameGatePolicy(double change_threshold, std::chrono::milliseconds min_interval);

  [[nodiscard]] bool changed(double similarity) const noexcept;
  [[nodiscard]] bool should_analyze(double similarity, std::uint64_t timestamp_ns) const noexcept;
  void record_trigger(std::uint64_t timestamp_ns) noexcept;

 private:
  double change_threshold_;
  std::uint64_t min_interval_ns_;
  std::optional<std::uint64_t> last_trigger_ns_{};
};

// Decides which frames are analyzed. Arriving frames overwrite a single slot,
// so while an analysis is in flight only the newest frame is considered when
// it finishes.
class FrameGate {
 public:
  FrameGate(capabilities::VisionAnalyzer& analyzer, std::unique_ptr<FrameComparator> comparator, EventSink& events,
            const core::VisionConfig& config);
  ~FrameGate();

  FrameGate(const FrameGate&) = delete;
  FrameGate& operator=(const FrameGate&) = delete;

  // Returns false when the frame was dropped because the gate is paused or stopped.
  bool submit(model::vision_frame frame);
  void pause();
  void resume();
  void stop();

  [[nodiscard]] bool paused() const;
  [[nodiscard]] std::uint64_t analyses_triggered() const { return analyses_triggered_.load(); }
  [[nodiscard]] std::uint64_t frames_superseded() const { return frames_superseded_.load(); }
  [[nodiscard]] std::uint64_t frames_undecodable() const { return frames_undecodable_.load(); }

 private:
  void run();
  void evaluate(model::vision_frame frame);

  capabilities::VisionAnalyzer& analyzer_;
  std::unique_ptr<FrameComparator> comparator_;
  EventSink& events_;
  FrameGatePolicy policy_;

  mutable std::mutex mutex_;
  std::condition_variable frame_ready_;
  std::optional<model::vision_frame> slot_{};
  bool paused_{false};
  bool stopping_{false};

  // Worker-thread state.
  model::shared_bytes last_analyzed_{};

  std::atomic<std::uint64_t> analyses_triggered_{0};
  std::atomic<std::uint64_t> frames_superseded_{0};
  std::atomic<std::uint64_t> frames_undecodable_{0};
  std::thread worker_;
};

}  // namespace interview_agent::pipeline
