#pragma once

#include <memory>
#include <optional>

#include "model/interview.hpp"

namespace interview_agent::pipeline {

class FrameComparator {
 public:
  // 1.0 for identical frames, 0.0 without a reference. std::nullopt when the
  // candidate cannot be decoded.
  virtual std::optional<double> similarity(const model::shared_bytes& reference,
                                           const model::shared_bytes& candidate) = 0;
  virtual ~FrameComparator() = default;
};

// Mean SSIM of grayscale 320x180 downscales. Keeps the last decoded candidate
// so a frame that becomes the reference is not decoded twice.
std::unique_ptr<FrameComparator> make_ssim_comparator();

}  // namespace interview_agent::pipeline
